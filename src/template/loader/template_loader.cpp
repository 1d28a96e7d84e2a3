#include "template_loader.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../extract/query/css_selector.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Gleaner {
namespace Templates {

using Core::TemplateError;
using json = nlohmann::ordered_json;

namespace {

void check_selector(const std::string& where, const std::string& selector) {
    if (Utils::Text::trim(selector).empty())
        throw TemplateError(where + ": empty selector");
    try {
        Extract::Query::SelectorParser::parse(selector);
    } catch (const Extract::Query::SelectorSyntaxError& e) {
        throw TemplateError(where + ": " + e.what());
    }
}

void check_rules(const std::string& where, const FieldSpec& field) {
    const auto& type = field.value_type;
    if (!type.empty() && type != "string" && type != "number" && type != "list" && type != "dict")
        throw TemplateError(where + ": unknown value type '" + type + "'");
    if (field.pattern.empty())
        return;
    try {
        std::regex check(field.pattern);
    } catch (const std::regex_error& e) {
        throw TemplateError(where + ": bad pattern '" + field.pattern + "': " + e.what());
    }
}

std::vector<std::string> string_list(const json& node, const std::string& where) {
    std::vector<std::string> out;
    if (node.is_null())
        return out;
    if (node.is_string()) {
        out.push_back(node.get<std::string>());
        return out;
    }
    if (!node.is_array())
        throw TemplateError(where + ": expected a string or an array of strings");
    for (const auto& item : node) {
        if (!item.is_string())
            throw TemplateError(where + ": expected a string or an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

FieldSpec parse_field(const json& node, const std::string& where) {
    if (!node.is_object())
        throw TemplateError(where + ": field must be an object");

    FieldSpec field;
    field.name        = node.value("name", "");
    field.selector    = node.value("selector", "");
    field.fallbacks   = string_list(node.value("fallbacks", json()), where + ".fallbacks");
    field.kind        = TemplateLoader::parse_kind(node.value("kind", "text"));
    field.attribute   = node.value("attribute", "");
    field.required    = node.value("required", false);
    field.allow_empty = node.value("allow_empty", false);
    field.non_empty   = node.value("non_empty", false);
    field.value_type  = node.value("value_type", "");
    field.pattern     = node.value("pattern", "");

    if (node.contains("directives")) {
        const auto& directives = node.at("directives");
        if (!directives.is_array())
            throw TemplateError(where + ".directives: expected an array");
        for (const auto& d : directives)
            field.directives.push_back(TemplateLoader::parse_directive(d));
    }
    return field;
}

// {"selectors": {"title": "h1"}, "fallback_selectors": {"title": [".t"]}}
std::vector<FieldSpec> parse_selector_map(const json& doc) {
    std::vector<FieldSpec> fields;
    const auto&            selectors = doc.at("selectors");
    if (!selectors.is_object())
        throw TemplateError("selectors: expected an object");

    json fallbacks = doc.value("fallback_selectors", json::object());
    json rules     = doc.value("validation_rules", json::object());
    if (!rules.is_object())
        throw TemplateError("validation_rules: expected an object");
    for (const auto& [key, value] : rules.items()) {
        if (key != "required_fields" && key != "field_types" && key != "field_patterns")
            throw TemplateError("validation_rules: unsupported rule '" + key + "'");
    }
    std::vector<std::string> required =
        string_list(rules.value("required_fields", json()), "validation_rules.required_fields");
    json types    = rules.value("field_types", json::object());
    json patterns = rules.value("field_patterns", json::object());

    for (const auto& [name, config] : selectors.items()) {
        FieldSpec field;
        if (config.is_string()) {
            field.name     = name;
            field.selector = config.get<std::string>();
        }
        else {
            json copy = config;
            copy["name"] = name;
            field        = parse_field(copy, "selectors." + name);
        }
        if (fallbacks.contains(name))
            field.fallbacks = string_list(fallbacks.at(name), "fallback_selectors." + name);
        if (std::find(required.begin(), required.end(), name) != required.end())
            field.required = true;
        if (types.contains(name))
            field.value_type = types.at(name).get<std::string>();
        if (patterns.contains(name))
            field.pattern = patterns.at(name).get<std::string>();
        fields.push_back(std::move(field));
    }

    for (const auto* section : {&types, &patterns}) {
        for (const auto& [name, value] : section->items()) {
            if (!selectors.contains(name))
                throw TemplateError("validation_rules: rule for unknown field '" + name + "'");
        }
    }

    // [{"type": "strip", "field": "title"}]
    for (const auto& rule : doc.value("post_processing", json::array())) {
        std::string target = rule.value("field", "");
        for (auto& field : fields) {
            if (field.name == target)
                field.directives.push_back(TemplateLoader::parse_directive(rule));
        }
    }
    return fields;
}

PaginationSpec parse_pagination(const json& node) {
    PaginationSpec spec;
    if (!node.is_object())
        throw TemplateError("pagination: expected an object");

    spec.next_selector = node.value("next_selector", "");
    spec.url_pattern   = node.value("url_pattern", "");
    std::string fallback = spec.next_selector.empty()
                               ? (spec.url_pattern.empty() ? "none" : "page_parameter")
                               : "next_link";
    spec.strategy             = TemplateLoader::parse_strategy(node.value("strategy", fallback));
    spec.start_page           = node.value("start_page", 1);
    spec.max_pages            = node.value("max_pages", spec.max_pages);
    spec.stop_selector        = node.value("stop_selector", "");
    spec.duplicate_window     = node.value("duplicate_window", spec.duplicate_window);
    spec.similarity_threshold = node.value("similarity_threshold", spec.similarity_threshold);

    if (spec.max_pages < 0)
        throw TemplateError("pagination.max_pages: must be >= 0");
    if (spec.similarity_threshold <= 0.0 || spec.similarity_threshold > 1.0)
        throw TemplateError("pagination.similarity_threshold: must be in (0, 1]");
    if (spec.strategy == PaginationStrategy::NextLink)
        check_selector("pagination.next_selector", spec.next_selector);
    if (spec.strategy == PaginationStrategy::PageParameter
        && spec.url_pattern.find("{page}") == std::string::npos)
        throw TemplateError("pagination.url_pattern: missing {page} placeholder");
    if (!spec.stop_selector.empty())
        check_selector("pagination.stop_selector", spec.stop_selector);
    return spec;
}

Network::Http::FetchProfile parse_fetch(const json& node) {
    Network::Http::FetchProfile profile;
    if (!node.is_object())
        throw TemplateError("fetch: expected an object");

    profile.stealth    = TemplateLoader::parse_stealth(node.value("stealth", "basic"));
    profile.min_delay  = std::chrono::milliseconds(node.value("min_delay_ms", 0));
    profile.max_delay  = std::chrono::milliseconds(node.value("max_delay_ms", 0));
    profile.user_agent = node.value("user_agent", "");
    profile.timeout    = std::chrono::milliseconds(node.value("timeout_ms", 30000));
    profile.render_js  = node.value("render_js", false);
    if (node.contains("headers")) {
        for (const auto& [name, value] : node.at("headers").items())
            profile.headers[name] = value.get<std::string>();
    }

    if (profile.min_delay.count() < 0 || profile.max_delay < profile.min_delay)
        throw TemplateError("fetch: invalid delay range");
    if (profile.timeout.count() <= 0)
        throw TemplateError("fetch.timeout_ms: must be positive");
    return profile;
}

}  // namespace

FieldKind TemplateLoader::parse_kind(const std::string& name) {
    std::string n = Utils::Text::to_lower(name);
    if (n == "text")
        return FieldKind::Text;
    if (n == "attribute" || n == "attr")
        return FieldKind::Attribute;
    if (n == "collection" || n == "list")
        return FieldKind::Collection;
    if (n == "html")
        return FieldKind::Html;
    throw TemplateError("Unknown field kind: " + name);
}

PaginationStrategy TemplateLoader::parse_strategy(const std::string& name) {
    std::string n = Utils::Text::to_lower(name);
    if (n == "none")
        return PaginationStrategy::None;
    if (n == "next_link" || n == "next")
        return PaginationStrategy::NextLink;
    if (n == "page_parameter" || n == "page")
        return PaginationStrategy::PageParameter;
    throw TemplateError("Unknown pagination strategy: " + name);
}

Network::Http::StealthLevel TemplateLoader::parse_stealth(const std::string& name) {
    std::string n = Utils::Text::to_lower(name);
    if (n == "none" || n == "off")
        return Network::Http::StealthLevel::None;
    if (n == "basic")
        return Network::Http::StealthLevel::Basic;
    if (n == "high")
        return Network::Http::StealthLevel::High;
    throw TemplateError("Unknown stealth level: " + name);
}

Directive TemplateLoader::parse_directive(const json& node) {
    std::string name;
    if (node.is_string())
        name = node.get<std::string>();
    else if (node.is_object())
        name = node.value("type", "");
    else
        throw TemplateError("Directive must be a string or an object");

    Directive d;
    std::string n = Utils::Text::to_lower(name);
    if (n == "trim" || n == "strip")
        d.type = DirectiveType::Trim;
    else if (n == "collapse" || n == "collapse_whitespace")
        d.type = DirectiveType::Collapse;
    else if (n == "lower" || n == "lowercase")
        d.type = DirectiveType::Lower;
    else if (n == "upper" || n == "uppercase")
        d.type = DirectiveType::Upper;
    else if (n == "number" || n == "extract_number")
        d.type = DirectiveType::Number;
    else if (n == "normalize_url" || n == "url")
        d.type = DirectiveType::NormalizeUrl;
    else if (n == "replace")
        d.type = DirectiveType::Replace;
    else if (n == "split")
        d.type = DirectiveType::Split;
    else if (n == "join")
        d.type = DirectiveType::Join;
    else
        throw TemplateError("Unknown directive: '" + name + "'");

    if (node.is_object()) {
        d.pattern     = node.value("pattern", "");
        d.replacement = node.value("replacement", "");
        d.separator   = node.value("separator", "");
    }

    if (d.type == DirectiveType::Replace) {
        if (d.pattern.empty())
            throw TemplateError("Directive replace: missing pattern");
        try {
            std::regex check(d.pattern);
        } catch (const std::regex_error& e) {
            throw TemplateError("Directive replace: bad pattern '" + d.pattern + "': " + e.what());
        }
    }
    return d;
}

Template TemplateLoader::from_json(const json& doc) {
    if (!doc.is_object())
        throw TemplateError("Template must be a JSON object");

    try {
        Template tpl;
        tpl.name = doc.value("name", "unnamed");

        if (doc.contains("fields")) {
            const auto& fields = doc.at("fields");
            if (!fields.is_array())
                throw TemplateError("fields: expected an array");
            for (size_t i = 0; i < fields.size(); ++i)
                tpl.fields.push_back(parse_field(fields[i], "fields[" + std::to_string(i) + "]"));
        }
        else if (doc.contains("selectors")) {
            tpl.fields = parse_selector_map(doc);
        }

        if (tpl.fields.empty())
            throw TemplateError("Template '" + tpl.name + "' has no fields");

        for (const auto& field : tpl.fields) {
            std::string where = "field '" + field.name + "'";
            if (field.name.empty())
                throw TemplateError("Every field needs a name");
            if (field.kind == FieldKind::Attribute && field.attribute.empty()
                && field.selector.find("::attr(") == std::string::npos)
                throw TemplateError(where + ": attribute kind needs 'attribute' or ::attr()");
            check_selector(where, field.selector);
            for (const auto& fallback : field.fallbacks)
                check_selector(where + " fallback", fallback);
            check_rules(where, field);
        }

        if (doc.contains("pagination"))
            tpl.pagination = parse_pagination(doc.at("pagination"));
        if (doc.contains("fetch"))
            tpl.profile = parse_fetch(doc.at("fetch"));

        if (doc.contains("discovery")) {
            const auto&   node = doc.at("discovery");
            DiscoverySpec discovery;
            discovery.link_selector = node.value("link_selector", "");
            discovery.max_seeds     = node.value("max_seeds", static_cast<size_t>(0));
            discovery.same_domain   = node.value("same_domain", true);
            check_selector("discovery.link_selector", discovery.link_selector);
            tpl.discovery = discovery;
        }

        tpl.abort_on_required_failure = doc.value("abort_on_required_failure", false);
        return tpl;
    } catch (const json::exception& e) {
        throw TemplateError(std::string("Malformed template: ") + e.what());
    }
}

Template TemplateLoader::from_string(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw TemplateError(std::string("Template is not valid JSON: ") + e.what());
    }
    return from_json(doc);
}

std::shared_ptr<const Template> TemplateLoader::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw TemplateError("Cannot open template file: " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto tpl = std::make_shared<const Template>(from_string(buffer.str()));
    Core::Logger::debug("Loaded template '" + tpl->name + "' with " + std::to_string(tpl->fields.size())
                        + " field(s) from " + path);
    return tpl;
}

}  // namespace Templates
}  // namespace Gleaner

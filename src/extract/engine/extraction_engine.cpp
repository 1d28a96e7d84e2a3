#include "extraction_engine.hpp"
#include <regex>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../processing/post_processor.hpp"
#include "../query/css_selector.hpp"

namespace Gleaner {
namespace Extract {
namespace Engine {

using Core::Logger;
using Processing::PostProcessor;
using Templates::FieldKind;
using Templates::FieldSpec;

namespace {

struct FieldMatch {
    bool        matched = false;
    Record      value;
    std::string selector;
    std::string error;
};

// Empty when @p value satisfies the field's type and pattern rules.
std::string rule_violation(const FieldSpec& field, const Record& value) {
    const auto& type = field.value_type;
    if ((type == "string" && !value.is_string()) || (type == "number" && !value.is_number())
        || (type == "list" && !value.is_array()) || (type == "dict" && !value.is_object()))
        return "expected " + type + ", got " + value.type_name();

    if (field.pattern.empty() || PostProcessor::is_empty(value))
        return "";
    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    if (!std::regex_search(text, std::regex(field.pattern), std::regex_constants::match_continuous))
        return "value does not match pattern '" + field.pattern + "'";
    return "";
}

FieldMatch match_field(const Query::DocumentQuery& document,
                       const FieldSpec&            field,
                       const std::string&          base_url) {
    FieldMatch result;

    std::vector<std::string> candidates;
    candidates.push_back(field.selector);
    candidates.insert(candidates.end(), field.fallbacks.begin(), field.fallbacks.end());

    for (const auto& selector : candidates) {
        std::vector<std::string> values;
        try {
            values = document.select(ExtractionEngine::effective_selector(field, selector));
        } catch (const Query::SelectorSyntaxError& e) {
            result.error = e.what();
            continue;
        }
        if (values.empty())
            continue;

        Record value;
        if (field.kind == FieldKind::Collection) {
            value = Record::array();
            for (auto& v : values)
                value.push_back(Utils::Text::trim(v));
        }
        else {
            value = field.kind == FieldKind::Html ? values.front() : Utils::Text::trim(values.front());
        }

        try {
            value = PostProcessor::apply(std::move(value), field.directives, base_url, field.name);
        } catch (const Core::ExtractionFieldError& e) {
            result.error = e.what();
            continue;
        }

        bool empty = PostProcessor::is_empty(value);
        if (field.kind == FieldKind::Collection) {
            if (empty && field.non_empty)
                continue;
        }
        else if (empty && !field.allow_empty) {
            continue;
        }

        std::string violation = rule_violation(field, value);
        if (!violation.empty()) {
            result.error = violation;
            continue;
        }

        result.matched  = true;
        result.value    = std::move(value);
        result.selector = selector;
        return result;
    }
    return result;
}

}  // namespace

std::string ExtractionEngine::effective_selector(const FieldSpec&   field,
                                                 const std::string& selector) {
    if (selector.find("::") != std::string::npos)
        return selector;
    if (field.kind == FieldKind::Attribute && !field.attribute.empty())
        return selector + "::attr(" + field.attribute + ")";
    if (field.kind == FieldKind::Html)
        return selector + "::html";
    return selector;
}

ExtractionResult ExtractionEngine::extract(const Query::DocumentQuery& document,
                                           const Templates::Template&  tpl,
                                           const std::string&          base_url) const {
    ExtractionResult result;
    size_t           required_total = 0, required_matched = 0;

    for (const auto& field : tpl.fields) {
        if (field.required)
            required_total++;

        FieldMatch match = match_field(document, field, base_url);
        if (match.matched) {
            if (field.required)
                required_matched++;
            if (match.selector != field.selector)
                Logger::debug("Field '" + field.name + "' matched by fallback " + match.selector);
            result.record[field.name]         = std::move(match.value);
            result.selectors_used[field.name] = match.selector;
            continue;
        }

        // Zero matches is a valid collection unless it must be non-empty.
        if (field.kind == FieldKind::Collection && !field.non_empty && match.error.empty()) {
            if (field.required)
                required_matched++;
            result.record[field.name] = Record::array();
            continue;
        }

        result.record[field.name] = nullptr;
        if (field.required || !match.error.empty()) {
            std::string message = match.error.empty() ? "no selector matched" : match.error;
            result.field_errors.push_back({field.name, message, field.required});
        }
    }

    result.coverage = required_total == 0
                          ? 1.0
                          : static_cast<double>(required_matched) / required_total;
    result.partial  = result.coverage < 1.0;
    result.failed   = result.partial && tpl.abort_on_required_failure;
    return result;
}

}  // namespace Engine
}  // namespace Extract
}  // namespace Gleaner

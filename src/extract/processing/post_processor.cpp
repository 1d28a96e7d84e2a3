#include "post_processor.hpp"
#include <cmath>
#include <functional>
#include <regex>
#include "../../core/errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Gleaner {
namespace Extract {
namespace Processing {

using Templates::Directive;
using Templates::DirectiveType;
namespace Text = Utils::Text;

namespace {

// Applies fn to a string or to every string in an array.
Value map_strings(const Value& value, const std::function<Value(const std::string&)>& fn) {
    if (value.is_string())
        return fn(value.get<std::string>());
    if (value.is_array()) {
        Value out = Value::array();
        for (const auto& item : value)
            out.push_back(item.is_string() ? fn(item.get<std::string>()) : item);
        return out;
    }
    return value;
}

Value to_number(const std::string& text) {
    auto number = Text::extract_number(text);
    if (!number)
        return nullptr;
    double integral = 0.0;
    if (std::modf(*number, &integral) == 0.0 && std::abs(*number) < 9e15)
        return static_cast<long long>(*number);
    return *number;
}

Value apply_one(const Value& value, const Directive& d, const std::string& base_url) {
    switch (d.type) {
        case DirectiveType::Trim:
            return map_strings(value, [](const std::string& s) -> Value { return Text::trim(s); });
        case DirectiveType::Collapse:
            return map_strings(value, [](const std::string& s) -> Value {
                return Text::collapse_whitespace(s);
            });
        case DirectiveType::Lower:
            return map_strings(value, [](const std::string& s) -> Value { return Text::to_lower(s); });
        case DirectiveType::Upper:
            return map_strings(value, [](const std::string& s) -> Value { return Text::to_upper(s); });
        case DirectiveType::Number: return map_strings(value, to_number);

        case DirectiveType::NormalizeUrl:
            return map_strings(value, [&base_url](const std::string& s) -> Value {
                std::string resolved = Utils::Url::resolve(base_url, Text::trim(s));
                if (resolved.empty())
                    return nullptr;
                return Utils::Url::normalize(resolved);
            });

        case DirectiveType::Replace: {
            std::regex pattern(d.pattern);
            return map_strings(value, [&](const std::string& s) -> Value {
                return std::regex_replace(s, pattern, d.replacement);
            });
        }

        case DirectiveType::Split: {
            if (!value.is_string())
                return value;
            Value out = Value::array();
            std::string separator = d.separator.empty() ? "," : d.separator;
            for (auto& part : Text::split(value.get<std::string>(), separator))
                out.push_back(part);
            return out;
        }

        case DirectiveType::Join: {
            if (!value.is_array())
                return value;
            std::vector<std::string> parts;
            for (const auto& item : value) {
                if (item.is_string())
                    parts.push_back(item.get<std::string>());
                else if (!item.is_null())
                    parts.push_back(item.dump());
            }
            return Text::join(parts, d.separator.empty() ? ", " : d.separator);
        }
    }
    return value;
}

}  // namespace

Value PostProcessor::apply(Value                         value,
                           const std::vector<Directive>& directives,
                           const std::string&            base_url,
                           const std::string&            field) {
    for (const auto& directive : directives) {
        try {
            value = apply_one(value, directive, base_url);
        } catch (const std::regex_error& e) {
            throw Core::ExtractionFieldError(field, std::string("directive ")
                                                       + Templates::to_string(directive.type)
                                                       + " failed: " + e.what());
        }
    }
    return value;
}

bool PostProcessor::is_empty(const Value& value) {
    if (value.is_null())
        return true;
    if (value.is_string())
        return value.get<std::string>().empty();
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!is_empty(item))
                return false;
        }
        return true;
    }
    return false;
}

}  // namespace Processing
}  // namespace Extract
}  // namespace Gleaner

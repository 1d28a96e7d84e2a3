#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include "../model/template.hpp"

namespace Gleaner {
namespace Templates {

/**
 * @brief Builds Template objects from JSON.
 *
 * Accepts the "fields" array layout and the older "selectors" /
 * "fallback_selectors" / "post_processing" object layout. Every method
 * throws Core::TemplateError with the offending path in the message.
 * Objects keep their declaration order, so selector maps yield fields in
 * the order they were written.
 */
class TemplateLoader {
public:
    static Template                        from_json(const nlohmann::ordered_json& doc);
    static Template                        from_string(const std::string& text);
    static std::shared_ptr<const Template> load_file(const std::string& path);

    static FieldKind          parse_kind(const std::string& name);
    static Directive          parse_directive(const nlohmann::ordered_json& node);
    static PaginationStrategy parse_strategy(const std::string& name);
    static Network::Http::StealthLevel parse_stealth(const std::string& name);
};

}  // namespace Templates
}  // namespace Gleaner

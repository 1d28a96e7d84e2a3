#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>
#include "../../template/model/template.hpp"
#include "../query/document_query.hpp"

namespace Gleaner {
namespace Extract {
namespace Engine {

using Record = nlohmann::ordered_json;

struct FieldError {
    std::string field;
    std::string message;
    bool        required = false;
};

struct ExtractionResult {
    Record                  record = Record::object();
    std::vector<FieldError> field_errors;
    double                  coverage = 1.0;
    bool                    partial  = false;
    // Set when the template demands abort-on-required-failure and a
    // required field is missing.
    bool failed = false;
    // Selector that produced each matched field.
    std::map<std::string, std::string> selectors_used;
};

/**
 * @brief Applies a template's fields to one document.
 *
 * For every field in declaration order the primary selector is tried first,
 * then each fallback; the first selector yielding a usable value wins. The
 * engine never throws for field problems: they are returned as FieldError.
 */
class ExtractionEngine {
public:
    ExtractionResult extract(const Query::DocumentQuery& document,
                             const Templates::Template&  tpl,
                             const std::string&          base_url) const;

    // Selector actually queried for a field (adds ::attr()/::html by kind).
    static std::string effective_selector(const Templates::FieldSpec& field,
                                          const std::string&          selector);
};

}  // namespace Engine
}  // namespace Extract
}  // namespace Gleaner

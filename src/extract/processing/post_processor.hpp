#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../../template/model/template.hpp"

namespace Gleaner {
namespace Extract {
namespace Processing {

using Value = nlohmann::ordered_json;

class PostProcessor {
public:
    /**
     * Applies @p directives in order. Scalar directives map over arrays.
     * URL normalization resolves against @p base_url.
     *
     * @throws Core::ExtractionFieldError when a directive cannot be applied
     * (bad regex).
     */
    static Value apply(Value                                    value,
                       const std::vector<Templates::Directive>& directives,
                       const std::string&                       base_url,
                       const std::string&                       field);

    // null, "", [] and arrays of only empty strings.
    static bool is_empty(const Value& value);
};

}  // namespace Processing
}  // namespace Extract
}  // namespace Gleaner

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Gleaner {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);
bool        icontains(const std::string& haystack, const std::string& needle);

// Runs of whitespace become a single space; the result is trimmed.
std::string collapse_whitespace(const std::string& str);

std::vector<std::string> split(const std::string& str, const std::string& separator);
std::string              join(const std::vector<std::string>& parts, const std::string& separator);

std::string base64_encode(const std::string& input);

// First number in the text, tolerating currency symbols and thousands
// separators ("$1,299.00" -> 1299.0).
std::optional<double> extract_number(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Gleaner

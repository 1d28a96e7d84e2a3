#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Gleaner {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::string to_upper(const std::string& str) {
    std::string upper = str;
    std::transform(
        upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    return upper;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool icontains(const std::string& haystack, const std::string& needle) {
    if (needle.empty())
        return true;
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char c1, char c2) {
            return std::tolower(static_cast<unsigned char>(c1))
                   == std::tolower(static_cast<unsigned char>(c2));
        });
    return it != haystack.end();
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool in_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty())
            out.push_back(' ');
        in_space = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> split(const std::string& str, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        parts.push_back(str);
        return parts;
    }
    size_t start = 0;
    while (true) {
        size_t pos = str.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + separator.size();
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += separator;
        out += parts[i];
    }
    return out;
}

std::string base64_encode(const std::string& input) {
    static constexpr const char* ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        unsigned int n = (static_cast<unsigned char>(input[i]) << 16)
                         | (static_cast<unsigned char>(input[i + 1]) << 8)
                         | static_cast<unsigned char>(input[i + 2]);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(ALPHABET[n & 0x3F]);
    }
    size_t rest = input.size() - i;
    if (rest > 0) {
        unsigned int n = static_cast<unsigned char>(input[i]) << 16;
        if (rest == 2)
            n |= static_cast<unsigned char>(input[i + 1]) << 8;
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(rest == 2 ? ALPHABET[(n >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::optional<double> extract_number(const std::string& str) {
    size_t i = 0;
    while (i < str.size() && !std::isdigit(static_cast<unsigned char>(str[i])))
        ++i;
    if (i == str.size())
        return std::nullopt;

    bool negative = i > 0 && str[i - 1] == '-';

    std::string digits;
    bool        seen_dot = false;
    for (; i < str.size(); ++i) {
        char c = str[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
        else if (c == ',' && !seen_dot && i + 1 < str.size()
                 && std::isdigit(static_cast<unsigned char>(str[i + 1]))) {
            continue;
        }
        else if (c == '.' && !seen_dot && i + 1 < str.size()
                 && std::isdigit(static_cast<unsigned char>(str[i + 1]))) {
            seen_dot = true;
            digits.push_back(c);
        }
        else {
            break;
        }
    }

    double value = std::strtod(digits.c_str(), nullptr);
    return negative ? -value : value;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Gleaner

/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "bguid/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bguid {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;

    if (str.empty()) {
        tokens.push_back("");  // Empty string → [""]
        return tokens;
    }

    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    // getline drops the empty token after a trailing delimiter
    if (str.back() == delimiter) {
        tokens.push_back("");
    }

    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += parts[i];
    }
    return result;
}

bool isHex(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::optional<uint64_t> parseHex(const std::string& hex) {
    if (hex.empty() || hex.length() > 16 || !isHex(hex)) {
        return std::nullopt;
    }

    uint64_t value = 0;
    std::istringstream iss(hex);
    iss >> std::hex >> value;
    if (iss.fail()) {
        return std::nullopt;
    }
    return value;
}

std::string toHex(uint64_t value, std::size_t minWidth) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0')
        << std::setw(static_cast<int>(minWidth)) << value;
    return oss.str();
}

} // namespace utils
} // namespace bguid

/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Small helpers shared by the GUID formatter and the command line tool.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bguid {
namespace utils {

/**
 * @brief Convert string to lowercase
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase
 */
std::string toUpper(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * Keeps empty tokens, including a trailing one: "a-b-" gives ["a", "b", ""].
 * An empty input yields a single empty token.
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Join strings with delimiter
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Check if every character is a hex digit
 */
bool isHex(const std::string& str);

/**
 * @brief Parse hex text into a 64-bit unsigned value
 *
 * @param hex 1 to 16 hex digits, either case
 * @return Parsed value, or std::nullopt on error
 */
std::optional<uint64_t> parseHex(const std::string& hex);

/**
 * @brief Format value as uppercase hex, left-padded with zeros
 *
 * @param value Value to format
 * @param minWidth Minimum number of digits
 */
std::string toHex(uint64_t value, std::size_t minWidth);

} // namespace utils
} // namespace bguid

/**
 * @file TextUtils.hpp
 * @brief String helpers for survey codes (UTF-8 aware for Latin and Cyrillic)
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace survey {

/**
 * @brief Letter prefix and digit suffix of a coded name such as "gaz12"
 */
struct CodedName {
    std::string prefix;
    std::string number;
};

std::string trim(const std::string& text);

/**
 * @brief Lowercase ASCII and Cyrillic letters (including Ё) of a UTF-8 string
 *
 * Other bytes are copied unchanged.
 */
std::string to_lower(const std::string& text);

/**
 * @brief Trimmed, lowercased form used for every code comparison
 */
inline std::string normalize_code(const std::string& code) {
    return to_lower(trim(code));
}

/**
 * @brief Split "prefix + trailing digits"
 *
 * The prefix must be one or more letters (ASCII only, or ASCII and Cyrillic
 * when allow_cyrillic is set) and the suffix one or more ASCII digits
 * running to the end of the string.
 */
std::optional<CodedName> split_coded_name(const std::string& code, bool allow_cyrillic);

/**
 * @brief Normalize every entry and drop empty ones
 */
std::vector<std::string> normalize_codes(const std::vector<std::string>& codes);

bool contains_any(const std::string& text, const std::vector<std::string>& needles);

/**
 * @brief Parse a decimal number, accepting a decimal comma
 *
 * Returns nullopt unless the whole (trimmed) field is a finite number.
 */
std::optional<double> parse_number(const std::string& text);

std::string format_fixed(double value, int precision);

} // namespace survey

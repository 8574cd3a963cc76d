/**
 * @file TextUtils.cpp
 * @brief Implementation of code and number string helpers
 */

#include "TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdint>

namespace survey {

namespace {

/**
 * @brief Decode one UTF-8 sequence starting at pos; advances pos
 *
 * Malformed bytes decode as themselves so that callers never lose input.
 */
std::uint32_t decode_utf8(const std::string& text, size_t& pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);

    if (lead < 0x80) {
        ++pos;
        return lead;
    }
    if ((lead & 0xE0) == 0xC0 && pos + 1 < text.size() && (byte(pos + 1) & 0xC0) == 0x80) {
        std::uint32_t cp = ((lead & 0x1F) << 6) | (byte(pos + 1) & 0x3F);
        pos += 2;
        return cp;
    }
    if ((lead & 0xF0) == 0xE0 && pos + 2 < text.size()) {
        std::uint32_t cp = ((lead & 0x0F) << 12) | ((byte(pos + 1) & 0x3F) << 6) | (byte(pos + 2) & 0x3F);
        pos += 3;
        return cp;
    }
    ++pos;
    return lead;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_ascii_letter(std::uint32_t cp) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
}

bool is_cyrillic_letter(std::uint32_t cp) {
    return cp >= 0x0400 && cp <= 0x045F;
}

} // namespace

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string to_lower(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        std::uint32_t cp = decode_utf8(text, pos);

        if (cp >= 'A' && cp <= 'Z') {
            out.push_back(static_cast<char>(cp + ('a' - 'A')));
        } else if (cp >= 0x0410 && cp <= 0x042F) {
            append_utf8(out, cp + 0x20);
        } else if (cp >= 0x0400 && cp <= 0x040F) {
            append_utf8(out, cp + 0x50);   // Ё, Ђ, Є ... lower-case block
        } else {
            out.append(text, start, pos - start);
        }
    }
    return out;
}

std::optional<CodedName> split_coded_name(const std::string& code, bool allow_cyrillic) {
    // Digits are single-byte, so the suffix can be located byte-wise
    size_t digit_start = code.size();
    while (digit_start > 0 && code[digit_start - 1] >= '0' && code[digit_start - 1] <= '9') {
        --digit_start;
    }
    if (digit_start == code.size() || digit_start == 0) {
        return std::nullopt;
    }

    std::string prefix = code.substr(0, digit_start);
    size_t pos = 0;
    while (pos < prefix.size()) {
        std::uint32_t cp = decode_utf8(prefix, pos);
        bool letter = is_ascii_letter(cp) || (allow_cyrillic && is_cyrillic_letter(cp));
        if (!letter) {
            return std::nullopt;
        }
    }

    return CodedName{prefix, code.substr(digit_start)};
}

std::vector<std::string> normalize_codes(const std::vector<std::string>& codes) {
    std::vector<std::string> result;
    result.reserve(codes.size());
    for (const auto& code : codes) {
        std::string normalized = normalize_code(code);
        if (!normalized.empty() &&
            std::find(result.begin(), result.end(), normalized) == result.end()) {
            result.push_back(normalized);
        }
    }
    return result;
}

bool contains_any(const std::string& text, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<double> parse_number(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    std::replace(value.begin(), value.end(), ',', '.');

    try {
        size_t consumed = 0;
        double result = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(result)) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_fixed(double value, int precision) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

} // namespace survey

#pragma once

#include <string>
#include <sstream>
#include <cinttypes>
#include <cstdio>

#include <keycase/support/types.h>
#include <keycase/support/exception.h>

namespace keycase {

inline
std::string int_to_str(int64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%" PRId64, v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string int_to_str(uint64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%" PRIu64, v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string float_to_str(double v) {
    char buf[26];
    // 53-bit mantissa is 15.95 decimal digits, so round to 15 digits.
    auto len = std::snprintf(buf, 25, "%.15g", v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

// ASCII-only character classes. Locale-aware <cctype> functions are not used
// because case conversion must not depend on the process locale.

constexpr bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
constexpr bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }

constexpr char to_lower(char c) { return is_upper(c)? (char)(c - 'A' + 'a'): c; }
constexpr char to_upper(char c) { return is_lower(c)? (char)(c - 'a' + 'A'): c; }

inline
String to_lower(const StringView& str) {
    String result{str};
    for (auto& c : result) c = to_lower(c);
    return result;
}

inline
String to_upper(const StringView& str) {
    String result{str};
    for (auto& c : result) c = to_upper(c);
    return result;
}

/// Returns true if the string contains no lowercase ASCII letter.
inline
bool is_all_upper(const StringView& str) {
    for (auto c : str) {
        if (is_lower(c)) return false;
    }
    return true;
}

} // keycase namespace

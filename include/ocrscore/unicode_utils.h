#pragma once

#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>
#include <string>

namespace ocrscore {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Decode a UTF-8 string into code points.
 * Ill-formed sequences decode to U+FFFD, one per offending byte run.
 */
inline std::u32string to_code_points(const std::string& utf8_str) {
    std::u32string result;
    result.reserve(utf8_str.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(utf8_str.data());
    int32_t length = static_cast<int32_t>(utf8_str.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        result.push_back(c < 0 ? U'\uFFFD' : static_cast<char32_t>(c));
    }
    return result;
}

/**
 * Encode code points back to UTF-8
 */
inline std::string from_code_points(const std::u32string& code_points) {
    std::string result;
    result.reserve(code_points.size());
    for (char32_t cp : code_points) {
        uint8_t buf[U8_MAX_LENGTH];
        int32_t len = 0;
        UBool error = false;
        U8_APPEND(buf, len, U8_MAX_LENGTH, static_cast<UChar32>(cp), error);
        if (!error) {
            result.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
        }
    }
    return result;
}

/**
 * Convert string to lowercase (Unicode-aware, locale-independent)
 */
inline std::string to_lower(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    ustr.toLower(icu::Locale::getRoot());
    return from_unicode_string(ustr);
}

/**
 * Check whether a byte string is well-formed UTF-8
 */
inline bool is_valid_utf8(const std::string& str) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(str.data());
    int32_t length = static_cast<int32_t>(str.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c < 0) {
            return false;
        }
    }
    return true;
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    // ICU automatically handles invalid UTF-8 by replacing with U+FFFD
    icu::UnicodeString ustr = to_unicode_string(str);
    return from_unicode_string(ustr);
}

}  // namespace unicode
}  // namespace ocrscore

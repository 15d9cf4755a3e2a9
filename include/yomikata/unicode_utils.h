#pragma once

#include <unicode/unistr.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>
#include <unicode/utypes.h>
#include <unicode/uchar.h>
#include <string>
#include <utility>
#include <vector>

namespace yomikata {
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
 * Convert a single code point to std::string (UTF-8)
 */
inline std::string from_code_point(UChar32 c) {
    return from_unicode_string(icu::UnicodeString(c));
}

/**
 * Count Unicode characters (code points) in a UTF-8 string
 */
inline size_t char_count(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return 0;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    return static_cast<size_t>(ustr.countChar32());
}

/**
 * Split a UTF-8 string into its code points, each returned as a UTF-8 string
 */
inline std::vector<std::string> split_chars(const std::string& utf8_str) {
    std::vector<std::string> chars;
    if (utf8_str.empty()) {
        return chars;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t i = 0;
    while (i < ustr.length()) {
        int32_t next = ustr.moveIndex32(i, 1);
        chars.push_back(from_unicode_string(ustr.tempSubString(i, next - i)));
        i = next;
    }
    return chars;
}

/**
 * Get the first N Unicode characters from a string
 * Returns UTF-8 encoded result
 */
inline std::string prefix(const std::string& utf8_str, size_t char_count) {
    if (utf8_str.empty() || char_count == 0) {
        return "";
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t end = ustr.moveIndex32(0, static_cast<int32_t>(char_count));
    return from_unicode_string(ustr.tempSubString(0, end));
}

/**
 * Get the last N Unicode characters from a string
 * Returns UTF-8 encoded result
 */
inline std::string suffix(const std::string& utf8_str, size_t char_count) {
    if (utf8_str.empty() || char_count == 0) {
        return "";
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t start = ustr.moveIndex32(ustr.length(), -static_cast<int32_t>(char_count));
    return from_unicode_string(ustr.tempSubString(start));
}

/**
 * Get substring starting from a Unicode character position (not byte position)
 * Returns UTF-8 encoded result
 */
inline std::string substr_from_char(const std::string& utf8_str, size_t char_start) {
    if (utf8_str.empty() || char_start == 0) {
        return utf8_str;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    if (static_cast<int32_t>(char_start) >= ustr.countChar32()) {
        return "";
    }
    int32_t start = ustr.moveIndex32(0, static_cast<int32_t>(char_start));
    return from_unicode_string(ustr.tempSubString(start));
}

/**
 * Get Unicode character at position (returns UTF-8 encoded character)
 */
inline std::string char_at(const std::string& utf8_str, size_t char_pos) {
    if (utf8_str.empty()) {
        return "";
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    if (static_cast<int32_t>(char_pos) >= ustr.countChar32()) {
        return "";
    }
    int32_t start = ustr.moveIndex32(0, static_cast<int32_t>(char_pos));
    return from_code_point(ustr.char32At(start));
}

inline std::string first_char(const std::string& utf8_str) {
    return prefix(utf8_str, 1);
}

inline std::string last_char(const std::string& utf8_str) {
    return suffix(utf8_str, 1);
}

/**
 * Drop the last N Unicode characters of a string
 */
inline std::string drop_last(const std::string& utf8_str, size_t char_count = 1) {
    size_t total = unicode::char_count(utf8_str);
    if (char_count >= total) {
        return "";
    }
    return prefix(utf8_str, total - char_count);
}

inline bool starts_with(const std::string& str, const std::string& head) {
    return str.size() >= head.size() && str.compare(0, head.size(), head) == 0;
}

inline bool ends_with(const std::string& str, const std::string& tail) {
    return str.size() >= tail.size() && str.compare(str.size() - tail.size(), tail.size(), tail) == 0;
}

/**
 * First code point of a UTF-8 string, or U_SENTINEL for an empty string
 */
inline UChar32 first_code_point(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return U_SENTINEL;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    return ustr.char32At(0);
}

inline bool is_hiragana(UChar32 c) {
    return c >= 0x3041 && c <= 0x3096;
}

inline bool is_katakana(UChar32 c) {
    return c >= 0x30A1 && c <= 0x30FA;
}

inline bool is_long_vowel_mark(UChar32 c) {
    return c == 0x30FC;
}

inline bool is_kana(UChar32 c) {
    return is_hiragana(c) || is_katakana(c) || is_long_vowel_mark(c);
}

/**
 * CJK unified ideographs and extension A
 */
inline bool is_kanji(UChar32 c) {
    return (c >= 0x4E00 && c <= 0x9FAF) || (c >= 0x3400 && c <= 0x4DBF);
}

inline bool is_repeater(UChar32 c) {
    return c == 0x3005;
}

/**
 * ASCII and full-width digits
 */
inline bool is_digit(UChar32 c) {
    return (c >= '0' && c <= '9') || (c >= 0xFF10 && c <= 0xFF19);
}

inline bool is_kanji_char(const std::string& ch) {
    return is_kanji(first_code_point(ch));
}

inline bool is_repeater_char(const std::string& ch) {
    return is_repeater(first_code_point(ch));
}

inline bool is_digit_char(const std::string& ch) {
    return is_digit(first_code_point(ch));
}

inline bool is_hiragana_char(const std::string& ch) {
    return is_hiragana(first_code_point(ch));
}

inline bool is_katakana_char(const std::string& ch) {
    return is_katakana(first_code_point(ch));
}

/**
 * True when the string is non-empty and made only of kana and ー
 */
inline bool is_kana_str(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return false;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        if (!is_kana(ustr.char32At(i))) {
            return false;
        }
    }
    return true;
}

inline bool is_word_char(const std::string& ch) {
    UChar32 c = first_code_point(ch);
    return is_kanji(c) || is_repeater(c) || is_digit(c);
}

/**
 * True when every character is ASCII or full-width digit
 */
inline bool is_digit_str(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return false;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        if (!is_digit(ustr.char32At(i))) {
            return false;
        }
    }
    return true;
}

/**
 * True when the string contains at least one hiragana or katakana character
 */
inline bool contains_kana(const std::string& utf8_str) {
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        UChar32 c = ustr.char32At(i);
        if (is_hiragana(c) || is_katakana(c)) {
            return true;
        }
    }
    return false;
}

/**
 * True when every kana in the string is katakana; ー counts for neither side
 */
inline bool is_katakana_str(const std::string& utf8_str) {
    bool seen_katakana = false;
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        UChar32 c = ustr.char32At(i);
        if (is_hiragana(c)) {
            return false;
        }
        if (is_katakana(c)) {
            seen_katakana = true;
        }
    }
    return seen_katakana;
}

/**
 * Convert katakana to hiragana, leaving ー and non-kana unchanged
 */
inline std::string to_hiragana(const std::string& utf8_str) {
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    icu::UnicodeString out;
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        UChar32 c = ustr.char32At(i);
        if (c >= 0x30A1 && c <= 0x30F6) {
            c -= 0x60;
        }
        out.append(c);
    }
    return from_unicode_string(out);
}

/**
 * Convert hiragana to katakana, leaving ー and non-kana unchanged
 */
inline std::string to_katakana(const std::string& utf8_str) {
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    icu::UnicodeString out;
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        UChar32 c = ustr.char32At(i);
        if (c >= 0x3041 && c <= 0x3096) {
            c += 0x60;
        }
        out.append(c);
    }
    return from_unicode_string(out);
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    icu::UnicodeString ustr = to_unicode_string(str);
    return from_unicode_string(ustr);
}

}  // namespace unicode
}  // namespace yomikata

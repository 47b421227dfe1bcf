#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>

namespace inkwell {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

[[nodiscard]] constexpr bool is_ascii_alpha(CodePoint cp) {
    return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z');
}

[[nodiscard]] constexpr bool is_ascii_digit(CodePoint cp) {
    return cp >= '0' && cp <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alphanumeric(CodePoint cp) {
    return is_ascii_alpha(cp) || is_ascii_digit(cp);
}

// Word character as understood by identifier-style matching ([A-Za-z0-9_])
[[nodiscard]] constexpr bool is_word_character(CodePoint cp) {
    return is_ascii_alphanumeric(cp) || cp == '_';
}

[[nodiscard]] constexpr bool is_ascii_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v';
}

// Code points outside the Basic Multilingual Plane
[[nodiscard]] constexpr bool is_supplementary(CodePoint cp) {
    return cp >= 0x10000 && cp <= 0x10FFFF;
}

struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);
[[nodiscard]] usize utf8_encode(CodePoint cp, char* buffer);

} // namespace unicode

// ============================================================================
// String - UTF-8 encoded string with utilities
// ============================================================================

class String {
public:
    using const_iterator = std::string::const_iterator;

    String() = default;
    String(const char* str);
    String(const char* str, usize length);
    String(std::string str);
    String(std::string_view sv);

    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] usize length() const noexcept { return m_data.length(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(m_data);
    }

    [[nodiscard]] const std::string& std_string() const noexcept {
        return m_data;
    }

    // Unicode-aware length
    [[nodiscard]] usize code_point_count() const;

    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }

    void append(const String& other);
    void append(std::string_view sv);
    void append(const char* str) { append(std::string_view(str)); }
    void append(unicode::CodePoint cp);
    void clear() { m_data.clear(); }

    // Byte-indexed substring
    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;

    // Leading code points, for previews in messages
    [[nodiscard]] String prefix_code_points(usize count) const;

    [[nodiscard]] std::optional<usize> find(const String& needle, usize start = 0) const;
    [[nodiscard]] std::optional<usize> find(char c, usize start = 0) const;
    [[nodiscard]] bool contains(const String& needle) const;
    [[nodiscard]] bool starts_with(const String& prefix) const;
    [[nodiscard]] bool ends_with(const String& suffix) const;

    [[nodiscard]] String trim() const;

    [[nodiscard]] std::vector<String> split(const String& delimiter) const;

    [[nodiscard]] bool operator==(const String& other) const {
        return m_data == other.m_data;
    }

    [[nodiscard]] bool operator!=(const String& other) const {
        return m_data != other.m_data;
    }

    [[nodiscard]] bool operator<(const String& other) const {
        return m_data < other.m_data;
    }

    String operator+(const String& other) const;
    String& operator+=(const String& other);
    String& operator+=(std::string_view sv);
    String& operator+=(const char* str) { return *this += std::string_view(str); }

    const char& operator[](usize index) const { return m_data[index]; }

private:
    std::string m_data;
};

inline String operator""_s(const char* str, std::size_t len) {
    return String(str, len);
}

// ============================================================================
// StringBuilder - Efficient string building
// ============================================================================

class StringBuilder {
public:
    StringBuilder() = default;
    explicit StringBuilder(usize initial_capacity);

    StringBuilder& append(const String& str);
    StringBuilder& append(std::string_view sv);
    StringBuilder& append(const char* str) { return append(std::string_view(str)); }
    StringBuilder& append(char c);
    StringBuilder& append(i64 value);
    StringBuilder& append(f64 value);

    void clear() { m_buffer.clear(); }

    [[nodiscard]] String build() const { return String(m_buffer); }
    [[nodiscard]] std::string_view view() const { return m_buffer; }
    [[nodiscard]] usize size() const { return m_buffer.size(); }
    [[nodiscard]] bool empty() const { return m_buffer.empty(); }

private:
    std::string m_buffer;
};

} // namespace inkwell

template<>
struct std::hash<inkwell::String> {
    std::size_t operator()(const inkwell::String& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};

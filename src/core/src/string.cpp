#include "inkwell/core/string.hpp"
#include <charconv>
#include <cstring>

namespace inkwell {

// ============================================================================
// UTF-8 implementation
// ============================================================================

namespace unicode {

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0};
    }

    auto byte = static_cast<u8>(data[0]);

    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1};
    }

    usize seq_len;
    CodePoint cp;

    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        // Stray continuation byte or invalid leading byte
        return {REPLACEMENT_CHARACTER, 1};
    }

    if (length < seq_len) {
        return {REPLACEMENT_CHARACTER, 1};
    }

    for (usize i = 1; i < seq_len; ++i) {
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, 1};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    if (!is_valid(cp)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    // Overlong encodings
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    return {cp, seq_len};
}

usize utf8_encode(CodePoint cp, char* buffer) {
    if (cp < 0x80) {
        buffer[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buffer[0] = static_cast<char>(0xC0 | (cp >> 6));
        buffer[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buffer[0] = static_cast<char>(0xE0 | (cp >> 12));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buffer[0] = static_cast<char>(0xF0 | (cp >> 18));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

} // namespace unicode

// ============================================================================
// String implementation
// ============================================================================

String::String(const char* str) : m_data(str ? str : "") {}

String::String(const char* str, usize length) : m_data(str, length) {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

usize String::code_point_count() const {
    usize count = 0;
    usize pos = 0;

    while (pos < m_data.size()) {
        auto decoded = unicode::utf8_decode(m_data.data() + pos, m_data.size() - pos);
        pos += decoded.bytes_consumed;
        ++count;
    }

    return count;
}

void String::append(const String& other) {
    m_data.append(other.m_data);
}

void String::append(std::string_view sv) {
    m_data.append(sv);
}

void String::append(unicode::CodePoint cp) {
    char buffer[4];
    usize len = unicode::utf8_encode(cp, buffer);
    m_data.append(buffer, len);
}

String String::substring(usize start, usize length) const {
    if (start >= m_data.size()) {
        return {};
    }
    return String(m_data.substr(start, length));
}

String String::prefix_code_points(usize count) const {
    usize pos = 0;
    for (usize taken = 0; taken < count && pos < m_data.size(); ++taken) {
        pos += unicode::utf8_decode(m_data.data() + pos, m_data.size() - pos).bytes_consumed;
    }
    return String(m_data.substr(0, pos));
}

std::optional<usize> String::find(const String& needle, usize start) const {
    auto pos = m_data.find(needle.m_data, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

std::optional<usize> String::find(char c, usize start) const {
    auto pos = m_data.find(c, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

bool String::contains(const String& needle) const {
    return m_data.find(needle.m_data) != std::string::npos;
}

bool String::starts_with(const String& prefix) const {
    return m_data.starts_with(prefix.m_data);
}

bool String::ends_with(const String& suffix) const {
    return m_data.ends_with(suffix.m_data);
}

String String::trim() const {
    auto start = m_data.begin();
    auto end = m_data.end();
    while (start != end && unicode::is_ascii_whitespace(static_cast<u8>(*start))) {
        ++start;
    }
    while (end != start && unicode::is_ascii_whitespace(static_cast<u8>(*(end - 1)))) {
        --end;
    }
    return String(std::string(start, end));
}

std::vector<String> String::split(const String& delimiter) const {
    std::vector<String> result;
    if (delimiter.empty()) {
        result.emplace_back(m_data);
        return result;
    }

    usize start = 0;
    usize end = m_data.find(delimiter.m_data);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + delimiter.size();
        end = m_data.find(delimiter.m_data, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
}

String String::operator+(const String& other) const {
    return String(m_data + other.m_data);
}

String& String::operator+=(const String& other) {
    m_data += other.m_data;
    return *this;
}

String& String::operator+=(std::string_view sv) {
    m_data += sv;
    return *this;
}

// ============================================================================
// StringBuilder implementation
// ============================================================================

StringBuilder::StringBuilder(usize initial_capacity) {
    m_buffer.reserve(initial_capacity);
}

StringBuilder& StringBuilder::append(const String& str) {
    m_buffer.append(str.std_string());
    return *this;
}

StringBuilder& StringBuilder::append(std::string_view sv) {
    m_buffer.append(sv);
    return *this;
}

StringBuilder& StringBuilder::append(char c) {
    m_buffer.push_back(c);
    return *this;
}

StringBuilder& StringBuilder::append(i64 value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

StringBuilder& StringBuilder::append(f64 value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

} // namespace inkwell

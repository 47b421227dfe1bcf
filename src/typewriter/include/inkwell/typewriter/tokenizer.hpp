#pragma once

#include "inkwell/core/types.hpp"
#include "inkwell/core/string.hpp"
#include <functional>
#include <string_view>
#include <vector>

namespace inkwell::typewriter {

// ============================================================================
// Tokens
// ============================================================================

// A token is the raw text fragment itself; its shape is recomputed on demand.
using Token = String;

enum class TokenKind : u8 {
    Directive,  // [@type:value]
    Tag,        // <...>
    Entity,     // &...;
    Glyph,      // a supplementary-plane code point
    Character,  // any other single code point
};

[[nodiscard]] std::string_view token_kind_name(TokenKind kind);
[[nodiscard]] TokenKind classify_token(const Token& token);
[[nodiscard]] bool is_directive_token(const Token& token);

// ============================================================================
// Tokenizer - splits typed text into atomic units
// ============================================================================
//
// Scanning is left to right without backtracking. At each position the first
// matching rule wins:
//   1. "[@" up to the next "]" (at least one character between)
//   2. "<" up to the next ">"
//   3. "&" up to the next ";"
//   4. one code point outside the BMP
//   5. one code point (or one malformed byte)
//
// Concatenating the produced tokens always reproduces the input.

class Tokenizer {
public:
    using WarningCallback = std::function<void(const String& message)>;

    Tokenizer() = default;

    void set_warning_callback(WarningCallback callback) { m_warning_callback = std::move(callback); }

    [[nodiscard]] std::vector<Token> tokenize(const String& text) const;

    // True when the text is non-blank and consists of directive tokens only
    [[nodiscard]] bool is_only_directives(const String& text) const;

    // Previews of every "[@" with no closing bracket after it
    [[nodiscard]] std::vector<String> unclosed_directives(const String& text) const;

    static constexpr usize unclosed_preview_length = 30;

private:
    void report_unclosed(const String& text) const;

    WarningCallback m_warning_callback;
};

[[nodiscard]] std::vector<Token> tokenize(const String& text);
[[nodiscard]] bool is_only_directives(const String& text);

} // namespace inkwell::typewriter

#include "inkwell/typewriter/tokenizer.hpp"
#include "inkwell/core/logger.hpp"

namespace inkwell::typewriter {

namespace {

constexpr std::string_view DIRECTIVE_OPEN = "[@";

// Length of a delimited span starting at `pos`, or 0 when the closing
// delimiter is missing or nothing lies between the delimiters.
usize delimited_length(std::string_view text, usize pos, usize open_length, char close) {
    usize content_start = pos + open_length;
    if (content_start >= text.size()) {
        return 0;
    }
    usize end = text.find(close, content_start);
    if (end == std::string_view::npos || end == content_start) {
        return 0;
    }
    return end - pos + 1;
}

usize directive_length(std::string_view text, usize pos) {
    if (text.substr(pos, DIRECTIVE_OPEN.size()) != DIRECTIVE_OPEN) {
        return 0;
    }
    return delimited_length(text, pos, DIRECTIVE_OPEN.size(), ']');
}

usize count_occurrences(std::string_view text, std::string_view needle) {
    usize count = 0;
    usize pos = text.find(needle);
    while (pos != std::string_view::npos) {
        ++count;
        pos = text.find(needle, pos + needle.size());
    }
    return count;
}

// Well-formed directives, counted the way the scanner would find them
usize count_closed_directives(std::string_view text) {
    usize count = 0;
    usize pos = 0;
    while (pos < text.size()) {
        usize len = directive_length(text, pos);
        if (len > 0) {
            ++count;
            pos += len;
        } else {
            ++pos;
        }
    }
    return count;
}

} // anonymous namespace

// ============================================================================
// Token helpers
// ============================================================================

std::string_view token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Directive: return "directive";
        case TokenKind::Tag:       return "tag";
        case TokenKind::Entity:    return "entity";
        case TokenKind::Glyph:     return "glyph";
        case TokenKind::Character: return "character";
    }
    return "unknown";
}

bool is_directive_token(const Token& token) {
    return token.view().starts_with(DIRECTIVE_OPEN);
}

TokenKind classify_token(const Token& token) {
    auto text = token.view();
    if (text.size() > 1) {
        if (directive_length(text, 0) == text.size()) return TokenKind::Directive;
        if (text.front() == '<' && text.back() == '>') return TokenKind::Tag;
        if (text.front() == '&' && text.back() == ';') return TokenKind::Entity;
    }
    auto decoded = unicode::utf8_decode(text.data(), text.size());
    if (unicode::is_supplementary(decoded.code_point)) {
        return TokenKind::Glyph;
    }
    return TokenKind::Character;
}

// ============================================================================
// Tokenizer
// ============================================================================

std::vector<Token> Tokenizer::tokenize(const String& text) const {
    std::vector<Token> tokens;
    if (text.empty()) {
        return tokens;
    }

    report_unclosed(text);

    auto input = text.view();
    usize pos = 0;

    while (pos < input.size()) {
        usize len = 0;
        switch (input[pos]) {
            case '[':
                len = directive_length(input, pos);
                break;
            case '<':
                len = delimited_length(input, pos, 1, '>');
                break;
            case '&':
                len = delimited_length(input, pos, 1, ';');
                break;
            default:
                break;
        }

        if (len == 0) {
            len = unicode::utf8_decode(input.data() + pos, input.size() - pos).bytes_consumed;
        }

        tokens.emplace_back(input.substr(pos, len));
        pos += len;
    }

    return tokens;
}

bool Tokenizer::is_only_directives(const String& text) const {
    if (text.trim().empty()) {
        return false;
    }

    auto tokens = tokenize(text);
    if (tokens.empty()) {
        return false;
    }

    for (const auto& token : tokens) {
        if (!is_directive_token(token)) {
            return false;
        }
    }
    return true;
}

std::vector<String> Tokenizer::unclosed_directives(const String& text) const {
    std::vector<String> previews;
    auto input = text.view();

    if (count_occurrences(input, DIRECTIVE_OPEN) <= count_closed_directives(input)) {
        return previews;
    }

    auto parts = text.split(String(DIRECTIVE_OPEN));
    for (usize i = 1; i < parts.size(); ++i) {
        if (parts[i].contains("]")) {
            continue;
        }
        String preview = parts[i].prefix_code_points(unclosed_preview_length);
        if (preview.size() < parts[i].size()) {
            preview += "...";
        }
        previews.push_back(std::move(preview));
    }
    return previews;
}

void Tokenizer::report_unclosed(const String& text) const {
    for (const auto& preview : unclosed_directives(text)) {
        auto message = std::format("Detected an unclosed directive near \"[@{}\".", preview);
        logging::get("typewriter").warn(message);
        if (m_warning_callback) {
            m_warning_callback(String(message));
        }
    }
}

// ============================================================================
// Convenience functions
// ============================================================================

std::vector<Token> tokenize(const String& text) {
    Tokenizer tokenizer;
    return tokenizer.tokenize(text);
}

bool is_only_directives(const String& text) {
    Tokenizer tokenizer;
    return tokenizer.is_only_directives(text);
}

} // namespace inkwell::typewriter

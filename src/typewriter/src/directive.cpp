#include "inkwell/typewriter/directive.hpp"
#include <array>
#include <charconv>
#include <cmath>

namespace inkwell::typewriter {

namespace {

struct DirectiveName {
    std::string_view name;
    DirectiveType type;
};

constexpr std::array<DirectiveName, 6> BUILTIN_DIRECTIVES = {{
    {"speed", DirectiveType::Speed},
    {"delay", DirectiveType::Delay},
    {"var",   DirectiveType::Var},
    {"run",   DirectiveType::Run},
    {"async", DirectiveType::Async},
    {"eval",  DirectiveType::Eval},
}};

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

} // anonymous namespace

std::string_view directive_type_name(DirectiveType type) {
    for (const auto& entry : BUILTIN_DIRECTIVES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<DirectiveType> directive_type_from_name(std::string_view name) {
    for (const auto& entry : BUILTIN_DIRECTIVES) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

bool is_reserved_directive_name(std::string_view name) {
    return directive_type_from_name(name).has_value();
}

std::string_view alias_kind_name(AliasKind kind) {
    return directive_type_name(to_directive_type(kind));
}

AliasKind alias_kind_from_name(std::string_view name) {
    if (name == "async") return AliasKind::Async;
    if (name == "eval") return AliasKind::Eval;
    return AliasKind::Run;
}

Directive parse_directive(const Token& token) {
    if (!is_directive_token(token) || token.size() < 3) {
        return {};
    }

    String content = token.substring(2, token.size() - 3);
    auto colon = content.find(':');

    if (!colon) {
        return {content.trim(), {}};
    }

    return {
        content.substring(0, *colon).trim(),
        content.substring(*colon + 1).trim(),
    };
}

ResolvedDirective resolve_alias(const Directive& directive, const Alias& alias) {
    StringBuilder call;
    call.append(alias.target_function);
    call.append('(');
    call.append(directive.value);
    call.append(')');
    return {to_directive_type(alias.kind), call.build()};
}

FunctionCall unwrap_function_call(const String& value) {
    auto text = value.view();

    // name(...) where name is one or more word characters
    usize name_end = 0;
    while (name_end < text.size() && unicode::is_word_character(static_cast<u8>(text[name_end]))) {
        ++name_end;
    }

    bool is_call = name_end > 0 &&
                   name_end < text.size() && text[name_end] == '(' &&
                   text.back() == ')' && text.size() >= name_end + 2 &&
                   text.find('\n') == std::string_view::npos;

    if (!is_call) {
        return {value, std::nullopt};
    }

    FunctionCall call;
    call.function_name = String(text.substr(0, name_end));

    auto raw = text.substr(name_end + 1, text.size() - name_end - 2);
    if (raw.empty()) {
        return call;
    }

    if (is_quote(raw.front())) {
        raw.remove_prefix(1);
    }
    if (!raw.empty() && is_quote(raw.back())) {
        raw.remove_suffix(1);
    }
    call.argument = String(raw);
    return call;
}

Result<f64, String> parse_duration(const String& value) {
    String trimmed = value.trim();
    auto text = trimmed.view();
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return make_error(String("empty value"));
    }

    f64 result = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return make_error(String("not a number"));
    }
    if (!std::isfinite(result)) {
        return make_error(String("not a finite number"));
    }
    if (result < 0) {
        return make_error(String("negative value"));
    }
    return result;
}

String strip_directive_markers(const String& text) {
    String current = text;

    // Unwrapping "[@[@x]]" yields "[@x]", so repeat until nothing is left
    while (true) {
        auto input = current.view();
        StringBuilder out(input.size());
        bool changed = false;
        usize pos = 0;

        while (pos < input.size()) {
            if (input.substr(pos, 2) == "[@") {
                usize close = input.find(']', pos + 2);
                if (close != std::string_view::npos && close > pos + 2) {
                    out.append(input.substr(pos + 2, close - pos - 2));
                    pos = close + 1;
                    changed = true;
                    continue;
                }
            }
            out.append(input[pos]);
            ++pos;
        }

        if (!changed) {
            return current;
        }
        current = out.build();
    }
}

} // namespace inkwell::typewriter

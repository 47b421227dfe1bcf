#pragma once

#include "inkwell/core/types.hpp"
#include "inkwell/core/string.hpp"
#include "inkwell/typewriter/tokenizer.hpp"
#include <optional>
#include <string_view>

namespace inkwell::typewriter {

// ============================================================================
// Directive types
// ============================================================================

enum class DirectiveType : u8 {
    Speed,
    Delay,
    Var,
    Run,
    Async,
    Eval,
};

[[nodiscard]] std::string_view directive_type_name(DirectiveType type);
[[nodiscard]] std::optional<DirectiveType> directive_type_from_name(std::string_view name);

// Built-in names cannot be registered as aliases
[[nodiscard]] bool is_reserved_directive_name(std::string_view name);

// Directives that suspend playback until a timer or a completion settles
[[nodiscard]] constexpr bool is_suspending(DirectiveType type) {
    return type == DirectiveType::Delay || type == DirectiveType::Async;
}

// ============================================================================
// Parsed forms
// ============================================================================

// Raw (type, value) pair as written between "[@" and "]"
struct Directive {
    String type;
    String value;
};

// Directive after alias resolution, ready for dispatch
struct ResolvedDirective {
    DirectiveType type;
    String value;
};

enum class AliasKind : u8 {
    Run,
    Async,
    Eval,
};

[[nodiscard]] std::string_view alias_kind_name(AliasKind kind);

// Unknown names fall back to Run
[[nodiscard]] AliasKind alias_kind_from_name(std::string_view name);

[[nodiscard]] constexpr DirectiveType to_directive_type(AliasKind kind) {
    switch (kind) {
        case AliasKind::Async: return DirectiveType::Async;
        case AliasKind::Eval:  return DirectiveType::Eval;
        case AliasKind::Run:   break;
    }
    return DirectiveType::Run;
}

struct Alias {
    String name;
    String target_function;
    AliasKind kind{AliasKind::Run};
};

struct FunctionCall {
    String function_name;
    std::optional<String> argument;
};

// ============================================================================
// Grammar
// ============================================================================

// Splits "[@type:value]" on the first colon; both halves are trimmed.
[[nodiscard]] Directive parse_directive(const Token& token);

// Rewrites [@alias:X] as [@kind:target(X)], or [@kind:target()] when X is empty.
[[nodiscard]] ResolvedDirective resolve_alias(const Directive& directive, const Alias& alias);

// Recognizes "name(arg)". A single pair of surrounding quotes is stripped
// from the argument. Anything else is a bare function name.
[[nodiscard]] FunctionCall unwrap_function_call(const String& value);

// Non-negative, finite number of milliseconds
[[nodiscard]] Result<f64, String> parse_duration(const String& value);

// Replaces every "[@content]" with "content" so injected text cannot
// smuggle executable directives back into the token stream.
[[nodiscard]] String strip_directive_markers(const String& text);

} // namespace inkwell::typewriter

#pragma once

#include "inkwell/core/string.hpp"
#include "inkwell/typewriter/completion.hpp"
#include "inkwell/typewriter/directive.hpp"
#include "inkwell/typewriter/value.hpp"
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace inkwell::typewriter {

// Single optional argument parsed from "name(arg)"
using Argument = std::optional<String>;

using SyncFunction = std::function<Value(const Argument& argument)>;
using AsyncFunction = std::function<Completion(const Argument& argument)>;

class Callable {
public:
    explicit Callable(SyncFunction fn) : m_fn(std::move(fn)) {}
    explicit Callable(AsyncFunction fn) : m_fn(std::move(fn)) {}

    [[nodiscard]] bool is_async() const { return std::holds_alternative<AsyncFunction>(m_fn); }

    [[nodiscard]] const SyncFunction& sync() const { return std::get<SyncFunction>(m_fn); }
    [[nodiscard]] const AsyncFunction& async() const { return std::get<AsyncFunction>(m_fn); }

private:
    std::variant<SyncFunction, AsyncFunction> m_fn;
};

// ============================================================================
// Context - variables, functions and aliases visible to directives
// ============================================================================
//
// Registration overwrites silently. Invalid registrations throw
// ConfigurationError and leave the context untouched.

class Context {
public:
    void set_variable(const String& key, Value value);
    void set_function(const String& key, SyncFunction fn);
    void set_async_function(const String& key, AsyncFunction fn);
    void set_alias(const String& key, const String& target_function, AliasKind kind = AliasKind::Run);
    void set_alias(const String& key, const String& target_function, std::string_view kind);

    [[nodiscard]] const Value* find_variable(const String& key) const;
    [[nodiscard]] const Callable* find_function(const String& key) const;
    [[nodiscard]] const Alias* find_alias(const String& key) const;

    // Alias rewrite followed by built-in lookup; nullopt for unknown types
    [[nodiscard]] std::optional<ResolvedDirective> resolve(const Directive& directive) const;

    [[nodiscard]] usize variable_count() const { return m_variables.size(); }
    [[nodiscard]] usize function_count() const { return m_functions.size(); }
    [[nodiscard]] usize alias_count() const { return m_aliases.size(); }

    void clear();

private:
    std::unordered_map<String, Value> m_variables;
    std::unordered_map<String, Callable> m_functions;
    std::unordered_map<String, Alias> m_aliases;
};

} // namespace inkwell::typewriter

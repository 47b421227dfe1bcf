#include "inkwell/typewriter/context.hpp"
#include "inkwell/typewriter/error.hpp"
#include "inkwell/core/logger.hpp"

namespace inkwell::typewriter {

namespace {

void require_key(const String& key, std::string_view what, std::string_view operation) {
    if (key.trim().empty()) {
        throw ConfigurationError(String(std::format(
            "Invalid {} name. '{}' requires a non-empty key.", what, operation)));
    }
}

} // anonymous namespace

void Context::set_variable(const String& key, Value value) {
    require_key(key, "variable", "set_variable");
    m_variables.insert_or_assign(key, std::move(value));
}

void Context::set_function(const String& key, SyncFunction fn) {
    require_key(key, "function", "set_function");
    if (!fn) {
        throw ConfigurationError(String(std::format(
            "Invalid function provided for key '{}'. It must be callable.", key)));
    }
    m_functions.insert_or_assign(key, Callable(std::move(fn)));
}

void Context::set_async_function(const String& key, AsyncFunction fn) {
    require_key(key, "function", "set_async_function");
    if (!fn) {
        throw ConfigurationError(String(std::format(
            "Invalid function provided for key '{}'. It must be callable.", key)));
    }
    m_functions.insert_or_assign(key, Callable(std::move(fn)));
}

void Context::set_alias(const String& key, const String& target_function, AliasKind kind) {
    require_key(key, "alias", "set_alias");
    if (is_reserved_directive_name(key.view())) {
        throw ConfigurationError(String(std::format(
            "Alias '{}' conflicts with a built-in directive. Please choose another name.", key)));
    }
    if (target_function.trim().empty()) {
        throw ConfigurationError("Invalid function name. 'set_alias' requires a non-empty target function."_s);
    }

    Alias alias;
    alias.name = key;
    alias.target_function = target_function;
    alias.kind = kind;
    m_aliases.insert_or_assign(key, std::move(alias));
}

void Context::set_alias(const String& key, const String& target_function, std::string_view kind) {
    set_alias(key, target_function, alias_kind_from_name(kind));
}

const Value* Context::find_variable(const String& key) const {
    auto it = m_variables.find(key);
    return it != m_variables.end() ? &it->second : nullptr;
}

const Callable* Context::find_function(const String& key) const {
    auto it = m_functions.find(key);
    return it != m_functions.end() ? &it->second : nullptr;
}

const Alias* Context::find_alias(const String& key) const {
    auto it = m_aliases.find(key);
    return it != m_aliases.end() ? &it->second : nullptr;
}

std::optional<ResolvedDirective> Context::resolve(const Directive& directive) const {
    if (const auto* alias = find_alias(directive.type)) {
        return resolve_alias(directive, *alias);
    }

    auto type = directive_type_from_name(directive.type.view());
    if (!type) {
        return std::nullopt;
    }
    return ResolvedDirective{*type, directive.value};
}

void Context::clear() {
    m_variables.clear();
    m_functions.clear();
    m_aliases.clear();
}

} // namespace inkwell::typewriter

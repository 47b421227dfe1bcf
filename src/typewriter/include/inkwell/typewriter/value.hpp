#pragma once

#include "inkwell/core/types.hpp"
#include "inkwell/core/string.hpp"
#include <type_traits>
#include <variant>

namespace inkwell::typewriter {

enum class ValueType : u8 {
    Undefined,
    Null,
    Boolean,
    Number,
    String,
};

// ============================================================================
// Value - what variables hold and what functions return
// ============================================================================

class Value {
public:
    Value() = default;
    Value(std::nullptr_t) : m_data(Null{}) {}
    Value(bool b) : m_data(b) {}
    // Any integer width; bool and char keep their own meaning
    template<typename T, typename = std::enable_if_t<std::is_integral_v<T> &&
                                                     !std::is_same_v<T, bool> &&
                                                     !std::is_same_v<T, char>>>
    Value(T n) : m_data(static_cast<f64>(n)) {}
    Value(f64 n) : m_data(n) {}
    Value(const char* s) : m_data(inkwell::String(s)) {}
    Value(inkwell::String s) : m_data(std::move(s)) {}

    [[nodiscard]] ValueType type() const;

    [[nodiscard]] bool is_undefined() const { return std::holds_alternative<Undefined>(m_data); }
    [[nodiscard]] bool is_null() const { return std::holds_alternative<Null>(m_data); }
    [[nodiscard]] bool is_boolean() const { return std::holds_alternative<bool>(m_data); }
    [[nodiscard]] bool is_number() const { return std::holds_alternative<f64>(m_data); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<inkwell::String>(m_data); }

    [[nodiscard]] bool as_boolean() const { return std::get<bool>(m_data); }
    [[nodiscard]] f64 as_number() const { return std::get<f64>(m_data); }
    [[nodiscard]] const inkwell::String& as_string() const { return std::get<inkwell::String>(m_data); }

    // Text inserted into the output: undefined and null render as nothing
    [[nodiscard]] inkwell::String to_display_string() const;

    [[nodiscard]] bool operator==(const Value& other) const { return m_data == other.m_data; }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    struct Undefined {
        bool operator==(const Undefined&) const { return true; }
    };
    struct Null {
        bool operator==(const Null&) const { return true; }
    };

    std::variant<Undefined, Null, bool, f64, inkwell::String> m_data;
};

} // namespace inkwell::typewriter

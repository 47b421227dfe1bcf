#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <variant>
#include <type_traits>
#include <utility>
#include <functional>

namespace inkwell {

// ============================================================================
// Basic type aliases
// ============================================================================

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result type - For error handling without exceptions
// ============================================================================

template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

template<typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error<E>>>>
    Result(U&& value) : m_data(std::in_place_index<0>, std::forward<U>(value)) {}
    Result(Error<E> error) : m_data(std::in_place_index<1>, std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_data.index() == 1; }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] T& value() & { return std::get<0>(m_data); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_data); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_data); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(m_data)); }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(m_data);
        }
        return default_value;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), value());
        }
        return make_error(error());
    }

private:
    std::variant<T, E> m_data;
};

// Specialization for void value type
template<typename E>
class Result<void, E> {
public:
    using ValueType = void;
    using ErrorType = E;

    Result() : m_error(std::nullopt) {}
    Result(Error<E> error) : m_error(std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const E& error() const& { return *m_error; }

private:
    std::optional<E> m_error;
};

} // namespace inkwell

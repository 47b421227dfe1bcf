#include "inkwell/typewriter/value.hpp"
#include <cmath>
#include <limits>

namespace inkwell::typewriter {

ValueType Value::type() const {
    switch (m_data.index()) {
        case 0: return ValueType::Undefined;
        case 1: return ValueType::Null;
        case 2: return ValueType::Boolean;
        case 3: return ValueType::Number;
        default: return ValueType::String;
    }
}

inkwell::String Value::to_display_string() const {
    switch (type()) {
        case ValueType::Undefined:
        case ValueType::Null:
            return {};
        case ValueType::Boolean:
            return as_boolean() ? "true"_s : "false"_s;
        case ValueType::String:
            return as_string();
        case ValueType::Number:
            break;
    }

    f64 n = as_number();
    if (std::isnan(n)) return "NaN"_s;
    if (std::isinf(n)) return n > 0 ? "Infinity"_s : "-Infinity"_s;

    StringBuilder builder;
    if (std::trunc(n) == n && std::fabs(n) < static_cast<f64>(std::numeric_limits<i64>::max())) {
        builder.append(static_cast<i64>(n));
    } else {
        builder.append(n);
    }
    return builder.build();
}

} // namespace inkwell::typewriter

#pragma once

#include "inkwell/core/string.hpp"
#include <stdexcept>

namespace inkwell::typewriter {

// Raised synchronously for invalid engine options and invalid registrations
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const String& message)
        : std::invalid_argument(message.std_string()) {}
};

} // namespace inkwell::typewriter

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace smoothie
{

// Base class of every exception thrown by the library.
class Error : public std::runtime_error
{
   public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Invalid construction parameters or a dimensionality mismatch between a
// filter and the smoother it is attached to. Always raised at
// construction/attach time, never from the streaming path.
class ConfigurationError : public Error
{
   public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Operation not valid in the current state (get() before any sample).
class StateError : public Error
{
   public:
    explicit StateError(const std::string& what) : Error(what) {}
};

namespace detail
{

// Logs `message` on the "config" category and throws ConfigurationError.
[[noreturn]] void throw_configuration_error(std::string_view component, std::string_view message);

}   // namespace detail

}   // namespace smoothie

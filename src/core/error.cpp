#include <smoothie/error.hpp>
#include <smoothie/filter.hpp>
#include <smoothie/logger.hpp>
#include <string>

namespace smoothie
{

namespace detail
{

void throw_configuration_error(std::string_view component, std::string_view message)
{
    SMOOTHIE_LOG_ERROR("config", "{}: {}", component, message);

    std::string what(component);
    what += ": ";
    what += message;
    throw ConfigurationError(what);
}

}   // namespace detail

const char* dimension_name(Dimension dim)
{
    switch (dim)
    {
        case Dimension::One:
            return "1D";
        case Dimension::Two:
            return "2D";
    }
    return "?";
}

}   // namespace smoothie

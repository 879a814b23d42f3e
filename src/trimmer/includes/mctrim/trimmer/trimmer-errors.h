#pragma once

#include <stdexcept>
#include <string>

namespace mctrim::trimmer {

// Invalid setup detected before any container is touched
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

}  // namespace mctrim::trimmer

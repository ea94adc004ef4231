#pragma once
#include <stdexcept>
#include <string>

namespace seiscat {
    // invalid registry entry, template or criteria; nothing downstream can run
    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
    };
} // namespace seiscat

#pragma once
#include <stdexcept>
#include <string>

namespace pyguard {

// The isolation mechanism itself could not be set up. Aborts the whole request.
class InfrastructureError : public std::runtime_error {
public:
    explicit InfrastructureError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid configuration file or request options.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}

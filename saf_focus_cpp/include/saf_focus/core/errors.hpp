#pragma once

#include <stdexcept>
#include <string>

namespace saf_focus {

class SafFocusError : public std::runtime_error {
public:
    explicit SafFocusError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SafFocusError {
public:
    explicit ConfigError(const std::string& message)
        : SafFocusError("Config error: " + message) {}
};

class InvalidParameterError : public SafFocusError {
public:
    explicit InvalidParameterError(const std::string& message)
        : SafFocusError("Invalid parameter: " + message) {}
};

class DegenerateFitError : public SafFocusError {
public:
    explicit DegenerateFitError(const std::string& message)
        : SafFocusError("Degenerate fit: " + message) {}
};

class IOError : public SafFocusError {
public:
    explicit IOError(const std::string& message)
        : SafFocusError("I/O error: " + message) {}
};

} // namespace saf_focus

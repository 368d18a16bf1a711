#pragma once

#include <stdexcept>
#include <string>

// Malformed inbound data. Dropped and logged, never propagated past the pipeline.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidSnapshot : public InputError {
public:
    explicit InvalidSnapshot(const std::string& msg) : InputError("invalid snapshot: " + msg) {}
};

class InvalidSignal : public InputError {
public:
    explicit InvalidSignal(const std::string& msg) : InputError("invalid signal: " + msg) {}
};

// Rejected configuration. The previous configuration stays in force.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

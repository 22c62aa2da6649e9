#pragma once

#include <stdexcept>
#include <string>

namespace guardrail {

// Invalid threshold, path or template; raised before any traffic is served.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error("config: " + message) {}
};

// A pattern failed to compile. Patterns are compiled up front, so this only
// surfaces at start-up.
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& message) : std::runtime_error("detection: " + message) {}
};

class ClassifierError : public std::runtime_error {
public:
    explicit ClassifierError(const std::string& message) : std::runtime_error("classifier: " + message) {}
};

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error("transport: " + message) {}
};

} // namespace guardrail

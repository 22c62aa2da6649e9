#pragma once

#include "patterns.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace guardrail {

// Scores text against the compiled signatures. It only scores; whether a
// verdict blocks is decided by the Sanitizer.
class InjectionDetector {
public:
    // Throws ConfigError when sensitivity is outside [0, 1].
    InjectionDetector(std::shared_ptr<const PatternLibrary> library, double sensitivity);

    // The strongest matching signature, when its weight reaches the sensitivity.
    std::optional<InjectionVerdict> detect(const std::string& text) const;

    double sensitivity() const noexcept { return m_sensitivity; }

private:
    std::shared_ptr<const PatternLibrary> m_library;
    double m_sensitivity;
};

} // namespace guardrail

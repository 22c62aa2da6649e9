#include "../include/guardrail/injection.hpp"
#include "../include/guardrail/errors.hpp"

#include <algorithm>
#include <cmath>

namespace guardrail {

InjectionDetector::InjectionDetector(std::shared_ptr<const PatternLibrary> library, double sensitivity)
    : m_library(std::move(library)), m_sensitivity(sensitivity) {
    if (!std::isfinite(sensitivity) || sensitivity < 0.0 || sensitivity > 1.0) {
        throw ConfigError("injection sensitivity must be within [0, 1]");
    }
}

std::optional<InjectionVerdict> InjectionDetector::detect(const std::string& text) const {
    const InjectionSignature* strongest = nullptr;
    for (const auto& signature : m_library->injection_signatures()) {
        if (strongest && signature.weight <= strongest->weight) {
            continue;
        }
        if (std::regex_search(text, signature.regex)) {
            strongest = &signature;
        }
    }
    if (!strongest) {
        return std::nullopt;
    }

    // Max, not sum.
    const double score = std::clamp(strongest->weight, 0.0, 1.0);
    if (score < m_sensitivity) {
        return std::nullopt;
    }
    return InjectionVerdict{strongest->category, score, strongest->id};
}

} // namespace guardrail

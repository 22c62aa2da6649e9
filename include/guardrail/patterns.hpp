#pragma once

#include "config.hpp"
#include "types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace guardrail {

// Secondary check applied to a syntactic match before it is reported.
enum class MatchValidator {
    None,
    Luhn,
    Ssn
};

struct PiiPattern {
    PiiCategory category;
    std::regex regex;
    double confidence = 0.0;
    MatchValidator validator = MatchValidator::None;
    // Lower wins when two matches share start and length.
    int priority = 0;
};

struct InjectionSignature {
    std::string id;
    InjectionCategory category = InjectionCategory::Jailbreak;
    double weight = 0.0;
    std::regex regex;
};

// Every pattern the detectors use, compiled once for the enabled categories.
// Read-only after construction and safe to share between threads.
class PatternLibrary {
public:
    // Throws DetectionError when a built-in or caller-supplied pattern does not compile.
    PatternLibrary(const PiiConfig& pii, const InjectionConfig& injection);

    const std::vector<PiiPattern>& pii_patterns() const noexcept { return m_pii; }
    const std::vector<InjectionSignature>& injection_signatures() const noexcept { return m_signatures; }

private:
    std::vector<PiiPattern> m_pii;
    std::vector<InjectionSignature> m_signatures;

    void add_pii(PiiCategory category, const std::string& pattern, double confidence, MatchValidator validator, int priority);
    void add_signature(std::string id, InjectionCategory category, double weight, const std::string& pattern);
};

// Luhn checksum over the digits of the candidate; separators are skipped.
// Requires 13 to 19 digits.
bool luhn_valid(std::string_view candidate);

// AAA-GG-SSSS with area not 000, 666 or 9xx, group not 00, serial not 0000.
bool ssn_valid(std::string_view candidate);

} // namespace guardrail

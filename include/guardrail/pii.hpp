#pragma once

#include "patterns.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace guardrail {

class PiiDetector {
public:
    PiiDetector(std::shared_ptr<const PatternLibrary> library, std::string redaction_format);

    // Non-overlapping matches in left-to-right order. Where matches overlap,
    // the earlier one wins; at the same start the longer one wins.
    std::vector<PiiMatch> detect(const std::string& text) const;

    // Substitutes every match with its replacement. Matches must come from
    // detect() on the same text.
    Redacted redact(const std::string& text, const std::vector<PiiMatch>& matches) const;

    // The redaction template with {TYPE} replaced by the category name.
    std::string replacement_for(const PiiCategory& category) const;

private:
    std::shared_ptr<const PatternLibrary> m_library;
    std::string m_redaction_format;
};

} // namespace guardrail

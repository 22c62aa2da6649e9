#include "../include/guardrail/pii.hpp"
#include "../include/guardrail/digest.hpp"

#include <algorithm>

namespace guardrail {

namespace {

struct Candidate {
    PiiMatch match;
    int priority = 0;
};

bool passes_validator(MatchValidator validator, std::string_view excerpt) {
    switch (validator) {
    case MatchValidator::None: return true;
    case MatchValidator::Luhn: return luhn_valid(excerpt);
    case MatchValidator::Ssn: return ssn_valid(excerpt);
    }
    return true;
}

} // namespace

PiiDetector::PiiDetector(std::shared_ptr<const PatternLibrary> library, std::string redaction_format)
    : m_library(std::move(library)), m_redaction_format(std::move(redaction_format)) {}

std::vector<PiiMatch> PiiDetector::detect(const std::string& text) const {
    std::vector<Candidate> candidates;
    for (const auto& pattern : m_library->pii_patterns()) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) {
                continue;
            }
            const std::size_t start = static_cast<std::size_t>(m.position(0));
            const std::size_t end = start + static_cast<std::size_t>(m.length(0));
            if (!passes_validator(pattern.validator, std::string_view(text).substr(start, end - start))) {
                continue;
            }
            candidates.push_back(Candidate{PiiMatch{pattern.category, Span{start, end}, pattern.confidence}, pattern.priority});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& lhs, const Candidate& rhs) {
        if (lhs.match.span.start != rhs.match.span.start) {
            return lhs.match.span.start < rhs.match.span.start;
        }
        if (lhs.match.span.length() != rhs.match.span.length()) {
            return lhs.match.span.length() > rhs.match.span.length();
        }
        return lhs.priority < rhs.priority;
    });

    std::vector<PiiMatch> matches;
    std::size_t covered_until = 0;
    for (auto& candidate : candidates) {
        if (!matches.empty() && candidate.match.span.start < covered_until) {
            continue;
        }
        covered_until = candidate.match.span.end;
        matches.push_back(std::move(candidate.match));
    }
    return matches;
}

Redacted PiiDetector::redact(const std::string& text, const std::vector<PiiMatch>& matches) const {
    Redacted result;
    result.redactions.reserve(matches.size());
    for (const auto& match : matches) {
        Redaction redaction;
        redaction.category = match.category;
        redaction.span = match.span;
        redaction.original_excerpt_hash = sha256_hex(std::string_view(text).substr(match.span.start, match.span.length()));
        redaction.replacement = replacement_for(match.category);
        result.redactions.push_back(std::move(redaction));
    }

    // Right to left so the offsets of earlier spans stay valid.
    result.text = text;
    for (auto it = result.redactions.rbegin(); it != result.redactions.rend(); ++it) {
        result.text.replace(it->span.start, it->span.length(), it->replacement);
    }
    return result;
}

std::string PiiDetector::replacement_for(const PiiCategory& category) const {
    static const std::string kPlaceholder = "{TYPE}";
    const std::string name = category.name();
    std::string replacement = m_redaction_format;
    std::size_t pos = 0;
    while ((pos = replacement.find(kPlaceholder, pos)) != std::string::npos) {
        replacement.replace(pos, kPlaceholder.size(), name);
        pos += name.size();
    }
    return replacement;
}

} // namespace guardrail

#pragma once

#include "audit.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "injection.hpp"
#include "patterns.hpp"
#include "pii.hpp"
#include "rate_limit.hpp"
#include "types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace guardrail {

inline const std::string kDefaultIdentity = "default";

// Whether sanitize() still has to spend a rate-limit token on the text.
enum class Admission {
    Check,  // one token per call
    Granted // the caller spent it through admit() for the unit this text belongs to
};

// Composes rate limiting, injection scoring, PII redaction and the optional
// classifier into one verdict per text unit, and audits every verdict.
// Safe to call from several threads at once.
class Sanitizer {
public:
    // Validates the config (ConfigError) and compiles every pattern
    // (DetectionError). When the classifier is enabled and none is given, a
    // remote one is built from config.classifier.
    explicit Sanitizer(GuardConfig config,
                       ClassifierPtr classifier = nullptr,
                       RateLimiter::Clock clock = RateLimiter::Clock());

    Sanitizer(const Sanitizer&) = delete;
    Sanitizer& operator=(const Sanitizer&) = delete;

    SanitizeResult sanitize(const std::string& text,
                            Direction direction,
                            const std::string& identity = kDefaultIdentity,
                            const std::atomic<bool>* cancelled = nullptr,
                            Admission admission = Admission::Check);

    // Spends the single rate-limit token of a unit that is sanitized in
    // several pieces, such as a request body or a JSON-RPC message. Returns
    // the audited block when `identity` is out of tokens, nullopt when it was
    // admitted or `direction` is not metered. `content` only feeds the audit
    // record.
    std::optional<Blocked> admit(const std::string& identity, Direction direction, const std::string& content = {});

    SanitizeResult sanitize_input(const std::string& text, const std::string& identity = kDefaultIdentity) {
        return sanitize(text, Direction::Input, identity);
    }
    SanitizeResult sanitize_output(const std::string& text, const std::string& identity = kDefaultIdentity) {
        return sanitize(text, Direction::Output, identity);
    }

    const GuardConfig& config() const noexcept { return m_config; }
    AuditRecorder& audit() noexcept { return *m_audit; }
    RateLimiter* rate_limiter() noexcept { return m_rate_limiter.get(); }
    const PiiDetector& pii() const noexcept { return m_pii; }
    const InjectionDetector& injection() const noexcept { return m_injection; }

private:
    GuardConfig m_config;
    std::shared_ptr<const PatternLibrary> m_library;
    PiiDetector m_pii;
    InjectionDetector m_injection;
    std::unique_ptr<RateLimiter> m_rate_limiter;
    std::unique_ptr<AuditRecorder> m_audit;
    ClassifierPtr m_classifier;

    std::optional<Blocked> take_token(const std::string& identity, Direction direction);
    SanitizeResult evaluate(const std::string& text,
                            Direction direction,
                            const std::string& identity,
                            const std::atomic<bool>* cancelled,
                            Admission admission,
                            AuditRecord& record);
    void write_audit(const std::string& text,
                     Direction direction,
                     const std::string& identity,
                     const SanitizeResult& result,
                     AuditRecord record);
    std::optional<Blocked> consult_classifier(const std::string& text,
                                              Direction direction,
                                              const std::atomic<bool>* cancelled);
};

} // namespace guardrail

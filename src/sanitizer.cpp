#include "../include/guardrail/sanitizer.hpp"
#include "../include/guardrail/digest.hpp"
#include "../include/guardrail/errors.hpp"
#include "../include/guardrail/log.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace guardrail {

namespace {

const GuardConfig& validated(const GuardConfig& config) {
    validate(config);
    return config;
}

std::string describe(const char* what, InjectionCategory category, double score) {
    std::ostringstream oss;
    oss << what << " (" << category_name(category) << ", score " << std::fixed << std::setprecision(2) << score << ')';
    return oss.str();
}

} // namespace

Sanitizer::Sanitizer(GuardConfig config, ClassifierPtr classifier, RateLimiter::Clock clock)
    : m_config(std::move(config))
    , m_library(std::make_shared<const PatternLibrary>(validated(m_config).pii, m_config.injection))
    , m_pii(m_library, m_config.pii.redaction_format)
    , m_injection(m_library, m_config.injection.sensitivity)
    , m_audit(std::make_unique<AuditRecorder>(m_config.audit))
    , m_classifier(std::move(classifier)) {
    if (m_config.rate_limit.enabled) {
        m_rate_limiter = std::make_unique<RateLimiter>(m_config.rate_limit, std::move(clock));
    }
    if (m_config.classifier.enabled && !m_classifier) {
        m_classifier = make_remote_classifier(m_config.classifier);
    }
    if (!m_config.classifier.enabled) {
        m_classifier.reset();
    }
}

SanitizeResult Sanitizer::sanitize(const std::string& text,
                                   Direction direction,
                                   const std::string& identity,
                                   const std::atomic<bool>* cancelled,
                                   Admission admission) {
    AuditRecord record;
    SanitizeResult result = evaluate(text, direction, identity, cancelled, admission, record);

    if (const auto* blocked = std::get_if<Blocked>(&result)) {
        if (direction == Direction::Output && blocked->reason != BlockReason::RateLimited && m_rate_limiter &&
            m_config.policy.refund_on_output_block) {
            m_rate_limiter->refund(identity);
        }
    }

    write_audit(text, direction, identity, result, std::move(record));
    return result;
}

std::optional<Blocked> Sanitizer::admit(const std::string& identity, Direction direction, const std::string& content) {
    std::optional<Blocked> blocked = take_token(identity, direction);
    if (blocked) {
        write_audit(content, direction, identity, *blocked, AuditRecord());
    }
    return blocked;
}

std::optional<Blocked> Sanitizer::take_token(const std::string& identity, Direction direction) {
    if (!m_rate_limiter || (direction == Direction::Output && !m_config.policy.rate_limit_output)) {
        return std::nullopt;
    }
    if (m_rate_limiter->admit(identity)) {
        return std::nullopt;
    }
    Blocked blocked;
    blocked.reason = BlockReason::RateLimited;
    blocked.message = "Rate limit exceeded";
    return blocked;
}

void Sanitizer::write_audit(const std::string& text,
                            Direction direction,
                            const std::string& identity,
                            const SanitizeResult& result,
                            AuditRecord record) {
    if (!m_audit->enabled()) {
        return;
    }
    record.timestamp = timestamp_utc();
    record.identity = identity;
    record.direction = direction;
    record.verdict = verdict_name(result);
    record.content_hash = sha256_hex(text);
    if (const auto* blocked = std::get_if<Blocked>(&result)) {
        record.category = blocked->category ? category_name(*blocked->category) : block_reason_name(blocked->reason);
        record.score = blocked->score;
    } else if (const auto* redacted = std::get_if<Redacted>(&result)) {
        record.redaction_categories.clear();
        for (const auto& redaction : redacted->redactions) {
            record.redaction_categories.push_back(redaction.category.name());
        }
        record.category = record.redaction_categories.front();
    }
    if (m_audit->log_content()) {
        record.content = text;
    }
    m_audit->record(std::move(record));
}

SanitizeResult Sanitizer::evaluate(const std::string& text,
                                   Direction direction,
                                   const std::string& identity,
                                   const std::atomic<bool>* cancelled,
                                   Admission admission,
                                   AuditRecord& record) {
    // 1. Rate limit before any detector runs.
    if (admission == Admission::Check) {
        if (auto blocked = take_token(identity, direction)) {
            return *blocked;
        }
    }

    // 2. Injection and unsafe content take priority over redaction.
    if (m_config.injection.enabled) {
        if (auto verdict = m_injection.detect(text)) {
            const bool non_redactable = is_non_redactable(verdict->category);
            if (m_config.injection.block_on_detection || non_redactable) {
                Blocked blocked;
                blocked.reason = non_redactable ? BlockReason::UnsafeContent : BlockReason::Injection;
                blocked.message = describe(non_redactable ? "Unsafe content detected" : "Prompt injection detected",
                                           verdict->category, verdict->score);
                blocked.category = verdict->category;
                blocked.score = verdict->score;
                return blocked;
            }
            record.flagged = category_name(verdict->category);
            log_debug("sanitizer", "injection signature " + verdict->matched_pattern + " flagged without blocking");
        }
    }

    // 3. PII redaction.
    SanitizeResult result = Clean{text};
    if (m_config.pii.enabled) {
        const std::vector<PiiMatch> matches = m_pii.detect(text);
        if (!matches.empty()) {
            result = m_pii.redact(text, matches);
        }
    }

    // 4. The classifier may still override with a block.
    if (m_classifier) {
        if (auto blocked = consult_classifier(text, direction, cancelled)) {
            if (m_config.policy.audit_redactions_on_override) {
                if (const auto* redacted = std::get_if<Redacted>(&result)) {
                    for (const auto& redaction : redacted->redactions) {
                        record.redaction_categories.push_back(redaction.category.name());
                    }
                }
            }
            return *blocked;
        }
    }
    return result;
}

std::optional<Blocked> Sanitizer::consult_classifier(const std::string& text,
                                                     Direction direction,
                                                     const std::atomic<bool>* cancelled) {
    try {
        const ClassifierVerdict verdict = m_classifier->classify(text, direction, cancelled);
        if (verdict.safe || verdict.score < m_config.classifier.threshold) {
            return std::nullopt;
        }
        Blocked blocked;
        blocked.reason = BlockReason::Classifier;
        blocked.category = verdict.category;
        blocked.score = verdict.score;
        if (verdict.category) {
            blocked.message = describe("Unsafe content classified", *verdict.category, verdict.score);
        } else {
            blocked.message = "Unsafe content classified (" + verdict.label + ")";
        }
        return blocked;
    } catch (const ClassifierError& ex) {
        // Unavailability never blocks on its own.
        log_warn("sanitizer", std::string("classifier unavailable, continuing without it: ") + ex.what());
        return std::nullopt;
    }
}

} // namespace guardrail

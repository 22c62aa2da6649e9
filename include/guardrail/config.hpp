#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace guardrail {

struct CustomPiiPattern {
    std::string name;
    std::string pattern;
};

struct PiiConfig {
    bool enabled = true;
    bool detect_ssn = true;
    bool detect_credit_card = true;
    bool detect_email = true;
    bool detect_phone = true;
    bool detect_ip = true;
    bool detect_api_keys = true;
    std::string redaction_format = "[REDACTED:{TYPE}]";
    std::vector<CustomPiiPattern> custom_patterns;
};

struct InjectionConfig {
    bool enabled = true;
    bool block_on_detection = true;
    double sensitivity = 0.7;
    std::vector<std::string> custom_patterns;
};

struct RateLimitConfig {
    bool enabled = false;
    double requests_per_minute = 60.0;
    double burst_size = 10.0;
    std::chrono::seconds idle_eviction{600};
};

struct AuditConfig {
    bool enabled = false;
    std::optional<std::string> log_file;
    bool log_content = false;
};

struct ClassifierConfig {
    bool enabled = false;
    std::string endpoint;
    std::string api_key;
    double threshold = 0.8;
    long timeout_ms = 5000;
};

// Choices the composition rules leave to the operator.
struct PolicyConfig {
    // Output-direction calls consume rate-limit tokens too.
    bool rate_limit_output = false;
    // A blocked output gives the token spent on its request back.
    bool refund_on_output_block = false;
    // Keep redaction details in the audit record when the classifier overrides them.
    bool audit_redactions_on_override = true;
};

struct GuardConfig {
    PiiConfig pii;
    InjectionConfig injection;
    RateLimitConfig rate_limit;
    AuditConfig audit;
    ClassifierConfig classifier;
    PolicyConfig policy;
};

GuardConfig default_config();
// PII redaction only; injection, rate limiting, audit and classifier off.
GuardConfig pii_only();
GuardConfig with_injection(double sensitivity = 0.7, bool block_on_detection = true);
GuardConfig with_rate_limit(GuardConfig config, double requests_per_minute, double burst_size);
GuardConfig with_audit(GuardConfig config, std::optional<std::string> log_file, bool log_content = false);
GuardConfig minimal();

// Throws ConfigError on the first invalid field.
void validate(const GuardConfig& config);

// GUARDRAIL_CLASSIFIER_ENDPOINT, GUARDRAIL_CLASSIFIER_API_KEY, GUARDRAIL_AUDIT_LOG.
GuardConfig apply_environment(GuardConfig config);

std::string read_environment_variable(const char* name);

} // namespace guardrail

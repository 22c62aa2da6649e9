#include "../include/guardrail/config.hpp"
#include "../include/guardrail/errors.hpp"

#include <cmath>
#include <cstdlib>

namespace guardrail {

namespace {

bool in_unit_interval(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

GuardConfig default_config() {
    return GuardConfig{};
}

GuardConfig pii_only() {
    GuardConfig config;
    config.injection.enabled = false;
    config.rate_limit.enabled = false;
    config.audit.enabled = false;
    config.classifier.enabled = false;
    return config;
}

GuardConfig with_injection(double sensitivity, bool block_on_detection) {
    GuardConfig config;
    config.injection.enabled = true;
    config.injection.sensitivity = sensitivity;
    config.injection.block_on_detection = block_on_detection;
    return config;
}

GuardConfig with_rate_limit(GuardConfig config, double requests_per_minute, double burst_size) {
    config.rate_limit.enabled = true;
    config.rate_limit.requests_per_minute = requests_per_minute;
    config.rate_limit.burst_size = burst_size;
    return config;
}

GuardConfig with_audit(GuardConfig config, std::optional<std::string> log_file, bool log_content) {
    config.audit.enabled = true;
    config.audit.log_file = std::move(log_file);
    config.audit.log_content = log_content;
    return config;
}

GuardConfig minimal() {
    GuardConfig config;
    config.pii.enabled = false;
    config.injection.enabled = false;
    config.rate_limit.enabled = false;
    config.audit.enabled = false;
    config.classifier.enabled = false;
    return config;
}

void validate(const GuardConfig& config) {
    if (config.pii.enabled) {
        if (config.pii.redaction_format.empty()) {
            throw ConfigError("redaction_format must not be empty");
        }
        if (config.pii.redaction_format.find("{TYPE}") == std::string::npos) {
            throw ConfigError("redaction_format must contain a {TYPE} placeholder");
        }
        for (const auto& custom : config.pii.custom_patterns) {
            if (custom.name.empty() || custom.pattern.empty()) {
                throw ConfigError("custom PII patterns need a name and a pattern");
            }
        }
    }
    if (!in_unit_interval(config.injection.sensitivity)) {
        throw ConfigError("injection sensitivity must be within [0, 1]");
    }
    if (config.rate_limit.enabled) {
        if (!(config.rate_limit.requests_per_minute > 0.0) || !std::isfinite(config.rate_limit.requests_per_minute)) {
            throw ConfigError("requests_per_minute must be positive");
        }
        if (!(config.rate_limit.burst_size >= 1.0) || !std::isfinite(config.rate_limit.burst_size)) {
            throw ConfigError("burst_size must be at least 1");
        }
        if (config.rate_limit.idle_eviction.count() <= 0) {
            throw ConfigError("idle_eviction must be positive");
        }
    }
    if (config.audit.enabled && config.audit.log_file && config.audit.log_file->empty()) {
        throw ConfigError("audit log_file must not be an empty path");
    }
    if (config.classifier.enabled) {
        if (config.classifier.endpoint.empty()) {
            throw ConfigError("classifier endpoint is required when the classifier is enabled");
        }
        if (!in_unit_interval(config.classifier.threshold)) {
            throw ConfigError("classifier threshold must be within [0, 1]");
        }
        if (config.classifier.timeout_ms <= 0) {
            throw ConfigError("classifier timeout_ms must be positive");
        }
    }
}

std::string read_environment_variable(const char* name) {
    if (const char* raw = std::getenv(name)) {
        return std::string(raw);
    }
    return {};
}

GuardConfig apply_environment(GuardConfig config) {
    const std::string endpoint = read_environment_variable("GUARDRAIL_CLASSIFIER_ENDPOINT");
    if (!endpoint.empty()) {
        config.classifier.enabled = true;
        config.classifier.endpoint = endpoint;
    }
    const std::string api_key = read_environment_variable("GUARDRAIL_CLASSIFIER_API_KEY");
    if (!api_key.empty()) {
        config.classifier.api_key = api_key;
    }
    const std::string audit_log = read_environment_variable("GUARDRAIL_AUDIT_LOG");
    if (!audit_log.empty()) {
        config.audit.enabled = true;
        config.audit.log_file = audit_log;
    }
    return config;
}

} // namespace guardrail

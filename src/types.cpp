#include "../include/guardrail/types.hpp"

#include <algorithm>
#include <cctype>

namespace guardrail {

std::string PiiCategory::name() const {
    switch (kind) {
    case PiiKind::Ssn: return "SSN";
    case PiiKind::CreditCard: return "CREDIT_CARD";
    case PiiKind::Email: return "EMAIL";
    case PiiKind::Phone: return "PHONE";
    case PiiKind::IpAddress: return "IP_ADDRESS";
    case PiiKind::ApiKey: return "API_KEY";
    case PiiKind::Custom: break;
    }
    std::string upper = custom_name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper;
}

std::string direction_name(Direction direction) {
    return direction == Direction::Input ? "input" : "output";
}

std::string category_name(InjectionCategory category) {
    switch (category) {
    case InjectionCategory::Jailbreak: return "JAILBREAK";
    case InjectionCategory::SystemLeak: return "SYSTEM_LEAK";
    case InjectionCategory::Violent: return "VIOLENT";
    case InjectionCategory::Illegal: return "ILLEGAL";
    case InjectionCategory::Sexual: return "SEXUAL";
    case InjectionCategory::SelfHarm: return "SELF_HARM";
    case InjectionCategory::Unethical: return "UNETHICAL";
    }
    return "JAILBREAK";
}

std::string block_reason_name(BlockReason reason) {
    switch (reason) {
    case BlockReason::RateLimited: return "rate_limited";
    case BlockReason::Injection: return "injection";
    case BlockReason::UnsafeContent: return "unsafe_content";
    case BlockReason::Classifier: return "classifier";
    case BlockReason::Internal: return "internal";
    }
    return "injection";
}

bool is_non_redactable(InjectionCategory category) noexcept {
    switch (category) {
    case InjectionCategory::Violent:
    case InjectionCategory::Illegal:
    case InjectionCategory::Sexual:
    case InjectionCategory::SelfHarm:
        return true;
    default:
        return false;
    }
}

std::string verdict_name(const SanitizeResult& result) {
    if (is_clean(result)) {
        return "clean";
    }
    if (is_redacted(result)) {
        return "redacted";
    }
    return "blocked";
}

const std::string* forwardable_text(const SanitizeResult& result) {
    if (const auto* clean = std::get_if<Clean>(&result)) {
        return &clean->text;
    }
    if (const auto* redacted = std::get_if<Redacted>(&result)) {
        return &redacted->text;
    }
    return nullptr;
}

} // namespace guardrail

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace guardrail {

enum class Direction {
    Input,
    Output
};

enum class PiiKind {
    Ssn,
    CreditCard,
    Email,
    Phone,
    IpAddress,
    ApiKey,
    Custom
};

struct PiiCategory {
    PiiKind kind = PiiKind::Custom;
    std::string custom_name; // only for PiiKind::Custom

    // Upper-case name interpolated into the redaction template.
    std::string name() const;

    bool operator==(const PiiCategory& other) const {
        return kind == other.kind && custom_name == other.custom_name;
    }
    bool operator!=(const PiiCategory& other) const { return !(*this == other); }
};

inline PiiCategory custom_category(std::string name) {
    return PiiCategory{PiiKind::Custom, std::move(name)};
}

// Half-open byte range [start, end) into the original text.
struct Span {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t length() const noexcept { return end - start; }
};

struct PiiMatch {
    PiiCategory category;
    Span span;
    double confidence = 0.0;
};

struct Redaction {
    PiiCategory category;
    Span span;
    std::string original_excerpt_hash;
    std::string replacement;
};

enum class InjectionCategory {
    Jailbreak,
    SystemLeak,
    Violent,
    Illegal,
    Sexual,
    SelfHarm,
    Unethical
};

struct InjectionVerdict {
    InjectionCategory category = InjectionCategory::Jailbreak;
    double score = 0.0;
    std::string matched_pattern;
};

enum class BlockReason {
    RateLimited,
    Injection,
    UnsafeContent,
    Classifier,
    Internal // the unit could not be inspected and fails closed
};

struct Clean {
    std::string text;
};

struct Redacted {
    std::string text;
    std::vector<Redaction> redactions;
};

// Carries no residual text by construction.
struct Blocked {
    BlockReason reason = BlockReason::Injection;
    std::string message;
    std::optional<InjectionCategory> category;
    double score = 0.0;
};

using SanitizeResult = std::variant<Clean, Redacted, Blocked>;

std::string direction_name(Direction direction);
std::string category_name(InjectionCategory category);
std::string block_reason_name(BlockReason reason);

// Violent, Illegal, Sexual and SelfHarm content cannot be made safe by redaction.
bool is_non_redactable(InjectionCategory category) noexcept;

inline bool is_clean(const SanitizeResult& result) { return std::holds_alternative<Clean>(result); }
inline bool is_redacted(const SanitizeResult& result) { return std::holds_alternative<Redacted>(result); }
inline bool is_blocked(const SanitizeResult& result) { return std::holds_alternative<Blocked>(result); }

// "clean", "redacted" or "blocked".
std::string verdict_name(const SanitizeResult& result);

// Text to forward for Clean/Redacted; nullptr for Blocked.
const std::string* forwardable_text(const SanitizeResult& result);

} // namespace guardrail

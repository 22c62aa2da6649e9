#pragma once

#include "../json.hpp"
#include "../sanitizer.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

namespace guardrail::transport {

// Everything a JSON walk needs to sanitize one string in place. The walk
// belongs to one unit whose rate-limit token was already spent through
// Sanitizer::admit, so fields never spend tokens of their own.
struct FieldContext {
    Sanitizer& sanitizer;
    Direction direction;
    const std::string& identity;
    const std::atomic<bool>* cancelled = nullptr;
    std::size_t redactions = 0;
};

// Sanitizes one string in place; returns the verdict when it is Blocked.
std::optional<Blocked> sanitize_field(FieldContext& ctx, std::string& text);

// Chat-completion bodies: string `content` and `text` fields are sanitized,
// arrays under `content` and the `messages`, `choices`, `message` and `delta`
// members are walked. Stops at the first blocked field.
std::optional<Blocked> sanitize_chat_body(FieldContext& ctx, Json& body);

// Generic content walk: strings held by `content`, `text` or `value` keys and
// strings sitting directly in arrays are sanitized; every nested object and
// array is walked. A bare string value is sanitized as is.
std::optional<Blocked> sanitize_content_fields(FieldContext& ctx, Json& value);

} // namespace guardrail::transport

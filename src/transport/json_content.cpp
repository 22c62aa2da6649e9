#include "../../include/guardrail/transport/json_content.hpp"

#include <variant>

namespace guardrail::transport {

namespace {

const char* const kChatMembers[] = {"messages", "choices", "message", "delta"};

bool is_content_key(const std::string& key) {
    return key == "content" || key == "text" || key == "value";
}

} // namespace

std::optional<Blocked> sanitize_field(FieldContext& ctx, std::string& text) {
    SanitizeResult result = ctx.sanitizer.sanitize(text, ctx.direction, ctx.identity, ctx.cancelled, Admission::Granted);
    if (auto* blocked = std::get_if<Blocked>(&result)) {
        return std::move(*blocked);
    }
    if (auto* redacted = std::get_if<Redacted>(&result)) {
        ctx.redactions += redacted->redactions.size();
        text = std::move(redacted->text);
    } else {
        text = std::move(std::get<Clean>(result).text);
    }
    return std::nullopt;
}

std::optional<Blocked> sanitize_chat_body(FieldContext& ctx, Json& body) {
    if (body.is_array()) {
        for (auto& item : body.as_array()) {
            if (auto blocked = sanitize_chat_body(ctx, item)) {
                return blocked;
            }
        }
        return std::nullopt;
    }
    if (!body.is_object()) {
        return std::nullopt;
    }

    if (Json* content = body.find("content")) {
        if (content->is_string()) {
            if (auto blocked = sanitize_field(ctx, content->as_string())) {
                return blocked;
            }
        } else if (content->is_array()) {
            if (auto blocked = sanitize_chat_body(ctx, *content)) {
                return blocked;
            }
        }
    }
    if (Json* text = body.find("text"); text && text->is_string()) {
        if (auto blocked = sanitize_field(ctx, text->as_string())) {
            return blocked;
        }
    }
    for (const char* member : kChatMembers) {
        if (Json* nested = body.find(member)) {
            if (auto blocked = sanitize_chat_body(ctx, *nested)) {
                return blocked;
            }
        }
    }
    return std::nullopt;
}

std::optional<Blocked> sanitize_content_fields(FieldContext& ctx, Json& value) {
    if (value.is_string()) {
        return sanitize_field(ctx, value.as_string());
    }
    if (value.is_array()) {
        for (auto& item : value.as_array()) {
            if (auto blocked = sanitize_content_fields(ctx, item)) {
                return blocked;
            }
        }
        return std::nullopt;
    }
    if (!value.is_object()) {
        return std::nullopt;
    }
    for (auto& [key, member] : value.as_object()) {
        if (member.is_string()) {
            if (!is_content_key(key)) {
                continue;
            }
            if (auto blocked = sanitize_field(ctx, member.as_string())) {
                return blocked;
            }
        } else if (member.is_object() || member.is_array()) {
            if (auto blocked = sanitize_content_fields(ctx, member)) {
                return blocked;
            }
        }
    }
    return std::nullopt;
}

} // namespace guardrail::transport

#include "../../include/guardrail/transport/relay.hpp"

#include <variant>

namespace guardrail::transport {

Filtered<std::string> filter_text(Sanitizer& sanitizer,
                                  const std::string& text,
                                  Direction direction,
                                  const std::string& identity,
                                  const std::atomic<bool>* cancelled,
                                  Admission admission) {
    Filtered<std::string> out;
    SanitizeResult result = sanitizer.sanitize(text, direction, identity, cancelled, admission);
    if (auto* blocked = std::get_if<Blocked>(&result)) {
        out.blocked = std::move(*blocked);
    } else if (auto* redacted = std::get_if<Redacted>(&result)) {
        out.redactions = redacted->redactions.size();
        out.unit = std::move(redacted->text);
    } else {
        out.unit = std::move(std::get<Clean>(result).text);
    }
    return out;
}

} // namespace guardrail::transport

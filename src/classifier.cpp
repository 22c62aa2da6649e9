#include "../include/guardrail/classifier.hpp"
#include "../include/guardrail/errors.hpp"
#include "../include/guardrail/json.hpp"
#include "../include/guardrail/net/http.hpp"

#include <algorithm>
#include <cctype>

namespace {

using guardrail::ClassifierVerdict;
using guardrail::Json;
using guardrail::JsonObject;

std::string normalise_label(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    for (unsigned char c : label) {
        if (c == '-' || c == ' ' || c == '/') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

ClassifierVerdict parse_flat_reply(const Json& reply) {
    ClassifierVerdict verdict;
    if (const Json* label = reply.find("category"); label && label->is_string()) {
        verdict.label = label->as_string();
        verdict.category = guardrail::parse_safety_category(verdict.label);
    }
    if (const Json* score = reply.find("score"); score && score->is_number()) {
        verdict.score = score->as_number();
    }
    if (const Json* safe = reply.find("safe"); safe && safe->is_bool()) {
        verdict.safe = safe->as_bool();
    } else {
        verdict.safe = !verdict.category.has_value();
    }
    return verdict;
}

// {"results":[{"flagged":true,"category_scores":{"violence":0.97,...}}]}
ClassifierVerdict parse_moderation_reply(const Json& reply) {
    ClassifierVerdict verdict;
    const Json* results = reply.find("results");
    if (!results || !results->is_array() || results->as_array().empty()) {
        throw guardrail::ClassifierError("moderation reply without results");
    }
    const Json& first = results->as_array().front();
    if (const Json* flagged = first.find("flagged"); flagged && flagged->is_bool()) {
        verdict.safe = !flagged->as_bool();
    }
    if (const Json* scores = first.find("category_scores"); scores && scores->is_object()) {
        for (const auto& [name, value] : scores->as_object()) {
            if (!value.is_number() || value.as_number() <= verdict.score) {
                continue;
            }
            auto category = guardrail::parse_safety_category(name);
            if (!category) {
                continue;
            }
            verdict.score = value.as_number();
            verdict.category = category;
            verdict.label = name;
        }
    }
    return verdict;
}

class RemoteClassifier final : public guardrail::ContentClassifier {
public:
    explicit RemoteClassifier(guardrail::ClassifierConfig config) : m_config(std::move(config)) {}

    ClassifierVerdict classify(const std::string& text,
                               guardrail::Direction direction,
                               const std::atomic<bool>* cancelled) override {
        JsonObject payload;
        payload["input"] = Json(text);
        payload["direction"] = Json(guardrail::direction_name(direction));

        guardrail::net::HeaderList headers;
        if (!m_config.api_key.empty()) {
            headers.emplace_back("Authorization", "Bearer " + m_config.api_key);
        }

        std::string raw;
        try {
            raw = guardrail::net::post_json(m_config.endpoint, Json(payload).dump(), headers, m_config.timeout_ms, cancelled);
        } catch (const guardrail::TransportError& ex) {
            throw guardrail::ClassifierError(ex.what());
        }

        Json reply;
        try {
            reply = Json::parse(raw);
        } catch (const std::exception& ex) {
            throw guardrail::ClassifierError(std::string("unparseable reply: ") + ex.what());
        }
        if (!reply.is_object()) {
            throw guardrail::ClassifierError("reply is not an object");
        }
        if (reply.find("results")) {
            return parse_moderation_reply(reply);
        }
        return parse_flat_reply(reply);
    }

private:
    guardrail::ClassifierConfig m_config;
};

} // namespace

namespace guardrail {

ClassifierPtr make_remote_classifier(const ClassifierConfig& config) {
    return std::make_unique<RemoteClassifier>(config);
}

std::optional<InjectionCategory> parse_safety_category(const std::string& label) {
    const std::string name = normalise_label(label);
    if (name == "jailbreak" || name == "prompt_injection") {
        return InjectionCategory::Jailbreak;
    }
    if (name == "system_leak" || name == "systemleak") {
        return InjectionCategory::SystemLeak;
    }
    if (name == "violent" || name == "violence" || name == "violence_graphic") {
        return InjectionCategory::Violent;
    }
    if (name == "illegal" || name == "illicit" || name == "illicit_violent") {
        return InjectionCategory::Illegal;
    }
    if (name == "sexual" || name == "sexual_minors") {
        return InjectionCategory::Sexual;
    }
    if (name == "self_harm" || name == "selfharm" || name == "self_harm_intent" || name == "self_harm_instructions") {
        return InjectionCategory::SelfHarm;
    }
    if (name == "unethical" || name == "hate" || name == "harassment" || name == "hate_threatening" || name == "harassment_threatening") {
        return InjectionCategory::Unethical;
    }
    return std::nullopt;
}

} // namespace guardrail

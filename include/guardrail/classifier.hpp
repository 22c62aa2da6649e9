#pragma once

#include "config.hpp"
#include "types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace guardrail {

struct ClassifierVerdict {
    bool safe = true;
    std::optional<InjectionCategory> category;
    double score = 0.0;
    std::string label;
};

// Remote safety classification. Implementations throw ClassifierError when
// the remote call fails; callers treat that as "no verdict".
struct ContentClassifier {
    virtual ~ContentClassifier() = default;
    virtual ClassifierVerdict classify(const std::string& text,
                                       Direction direction,
                                       const std::atomic<bool>* cancelled) = 0;
};

using ClassifierPtr = std::unique_ptr<ContentClassifier>;

// POSTs {"input","direction"} to config.endpoint. Understands a flat
// {"safe","category","score"} reply and the moderation-style
// {"results":[{"flagged","category_scores"}]} reply.
ClassifierPtr make_remote_classifier(const ClassifierConfig& config);

// Maps a classifier label ("violent", "self-harm", "SELF_HARM", ...) onto a category.
std::optional<InjectionCategory> parse_safety_category(const std::string& label);

} // namespace guardrail

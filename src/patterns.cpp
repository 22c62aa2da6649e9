#include "../include/guardrail/patterns.hpp"
#include "../include/guardrail/errors.hpp"

#include <cctype>

namespace guardrail {

namespace {

constexpr auto kPiiFlags = std::regex::ECMAScript | std::regex::optimize;
constexpr auto kSignatureFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

struct SignatureSpec {
    const char* id;
    InjectionCategory category;
    double weight;
    const char* pattern;
};

// Gap allowed between the words of a phrase, kept within one sentence.
#define GR_GAP "[^.\\n]{0,40}?"
// Every repetition is bounded: std::regex matches recursively, one stack frame
// per repeated character.
#define GR_WS "\\s{1,16}"
#define GR_HOW_TO "\\bhow" GR_WS "(?:do" GR_WS "i" GR_WS "|to" GR_WS "|can" GR_WS "i" GR_WS ")"

const SignatureSpec kBuiltinSignatures[] = {
    {"ignore_instructions", InjectionCategory::Jailbreak, 0.9,
     "\\b(?:ignore|disregard|forget|skip)\\b" GR_GAP "\\b(?:previous|prior|above|earlier|preceding|all)\\b" GR_GAP
     "\\b(?:instructions?|prompts?|rules|directions|guidelines|context)\\b"},
    {"override_safety", InjectionCategory::Jailbreak, 0.8,
     "\\b(?:override|bypass|disable|circumvent)\\b" GR_GAP
     "\\b(?:safety|rules|restrictions|guidelines|guardrails|filters?|content polic(?:y|ies))\\b"},
    {"reveal_system_prompt", InjectionCategory::SystemLeak, 0.95,
     "\\b(?:reveal|show|print|display|repeat|output|leak|dump|tell me|give me)\\b" GR_GAP
     "\\b(?:system|hidden|initial|original|secret|developer)" GR_WS "(?:prompt|instructions?|message|rules)\\b"},
    {"instructions_question", InjectionCategory::SystemLeak, 0.75,
     "\\bwhat" GR_WS "(?:are|were|is)" GR_WS "your" GR_WS
     "(?:(?:original|initial|hidden|system)" GR_WS ")?(?:instructions|prompt|rules)\\b"},
    {"role_reassignment", InjectionCategory::Jailbreak, 0.85,
     "\\byou" GR_WS "are" GR_WS "(?:now|no" GR_WS "longer)\\b" GR_GAP
     "\\b(?:unrestricted|unfiltered|uncensored|jailbroken|dan|evil|bound|restricted|limited)\\b"},
    {"act_as_unrestricted", InjectionCategory::Jailbreak, 0.85,
     "\\b(?:act|behave|respond|pretend|roleplay)" GR_WS "(?:as|like|to" GR_WS "be)\\b" GR_GAP
     "\\b(?:unrestricted|unfiltered|uncensored|jailbroken|evil|dan|no" GR_WS "(?:rules|restrictions|limits|filters))\\b"},
    {"do_anything_now", InjectionCategory::Jailbreak, 0.9, "\\b(?:do" GR_WS "anything" GR_WS "now|dan" GR_WS "mode)\\b"},
    {"privileged_mode", InjectionCategory::Jailbreak, 0.85, "\\b(?:developer|god|jailbreak|sudo)" GR_WS "mode\\b"},
    {"from_now_on", InjectionCategory::Jailbreak, 0.6, "\\bfrom" GR_WS "now" GR_WS "on,?" GR_WS "you" GR_WS "(?:are|will|must)\\b"},
    {"new_instructions", InjectionCategory::Jailbreak, 0.55, "\\b(?:new|updated)" GR_WS "(?:system" GR_WS ")?instructions\\s{0,16}:"},
    {"chat_template_tokens", InjectionCategory::Jailbreak, 0.7, "<\\|(?:im_start|im_end|system|endoftext)\\|>|\\[/?INST\\]"},
    {"weapon_synthesis", InjectionCategory::Violent, 0.9,
     GR_HOW_TO "(?:make|build|assemble)" GR_WS "(?:a" GR_WS "|an" GR_WS ")?"
     "(?:bomb|explosive|pipe" GR_WS "bomb|nerve" GR_WS "agent|bioweapon)s?\\b"},
    {"harm_others", InjectionCategory::Violent, 0.85,
     GR_HOW_TO "(?:kill|murder|poison)" GR_WS
     "(?:someone|a" GR_WS "person|people|my" GR_WS "\\w{1,32})\\b"},
    {"illegal_howto", InjectionCategory::Illegal, 0.85,
     GR_HOW_TO "(?:launder" GR_WS "money|hotwire" GR_WS "a" GR_WS "car|make" GR_WS "meth(?:amphetamine)?|"
     "counterfeit" GR_WS "money|buy" GR_WS "(?:illegal" GR_WS ")?(?:drugs|guns)" GR_WS "online)\\b"},
    {"self_harm", InjectionCategory::SelfHarm, 0.9,
     "\\b(?:i" GR_WS "want" GR_WS "to|how" GR_WS "(?:do" GR_WS "i|to|can" GR_WS "i))" GR_WS "(?:kill|hurt|harm)" GR_WS "myself\\b|\\bsuicide" GR_WS "methods?\\b"},
    {"sexual_minors", InjectionCategory::Sexual, 1.0,
     "\\b(?:sexual|explicit|nude)\\b[^.\\n]{0,30}?\\b(?:minors?|child(?:ren)?|underage)\\b"},
    {"phishing_request", InjectionCategory::Unethical, 0.8,
     "\\b(?:write|draft|create|compose)" GR_WS "(?:a" GR_WS "|an" GR_WS ")?(?:convincing" GR_WS ")?(?:phishing|scam)" GR_WS "(?:email|message|text|page)\\b"},
};

#undef GR_HOW_TO
#undef GR_WS
#undef GR_GAP

} // namespace

PatternLibrary::PatternLibrary(const PiiConfig& pii, const InjectionConfig& injection) {
    if (pii.enabled) {
        if (pii.detect_api_keys) {
            const PiiCategory api_key{PiiKind::ApiKey, {}};
            add_pii(api_key, "\\bsk-(?:proj-|ant-(?:api\\d{2}-)?)?[A-Za-z0-9_-]{20,256}", 0.99, MatchValidator::None, 0);
            add_pii(api_key, "\\b(?:AKIA|ASIA)[0-9A-Z]{16}\\b", 0.99, MatchValidator::None, 0);
            add_pii(api_key, "\\bgh[pousr]_[A-Za-z0-9]{36,255}\\b", 0.99, MatchValidator::None, 0);
            add_pii(api_key, "\\bgithub_pat_[A-Za-z0-9_]{22,255}", 0.99, MatchValidator::None, 0);
            add_pii(api_key, "\\bxox[abprs]-[A-Za-z0-9-]{10,255}", 0.97, MatchValidator::None, 0);
            add_pii(api_key, "\\bAIza[0-9A-Za-z_-]{35}", 0.97, MatchValidator::None, 0);
            add_pii(api_key, "\\b(?:sk|rk)_(?:live|test)_[0-9A-Za-z]{16,255}\\b", 0.99, MatchValidator::None, 0);
            add_pii(api_key, "\\bhf_[A-Za-z0-9]{30,255}\\b", 0.95, MatchValidator::None, 0);
        }
        if (pii.detect_credit_card) {
            add_pii(PiiCategory{PiiKind::CreditCard, {}}, "\\b\\d(?:[ -]?\\d){12,18}\\b", 0.99, MatchValidator::Luhn, 1);
        }
        if (pii.detect_ssn) {
            add_pii(PiiCategory{PiiKind::Ssn, {}}, "\\b\\d{3}-\\d{2}-\\d{4}\\b", 0.95, MatchValidator::Ssn, 2);
        }
        if (pii.detect_email) {
            add_pii(PiiCategory{PiiKind::Email, {}},
                    "[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9-]{1,63}(?:\\.[A-Za-z0-9-]{1,63}){0,8}\\.[A-Za-z]{2,63}\\b", 0.95, MatchValidator::None, 3);
        }
        if (pii.detect_ip) {
            const PiiCategory ip{PiiKind::IpAddress, {}};
            add_pii(ip,
                    "\\b(?:(?:25[0-5]|2[0-4]\\d|1\\d\\d|[1-9]?\\d)\\.){3}(?:25[0-5]|2[0-4]\\d|1\\d\\d|[1-9]?\\d)\\b",
                    0.9, MatchValidator::None, 4);
            add_pii(ip, "\\b(?:[0-9A-Fa-f]{1,4}:){7}[0-9A-Fa-f]{1,4}\\b", 0.9, MatchValidator::None, 4);
        }
        if (pii.detect_phone) {
            add_pii(PiiCategory{PiiKind::Phone, {}},
                    "(?:\\+?1[-. ]?)?(?:\\(\\d{3}\\)|\\b\\d{3})[-. ]?\\d{3}[-. ]\\d{4}\\b", 0.8, MatchValidator::None, 5);
        }
        for (const auto& custom : pii.custom_patterns) {
            add_pii(custom_category(custom.name), custom.pattern, 0.9, MatchValidator::None, 6);
        }
    }

    if (injection.enabled) {
        for (const auto& spec : kBuiltinSignatures) {
            add_signature(spec.id, spec.category, spec.weight, spec.pattern);
        }
        for (std::size_t i = 0; i < injection.custom_patterns.size(); ++i) {
            add_signature("custom:" + std::to_string(i), InjectionCategory::Jailbreak, 0.9, injection.custom_patterns[i]);
        }
    }
}

void PatternLibrary::add_pii(PiiCategory category, const std::string& pattern, double confidence, MatchValidator validator, int priority) {
    try {
        m_pii.push_back(PiiPattern{std::move(category), std::regex(pattern, kPiiFlags), confidence, validator, priority});
    } catch (const std::regex_error& ex) {
        throw DetectionError("invalid PII pattern '" + pattern + "': " + ex.what());
    }
}

void PatternLibrary::add_signature(std::string id, InjectionCategory category, double weight, const std::string& pattern) {
    try {
        m_signatures.push_back(InjectionSignature{std::move(id), category, weight, std::regex(pattern, kSignatureFlags)});
    } catch (const std::regex_error& ex) {
        throw DetectionError("invalid injection pattern '" + pattern + "': " + ex.what());
    }
}

bool luhn_valid(std::string_view candidate) {
    int sum = 0;
    int digits = 0;
    bool double_it = false;
    for (auto it = candidate.rbegin(); it != candidate.rend(); ++it) {
        const unsigned char c = static_cast<unsigned char>(*it);
        if (c == ' ' || c == '-') {
            continue;
        }
        if (!std::isdigit(c)) {
            return false;
        }
        int value = c - '0';
        if (double_it) {
            value *= 2;
            if (value > 9) {
                value -= 9;
            }
        }
        sum += value;
        double_it = !double_it;
        ++digits;
    }
    return digits >= 13 && digits <= 19 && sum % 10 == 0;
}

bool ssn_valid(std::string_view candidate) {
    if (candidate.size() != 11 || candidate[3] != '-' || candidate[6] != '-') {
        return false;
    }
    const std::string_view area = candidate.substr(0, 3);
    const std::string_view group = candidate.substr(4, 2);
    const std::string_view serial = candidate.substr(7, 4);
    if (area == "000" || area == "666" || area[0] == '9') {
        return false;
    }
    return group != "00" && serial != "0000";
}

} // namespace guardrail

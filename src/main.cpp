#include "../include/guardrail/config.hpp"
#include "../include/guardrail/errors.hpp"
#include "../include/guardrail/json.hpp"
#include "../include/guardrail/log.hpp"
#include "../include/guardrail/sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <variant>

namespace {

void print_usage() {
    std::cout << "guardrail - LLM I/O sanitization tool\n\n"
              << "USAGE:\n"
              << "    echo \"text\" | guardrail\n"
              << "    guardrail --file <FILE>\n"
              << "    guardrail --text \"My SSN is 123-45-6789\"\n\n"
              << "OPTIONS:\n"
              << "    -f, --file <FILE>    Read input from file\n"
              << "    -t, --text <TEXT>    Sanitize text directly\n"
              << "    -j, --json           Output as JSON\n"
              << "    -v, --verbose        Debug logging on stderr\n"
              << "    -h, --help           Print help\n\n"
              << "EXIT STATUS:\n"
              << "    0 clean or redacted, 2 blocked, 1 error\n";
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw guardrail::ConfigError("cannot read " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

guardrail::Json to_json(const guardrail::SanitizeResult& result) {
    using namespace guardrail;
    JsonObject out;
    out["status"] = Json(verdict_name(result));
    if (const auto* clean = std::get_if<Clean>(&result)) {
        out["text"] = Json(clean->text);
    } else if (const auto* redacted = std::get_if<Redacted>(&result)) {
        out["text"] = Json(redacted->text);
        JsonArray items;
        for (const auto& redaction : redacted->redactions) {
            JsonObject item;
            item["category"] = Json(redaction.category.name());
            item["start"] = Json(redaction.span.start);
            item["end"] = Json(redaction.span.end);
            item["replacement"] = Json(redaction.replacement);
            item["hash"] = Json(redaction.original_excerpt_hash);
            items.emplace_back(std::move(item));
        }
        out["redactions"] = Json(std::move(items));
    } else {
        const auto& blocked = std::get<Blocked>(result);
        out["reason"] = Json(blocked.message);
        out["block_reason"] = Json(block_reason_name(blocked.reason));
        if (blocked.category) {
            out["category"] = Json(category_name(*blocked.category));
        }
        out["score"] = Json(blocked.score);
    }
    return Json(std::move(out));
}

} // namespace

int main(int argc, char** argv) {
    using namespace guardrail;

    bool json_output = false;
    std::string input;
    bool have_input = false;
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            }
            if (arg == "-j" || arg == "--json") {
                json_output = true;
            } else if (arg == "-v" || arg == "--verbose") {
                set_log_level(LogLevel::Debug);
            } else if (arg == "-t" || arg == "--text") {
                input = i + 1 < argc ? argv[++i] : "";
                have_input = true;
            } else if (arg == "-f" || arg == "--file") {
                if (i + 1 >= argc) {
                    throw ConfigError("missing file path after " + arg);
                }
                input = read_file(argv[++i]);
                have_input = true;
            } else {
                throw ConfigError("unknown option " + arg);
            }
        }
        if (!have_input) {
            input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        if (is_blank(input)) {
            std::cerr << "No input provided" << std::endl;
            return 1;
        }

        Sanitizer sanitizer(apply_environment(default_config()));
        SanitizeResult result = sanitizer.sanitize_input(input);
        sanitizer.audit().flush();

        if (json_output) {
            std::cout << to_json(result).dump() << std::endl;
            return is_blocked(result) ? 2 : 0;
        }
        if (const auto* blocked = std::get_if<Blocked>(&result)) {
            std::cerr << "BLOCKED: " << blocked->message << std::endl;
            return 2;
        }
        if (const auto* redacted = std::get_if<Redacted>(&result)) {
            std::cerr << "# Redacted " << redacted->redactions.size() << " items" << std::endl;
        }
        std::cout << *forwardable_text(result) << std::flush;
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

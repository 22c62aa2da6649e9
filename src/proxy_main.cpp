#include "../include/guardrail/config.hpp"
#include "../include/guardrail/errors.hpp"
#include "../include/guardrail/log.hpp"
#include "../include/guardrail/net/event_loop.hpp"
#include "../include/guardrail/net/worker_pool.hpp"
#include "../include/guardrail/sanitizer.hpp"
#include "../include/guardrail/transport/http_proxy.hpp"

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

guardrail::net::EventLoop* g_loop = nullptr;

void handle_stop_signal(int) {
    if (g_loop) {
        g_loop->quit();
    }
}

void print_usage() {
    std::cout << "guardrail-proxy - sanitizing reverse proxy for LLM APIs\n\n"
              << "USAGE:\n"
              << "    guardrail-proxy [OPTIONS]\n\n"
              << "OPTIONS:\n"
              << "    -u, --upstream <URL>   Upstream base URL [default: https://api.openai.com]\n"
              << "    -p, --port <PORT>      Listen port [default: 8080]\n"
              << "    -b, --bind <ADDR>      Listen address [default: 0.0.0.0]\n"
              << "        --rpm <N>          Enable rate limiting at N requests per minute per client\n"
              << "        --burst <N>        Burst size for rate limiting [default: 10]\n"
              << "        --workers <N>      Sanitizer and upstream worker threads [default: 8]\n"
              << "    -v, --verbose          Log every request\n"
              << "    -h, --help             Print help\n";
}

std::string next_value(int argc, char** argv, int& i, const std::string& option) {
    if (i + 1 >= argc) {
        throw guardrail::ConfigError("missing value after " + option);
    }
    return argv[++i];
}

double parse_number(const std::string& text, const std::string& option) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        throw guardrail::ConfigError("invalid number for " + option + ": " + text);
    }
    return value;
}

std::size_t parse_count(const std::string& text, const std::string& option) {
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (text.empty() || text[0] == '-' || end == text.c_str() || *end != '\0' || value < 1 || value > 1024) {
        throw guardrail::ConfigError(option + " must be a whole number between 1 and 1024: " + text);
    }
    return static_cast<std::size_t>(value);
}

} // namespace

int main(int argc, char** argv) {
    using namespace guardrail;

    std::string upstream_url = "https://api.openai.com";
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t workers = 8;
    double rpm = 0;
    double burst = 10;
    bool rate_limit = false;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            }
            if (arg == "-u" || arg == "--upstream") {
                upstream_url = next_value(argc, argv, i, arg);
            } else if (arg == "-p" || arg == "--port") {
                port = transport::parse_port(next_value(argc, argv, i, arg));
            } else if (arg == "-b" || arg == "--bind") {
                bind_address = next_value(argc, argv, i, arg);
            } else if (arg == "--rpm") {
                rpm = parse_number(next_value(argc, argv, i, arg), arg);
                rate_limit = true;
            } else if (arg == "--burst") {
                burst = parse_number(next_value(argc, argv, i, arg), arg);
                rate_limit = true;
            } else if (arg == "--workers") {
                workers = parse_count(next_value(argc, argv, i, arg), arg);
            } else if (arg == "-v" || arg == "--verbose") {
                set_log_level(LogLevel::Debug);
            } else {
                throw ConfigError("unknown option " + arg);
            }
        }
        GuardConfig config = apply_environment(default_config());
        if (rate_limit) {
            config = with_rate_limit(std::move(config), rpm > 0 ? rpm : config.rate_limit.requests_per_minute, burst);
        }
        Sanitizer sanitizer(std::move(config));

        std::signal(SIGPIPE, SIG_IGN);
        net::EventLoop loop;
        net::WorkerPool pool(workers);
        transport::HttpProxyAdapter proxy(loop, sanitizer, std::make_shared<transport::CurlUpstream>(upstream_url), pool);
        const auto bound = proxy.listen(bind_address, port);

        g_loop = &loop;
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        log_info("proxy", "listening on " + bind_address + ":" + std::to_string(bound) + ", upstream " + upstream_url);
        if (sanitizer.rate_limiter()) {
            log_info("proxy", "rate limit " + std::to_string(sanitizer.config().rate_limit.requests_per_minute) +
                                  " rpm, burst " + std::to_string(sanitizer.config().rate_limit.burst_size));
        }
        loop.run();
        log_info("proxy", "shutting down");
        g_loop = nullptr;
        proxy.close_all();
        sanitizer.audit().flush();
        return 0;
    } catch (const std::exception& ex) {
        log_error("proxy", ex.what());
        return 1;
    }
}

#include "../include/guardrail/config.hpp"
#include "../include/guardrail/log.hpp"
#include "../include/guardrail/net/event_loop.hpp"
#include "../include/guardrail/net/worker_pool.hpp"
#include "../include/guardrail/sanitizer.hpp"
#include "../include/guardrail/transport/stream_filter.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

guardrail::net::EventLoop* g_loop = nullptr;

void handle_stop_signal(int) {
    if (g_loop) {
        g_loop->quit();
    }
}

void print_usage() {
    std::cout << "guardrail-mcp - MCP server wrapper with I/O sanitization\n\n"
              << "USAGE:\n"
              << "    guardrail-mcp [OPTIONS] -- <COMMAND> [ARGS...]\n\n"
              << "OPTIONS:\n"
              << "    -v, --verbose    Log filtered messages on stderr\n"
              << "    -h, --help       Print help\n\n"
              << "EXAMPLES:\n"
              << "    guardrail-mcp -- npx @modelcontextprotocol/server-filesystem /tmp\n"
              << "    guardrail-mcp -v -- python -m mcp_server\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace guardrail;

    std::vector<std::string> command;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (!command.empty()) {
            command.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            set_log_level(LogLevel::Debug);
        } else if (arg == "--") {
            command.assign(argv + i + 1, argv + argc);
            break;
        } else {
            command.push_back(arg);
        }
    }
    if (command.empty()) {
        std::cerr << "No command specified" << std::endl;
        return 1;
    }

    try {
        Sanitizer sanitizer(apply_environment(default_config()));

        std::signal(SIGPIPE, SIG_IGN);
        auto child = transport::ChildProcess::spawn(command);
        log_debug("mcp", "started " + command.front());

        net::EventLoop loop;
        // One worker per direction.
        net::WorkerPool pool(2);
        transport::StreamFilterAdapter filter(loop,
                                              sanitizer,
                                              pool,
                                              STDIN_FILENO,
                                              STDOUT_FILENO,
                                              child->release_stdin(),
                                              child->release_stdout(),
                                              "mcp");
        g_loop = &loop;
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        filter.set_finished_callback([&loop] { loop.quit(); });
        filter.start();
        loop.run();
        g_loop = nullptr;

        for (int tries = 0; !filter.flushed() && tries < 50; ++tries) {
            loop.poll_once(20);
        }
        sanitizer.audit().flush();
        if (!filter.finished()) {
            child->terminate();
        }
        return child->wait();
    } catch (const std::exception& ex) {
        log_error("mcp", ex.what());
        return 1;
    }
}

#include "../include/guardrail/config.hpp"
#include "../include/guardrail/errors.hpp"
#include "../include/guardrail/log.hpp"
#include "../include/guardrail/net/event_loop.hpp"
#include "../include/guardrail/net/worker_pool.hpp"
#include "../include/guardrail/sanitizer.hpp"
#include "../include/guardrail/transport/pty_wrap.hpp"
#include "../include/guardrail/transport/terminal.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

namespace {

void print_usage() {
    std::cout << "guardrail-wrap - PTY wrapper with I/O sanitization\n\n"
              << "USAGE:\n"
              << "    guardrail-wrap [OPTIONS] [--] <COMMAND> [ARGS...]\n\n"
              << "OPTIONS:\n"
              << "    -v, --verbose    Debug logging on stderr\n"
              << "    -h, --help       Print help\n\n"
              << "All input you type is sanitized before reaching the command.\n"
              << "All output from the command is sanitized before display.\n";
}

// Owns a signalfd for the signals the wrapper handles on its loop.
class SignalFd {
public:
    explicit SignalFd(std::initializer_list<int> signals) {
        sigemptyset(&m_mask);
        for (int sig : signals) {
            sigaddset(&m_mask, sig);
        }
        if (::sigprocmask(SIG_BLOCK, &m_mask, nullptr) < 0) {
            throw guardrail::TransportError(std::string("sigprocmask failed: ") + std::strerror(errno));
        }
        m_fd = ::signalfd(-1, &m_mask, SFD_NONBLOCK | SFD_CLOEXEC);
        if (m_fd < 0) {
            throw guardrail::TransportError(std::string("signalfd failed: ") + std::strerror(errno));
        }
    }

    ~SignalFd() {
        ::close(m_fd);
        ::sigprocmask(SIG_UNBLOCK, &m_mask, nullptr);
    }

    SignalFd(const SignalFd&) = delete;
    SignalFd& operator=(const SignalFd&) = delete;

    int fd() const noexcept { return m_fd; }

    // Next pending signal number, or 0 when none is queued.
    int next() {
        signalfd_siginfo info{};
        if (::read(m_fd, &info, sizeof info) != static_cast<ssize_t>(sizeof info)) {
            return 0;
        }
        return static_cast<int>(info.ssi_signo);
    }

private:
    sigset_t m_mask{};
    int m_fd = -1;
};

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
        const transport::TerminalSize size =
            transport::query_terminal_size(STDIN_FILENO).value_or(transport::TerminalSize{});

        std::signal(SIGPIPE, SIG_IGN);
        net::EventLoop loop;
        // One worker per direction.
        net::WorkerPool pool(2);
        transport::PtyWrapAdapter wrapper(loop,
                                          sanitizer,
                                          pool,
                                          transport::spawn_pty_session(command, size),
                                          STDIN_FILENO,
                                          STDOUT_FILENO,
                                          STDERR_FILENO);
        // Blocked only after the child exists so it starts with a clean mask.
        SignalFd signals{SIGWINCH, SIGINT, SIGTERM, SIGHUP};
        net::IoChannel signal_channel(&loop, signals.fd());
        signal_channel.set_read_callback([&] {
            while (const int sig = signals.next()) {
                if (sig == SIGWINCH) {
                    if (auto current = transport::query_terminal_size(STDIN_FILENO)) {
                        wrapper.resize(*current);
                    }
                } else if (sig == SIGINT) {
                    wrapper.interrupt();
                } else {
                    log_debug("wrap", std::string("terminating on ") + ::strsignal(sig));
                    loop.quit();
                }
            }
        });
        signal_channel.enable_reading();

        wrapper.set_finished_callback([&loop] { loop.quit(); });
        wrapper.start();
        loop.run();
        signal_channel.remove();

        for (int tries = 0; !wrapper.flushed() && tries < 50; ++tries) {
            loop.poll_once(20);
        }
        sanitizer.audit().flush();
        if (!wrapper.finished()) {
            // Left on a signal rather than a child exit.
            return 128 + SIGTERM;
        }
        return wrapper.wait();
    } catch (const std::exception& ex) {
        log_error("wrap", ex.what());
        return 1;
    }
}

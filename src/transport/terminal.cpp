#include "../../include/guardrail/transport/terminal.hpp"
#include "../../include/guardrail/errors.hpp"
#include "../../include/guardrail/net/event_loop.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace guardrail::transport {

namespace {

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

class PosixTerminal final : public TerminalSession {
public:
    PosixTerminal(int master, pid_t child) : m_master(master), m_child(child) {}

    ~PosixTerminal() override {
        if (m_child > 0 && !m_reaped) {
            terminate();
            wait();
        }
        if (m_master >= 0) {
            ::close(m_master);
        }
    }

    int fd() const override { return m_master; }

    std::optional<std::string> read_output() override {
        char buffer[4096];
        const ssize_t n = ::read(m_master, buffer, sizeof buffer);
        if (n > 0) {
            return std::string(buffer, static_cast<std::size_t>(n));
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return std::string();
        }
        // EIO once the slave side is closed.
        return std::nullopt;
    }

    std::size_t write_input(std::string_view bytes) override {
        for (;;) {
            const ssize_t n = ::write(m_master, bytes.data(), bytes.size());
            if (n >= 0) {
                return static_cast<std::size_t>(n);
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return 0;
            }
            throw TransportError(std::string("pty write failed: ") + std::strerror(errno));
        }
    }

    void resize(TerminalSize size) override {
        winsize ws{};
        ws.ws_row = size.rows;
        ws.ws_col = size.cols;
        ::ioctl(m_master, TIOCSWINSZ, &ws);
    }

    void terminate() override {
        if (m_child > 0 && !m_reaped) {
            ::kill(m_child, SIGHUP);
        }
    }

    int wait() override {
        if (m_reaped) {
            return m_exit_status;
        }
        int status = 0;
        while (::waitpid(m_child, &status, 0) < 0) {
            if (errno != EINTR) {
                m_reaped = true;
                m_exit_status = 1;
                return m_exit_status;
            }
        }
        m_reaped = true;
        m_exit_status = decode_status(status);
        return m_exit_status;
    }

private:
    int m_master;
    pid_t m_child;
    bool m_reaped = false;
    int m_exit_status = 0;
};

} // namespace

TerminalSessionPtr spawn_pty_session(const std::vector<std::string>& argv, TerminalSize size) {
    if (argv.empty()) {
        throw TransportError("no command specified");
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // Built before fork: the child may only make async-signal-safe calls.
    const std::string exec_failed = "guardrail-wrap: cannot run " + argv[0] + "\r\n";

    winsize ws{};
    ws.ws_row = size.rows;
    ws.ws_col = size.cols;
    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        throw TransportError(std::string("forkpty failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::execvp(args[0], args.data());
        [[maybe_unused]] const ssize_t written = ::write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
        ::_exit(127);
    }
    net::set_nonblocking(master);
    return std::make_unique<PosixTerminal>(master, pid);
}

std::optional<TerminalSize> query_terminal_size(int fd) {
    winsize ws{};
    if (!::isatty(fd) || ::ioctl(fd, TIOCGWINSZ, &ws) < 0 || ws.ws_row == 0 || ws.ws_col == 0) {
        return std::nullopt;
    }
    return TerminalSize{ws.ws_row, ws.ws_col};
}

} // namespace guardrail::transport

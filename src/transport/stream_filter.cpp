#include "../../include/guardrail/transport/stream_filter.hpp"
#include "../../include/guardrail/errors.hpp"
#include "../../include/guardrail/log.hpp"
#include "../../include/guardrail/transport/json_content.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <deque>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace guardrail::transport {

namespace {

std::optional<Json> parse_message(const std::string& line) {
    try {
        return Json::parse(line);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

// Member of `params` that carries user content for the given method.
const char* content_param(const std::string& method) {
    if (method == "tools/call") {
        return "arguments";
    }
    if (method == "completion/complete") {
        return "prompt";
    }
    if (method == "sampling/createMessage") {
        return "messages";
    }
    return nullptr;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

Filtered<std::string> filter_message(Sanitizer& sanitizer,
                                     const std::string& line,
                                     Direction direction,
                                     const std::string& identity,
                                     const std::atomic<bool>* cancelled) {
    Filtered<std::string> out;
    std::optional<Json> message = is_blank(line) ? std::nullopt : parse_message(line);
    if (!message || !message->is_object()) {
        out.unit = line;
        return out;
    }
    if (auto blocked = sanitizer.admit(identity, direction, line)) {
        out.blocked = std::move(blocked);
        return out;
    }

    FieldContext ctx{sanitizer, direction, identity, cancelled};
    std::optional<Blocked> blocked;
    const Json* method = message->find("method");
    if (method && method->is_string()) {
        if (const char* field = content_param(method->as_string())) {
            if (Json* params = message->find("params")) {
                if (Json* content = params->find(field)) {
                    blocked = sanitize_content_fields(ctx, *content);
                }
            }
        }
    }
    if (!blocked) {
        if (Json* result = message->find("result")) {
            blocked = sanitize_content_fields(ctx, *result);
        }
    }

    out.redactions = ctx.redactions;
    if (blocked) {
        out.blocked = std::move(blocked);
        return out;
    }
    out.unit = ctx.redactions > 0 ? message->dump() : line;
    return out;
}

std::string blocked_response(const Json& id, const Blocked& blocked) {
    JsonObject error;
    error["code"] = Json(kBlockedErrorCode);
    error["message"] = Json("Blocked by guard: " + blocked.message);
    JsonObject response;
    response["jsonrpc"] = Json("2.0");
    response["id"] = id;
    response["error"] = Json(std::move(error));
    return Json(std::move(response)).dump();
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv) {
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
    const std::string exec_failed = "guardrail-mcp: cannot run " + argv[0] + "\n";

    int to_child[2];
    int from_child[2];
    if (::pipe2(to_child, O_CLOEXEC) < 0) {
        throw TransportError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe2(from_child, O_CLOEXEC) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(to_child[0]);
        ::close(to_child[1]);
        throw TransportError("pipe failed: " + reason);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        for (int fd : {to_child[0], to_child[1], from_child[0], from_child[1]}) {
            ::close(fd);
        }
        throw TransportError("fork failed: " + reason);
    }
    if (pid == 0) {
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        [[maybe_unused]] const ssize_t written = ::write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
        ::_exit(127);
    }
    ::close(to_child[0]);
    ::close(from_child[1]);
    return std::make_unique<ChildProcess>(pid, to_child[1], from_child[0]);
}

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd)
    : m_pid(pid), m_stdin_fd(stdin_fd), m_stdout_fd(stdout_fd) {}

ChildProcess::~ChildProcess() {
    if (m_stdin_fd >= 0) {
        ::close(m_stdin_fd);
    }
    if (m_stdout_fd >= 0) {
        ::close(m_stdout_fd);
    }
    if (!m_reaped) {
        terminate();
        wait();
    }
}

int ChildProcess::release_stdin() noexcept {
    return std::exchange(m_stdin_fd, -1);
}

int ChildProcess::release_stdout() noexcept {
    return std::exchange(m_stdout_fd, -1);
}

void ChildProcess::terminate() {
    if (!m_reaped) {
        ::kill(m_pid, SIGTERM);
    }
}

int ChildProcess::wait() {
    if (m_reaped) {
        return m_exit_status;
    }
    int status = 0;
    while (::waitpid(m_pid, &status, 0) < 0) {
        if (errno != EINTR) {
            m_reaped = true;
            m_exit_status = 1;
            return m_exit_status;
        }
    }
    m_reaped = true;
    if (WIFEXITED(status)) {
        m_exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        m_exit_status = 128 + WTERMSIG(status);
    } else {
        m_exit_status = 1;
    }
    return m_exit_status;
}

// Newline framing over a reader and a writer connection.
class StreamFilterAdapter::LineChannel final : public Channel<std::string> {
public:
    LineChannel(net::ConnectionPtr reader, net::ConnectionPtr writer)
        : m_reader(std::move(reader)), m_writer(std::move(writer)) {}

    std::optional<std::string> read_unit() override {
        if (m_lines.empty()) {
            return std::nullopt;
        }
        std::string line = std::move(m_lines.front());
        m_lines.pop_front();
        return line;
    }

    void write_unit(std::string unit) override {
        unit.push_back('\n');
        m_writer->send(unit);
    }

    void close() override {
        m_reader->close();
        m_writer->shutdown_when_flushed();
    }

    // Moves every complete line out of `buffer`; a trailing partial line stays.
    void take_lines(std::string& buffer) {
        std::size_t start = 0;
        for (std::size_t nl = buffer.find('\n'); nl != std::string::npos; nl = buffer.find('\n', start)) {
            m_lines.push_back(buffer.substr(start, nl - start));
            start = nl + 1;
        }
        buffer.erase(0, start);
    }

    void discard() { m_lines.clear(); }
    bool empty() const noexcept { return m_lines.empty(); }

    net::Connection& reader() { return *m_reader; }
    net::Connection& writer() { return *m_writer; }

private:
    net::ConnectionPtr m_reader;
    net::ConnectionPtr m_writer;
    std::deque<std::string> m_lines;
};

namespace {

// The error goes to whoever would otherwise wait for an answer.
void reply_blocked(const std::string& original, const Blocked& blocked, Channel<std::string>& from,
                   Channel<std::string>& to) {
    std::optional<Json> message = parse_message(original);
    const Json* id = message ? message->find("id") : nullptr;
    if (!id || id->is_null()) {
        return;
    }
    std::string reply = blocked_response(*id, blocked);
    if (message->find("method")) {
        from.write_unit(std::move(reply));
    } else {
        to.write_unit(std::move(reply));
    }
}

} // namespace

StreamFilterAdapter::StreamFilterAdapter(net::EventLoop& loop,
                                         Sanitizer& sanitizer,
                                         net::WorkerPool& pool,
                                         int client_in,
                                         int client_out,
                                         int server_in,
                                         int server_out,
                                         std::string identity)
    : m_sanitizer(sanitizer),
      m_identity(std::move(identity)),
      m_client(std::make_unique<LineChannel>(std::make_shared<net::Connection>(&loop, client_in, false),
                                             std::make_shared<net::Connection>(&loop, client_out, false))),
      m_server(std::make_unique<LineChannel>(std::make_shared<net::Connection>(&loop, server_out, true),
                                             std::make_shared<net::Connection>(&loop, server_in, true))),
      m_input_relay(loop, pool, *m_client, *m_server, Direction::Input, make_filter(), reply_blocked),
      m_output_relay(loop, pool, *m_server, *m_client, Direction::Output, make_filter(), reply_blocked) {
    m_input_relay.set_settled_callback([this](std::size_t) { close_server_input_when_drained(); });
    m_output_relay.set_settled_callback([this](std::size_t) { finish_when_drained(); });
}

StreamFilterAdapter::~StreamFilterAdapter() {
    m_cancelled->store(true);
    m_input_relay.stop();
    m_output_relay.stop();
    m_client->reader().set_close_callback(nullptr);
    m_server->reader().set_close_callback(nullptr);
}

UnitFilter<std::string> StreamFilterAdapter::make_filter() const {
    Sanitizer* sanitizer = &m_sanitizer;
    return [sanitizer, identity = m_identity, cancelled = m_cancelled](const std::string& line, Direction direction) {
        Filtered<std::string> out = filter_message(*sanitizer, line, direction, identity, cancelled.get());
        if (out.blocked) {
            log_debug("mcp", direction_name(direction) + " blocked: " + out.blocked->message);
        } else if (out.redactions > 0) {
            log_debug("mcp", direction_name(direction) + " redacted " + std::to_string(out.redactions) + " item(s)");
        }
        return out;
    };
}

void StreamFilterAdapter::start() {
    m_client->reader().set_data_callback([this](net::Connection&, std::string& input) {
        m_client->take_lines(input);
        pump();
    });
    m_client->reader().set_close_callback([this](net::Connection&) {
        m_client_closed = true;
        close_server_input_when_drained();
    });
    m_client->reader().start_reading();

    m_server->reader().set_data_callback([this](net::Connection&, std::string& input) {
        m_server->take_lines(input);
        pump();
    });
    m_server->reader().set_close_callback([this](net::Connection&) {
        m_server_closed = true;
        finish_when_drained();
    });
    m_server->reader().start_reading();
}

bool StreamFilterAdapter::flushed() const noexcept {
    const net::Connection& out = m_client->writer();
    return out.closed() || out.pending_output() == 0;
}

void StreamFilterAdapter::pump() {
    m_input_relay.pump();
    m_output_relay.pump();
}

// The server sees end-of-input once every client line was relayed and written.
void StreamFilterAdapter::close_server_input_when_drained() {
    if (m_client_closed && !m_input_relay.busy() && m_client->empty()) {
        m_server->writer().shutdown_when_flushed();
    }
}

void StreamFilterAdapter::finish_when_drained() {
    if (m_server_closed && !m_output_relay.busy() && m_server->empty()) {
        finish();
    }
}

void StreamFilterAdapter::finish() {
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_cancelled->store(true);
    m_input_relay.stop();
    m_output_relay.stop();
    m_client->discard();
    m_server->discard();
    m_client->reader().set_close_callback(nullptr);
    m_client->reader().stop_reading();
    log_debug("mcp", "server closed its output");
    if (m_finished_callback) {
        m_finished_callback();
    }
}

} // namespace guardrail::transport

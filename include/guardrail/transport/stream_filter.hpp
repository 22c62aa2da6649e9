#pragma once

#include "../json.hpp"
#include "../net/connection.hpp"
#include "../net/event_loop.hpp"
#include "../net/worker_pool.hpp"
#include "../sanitizer.hpp"
#include "relay.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace guardrail::transport {

constexpr int kBlockedErrorCode = -32001;

// Sanitizes the content fields of one newline-framed JSON-RPC message, which
// spends one rate-limit token. Lines that are not JSON objects pass through
// untouched and unmetered, as do messages with nothing to redact.
Filtered<std::string> filter_message(Sanitizer& sanitizer,
                                     const std::string& line,
                                     Direction direction,
                                     const std::string& identity,
                                     const std::atomic<bool>* cancelled = nullptr);

// `{"jsonrpc":"2.0","id":<id>,"error":{"code":-32001,"message":"Blocked by guard: ..."}}`
std::string blocked_response(const Json& id, const Blocked& blocked);

// A child with its stdin and stdout on pipes; stderr is inherited.
class ChildProcess {
public:
    // Throws TransportError when the pipes or the process cannot be created.
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv);

    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Ownership of both pipe ends passes to the caller.
    int release_stdin() noexcept;
    int release_stdout() noexcept;

    void terminate();
    int wait();

private:
    pid_t m_pid;
    int m_stdin_fd;
    int m_stdout_fd;
    bool m_reaped = false;
    int m_exit_status = 0;
};

// Relays newline-delimited JSON-RPC between a client (usually our own
// stdin/stdout) and a server (usually a child's pipes). Client fds are
// borrowed; server fds are owned and closed by the adapter. Messages are
// filtered on `pool`, which must be destroyed before the sanitizer.
class StreamFilterAdapter {
public:
    StreamFilterAdapter(net::EventLoop& loop,
                        Sanitizer& sanitizer,
                        net::WorkerPool& pool,
                        int client_in,
                        int client_out,
                        int server_in,
                        int server_out,
                        std::string identity = "stream");
    ~StreamFilterAdapter();

    StreamFilterAdapter(const StreamFilterAdapter&) = delete;
    StreamFilterAdapter& operator=(const StreamFilterAdapter&) = delete;

    void start();

    // Runs once the server closed its output and every line it wrote was relayed.
    void set_finished_callback(std::function<void()> cb) { m_finished_callback = std::move(cb); }

    bool finished() const noexcept { return m_finished; }
    bool flushed() const noexcept;

    const RelayStats& client_stats() const noexcept { return m_input_relay.stats(); }
    const RelayStats& server_stats() const noexcept { return m_output_relay.stats(); }

private:
    class LineChannel;

    Sanitizer& m_sanitizer;
    std::string m_identity;
    std::shared_ptr<std::atomic<bool>> m_cancelled = std::make_shared<std::atomic<bool>>(false);
    std::unique_ptr<LineChannel> m_client;
    std::unique_ptr<LineChannel> m_server;
    Relay<std::string> m_input_relay;
    Relay<std::string> m_output_relay;
    bool m_client_closed = false;
    bool m_server_closed = false;
    bool m_finished = false;
    std::function<void()> m_finished_callback;

    UnitFilter<std::string> make_filter() const;
    void pump();
    void close_server_input_when_drained();
    void finish_when_drained();
    void finish();
};

} // namespace guardrail::transport

#pragma once

#include "../net/connection.hpp"
#include "../net/event_loop.hpp"
#include "../net/worker_pool.hpp"
#include "../sanitizer.hpp"
#include "relay.hpp"
#include "terminal.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace guardrail::transport {

// Sits between the real terminal and a child on a pseudo-terminal.
// Keystrokes are sanitized as input, child output as output. Terminal modes
// are left alone, so the real terminal's own line discipline decides how
// keystrokes are chunked. Chunks are filtered on `pool`, which must be
// destroyed before the sanitizer; input the child is not reading yet waits in
// the adapter while the terminal stays live.
class PtyWrapAdapter {
public:
    PtyWrapAdapter(net::EventLoop& loop,
                   Sanitizer& sanitizer,
                   net::WorkerPool& pool,
                   TerminalSessionPtr session,
                   int input_fd,
                   int output_fd,
                   int notice_fd,
                   std::string identity = "terminal");
    ~PtyWrapAdapter();

    PtyWrapAdapter(const PtyWrapAdapter&) = delete;
    PtyWrapAdapter& operator=(const PtyWrapAdapter&) = delete;

    void start();
    void resize(TerminalSize size);
    // Delivers an interrupt (ETX) through the child's line discipline.
    void interrupt();

    // Runs once the child side of the terminal is gone and its output was relayed.
    void set_finished_callback(std::function<void()> cb) { m_finished_callback = std::move(cb); }

    bool finished() const noexcept { return m_finished; }
    // True once everything destined for the real terminal has been written.
    bool flushed() const noexcept;
    // Waits for the child and returns its exit status.
    int wait();

    const RelayStats& input_stats() const noexcept { return m_input_relay.stats(); }
    const RelayStats& output_stats() const noexcept { return m_output_relay.stats(); }
    // Sanitized input the child has not taken yet.
    std::size_t pending_input() const noexcept { return m_pending_input.size(); }

private:
    class TerminalSide;
    class ChildSide;

    net::EventLoop& m_loop;
    Sanitizer& m_sanitizer;
    TerminalSessionPtr m_session;
    std::string m_identity;
    std::shared_ptr<std::atomic<bool>> m_cancelled = std::make_shared<std::atomic<bool>>(false);
    net::ConnectionPtr m_input;
    net::ConnectionPtr m_output;
    net::ConnectionPtr m_notice;
    std::unique_ptr<net::IoChannel> m_child_channel;
    std::deque<std::string> m_keystrokes;
    std::deque<std::string> m_child_output;
    std::string m_pending_input;
    std::unique_ptr<TerminalSide> m_terminal_side;
    std::unique_ptr<ChildSide> m_child_side;
    Relay<std::string> m_input_relay;
    Relay<std::string> m_output_relay;
    bool m_input_closed = false;
    bool m_child_gone = false;
    bool m_finished = false;
    std::function<void()> m_finished_callback;

    UnitFilter<std::string> make_filter() const;
    BlockedHandler<std::string> make_blocked_handler();
    void on_settled(std::size_t redactions);
    void notice(const std::string& text);
    void pump();
    void send_to_child(const std::string& bytes);
    void flush_input();
    void on_child_readable();
    void send_eof_when_drained();
    void finish_when_drained();
    void finish();
};

} // namespace guardrail::transport

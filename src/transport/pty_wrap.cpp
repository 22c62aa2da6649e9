#include "../../include/guardrail/transport/pty_wrap.hpp"
#include "../../include/guardrail/errors.hpp"
#include "../../include/guardrail/log.hpp"

#include <algorithm>
#include <cctype>

namespace guardrail::transport {

namespace {

constexpr const char* kYellow = "\x1b[33m";
constexpr const char* kRed = "\x1b[31m";
constexpr const char* kReset = "\x1b[0m";
constexpr char kEndOfText = '\x03';
constexpr char kEndOfTransmission = '\x04';

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

class PtyWrapAdapter::TerminalSide final : public Channel<std::string> {
public:
    explicit TerminalSide(PtyWrapAdapter& owner) : m_owner(owner) {}

    std::optional<std::string> read_unit() override {
        if (m_owner.m_keystrokes.empty()) {
            return std::nullopt;
        }
        std::string chunk = std::move(m_owner.m_keystrokes.front());
        m_owner.m_keystrokes.pop_front();
        return chunk;
    }

    void write_unit(std::string unit) override { m_owner.m_output->send(unit); }

    void close() override { m_owner.m_input->close(); }

private:
    PtyWrapAdapter& m_owner;
};

class PtyWrapAdapter::ChildSide final : public Channel<std::string> {
public:
    explicit ChildSide(PtyWrapAdapter& owner) : m_owner(owner) {}

    std::optional<std::string> read_unit() override {
        if (m_owner.m_child_output.empty()) {
            return std::nullopt;
        }
        std::string chunk = std::move(m_owner.m_child_output.front());
        m_owner.m_child_output.pop_front();
        return chunk;
    }

    void write_unit(std::string unit) override { m_owner.send_to_child(unit); }

    void close() override { m_owner.m_session->terminate(); }

private:
    PtyWrapAdapter& m_owner;
};

PtyWrapAdapter::PtyWrapAdapter(net::EventLoop& loop,
                               Sanitizer& sanitizer,
                               net::WorkerPool& pool,
                               TerminalSessionPtr session,
                               int input_fd,
                               int output_fd,
                               int notice_fd,
                               std::string identity)
    : m_loop(loop),
      m_sanitizer(sanitizer),
      m_session(std::move(session)),
      m_identity(std::move(identity)),
      m_input(std::make_shared<net::Connection>(&loop, input_fd, false)),
      m_output(std::make_shared<net::Connection>(&loop, output_fd, false)),
      m_notice(std::make_shared<net::Connection>(&loop, notice_fd, false)),
      m_terminal_side(std::make_unique<TerminalSide>(*this)),
      m_child_side(std::make_unique<ChildSide>(*this)),
      m_input_relay(loop, pool, *m_terminal_side, *m_child_side, Direction::Input, make_filter(), make_blocked_handler()),
      m_output_relay(loop, pool, *m_child_side, *m_terminal_side, Direction::Output, make_filter(),
                     make_blocked_handler()) {
    if (!m_session) {
        throw TransportError("no terminal session");
    }
    m_input_relay.set_settled_callback([this](std::size_t redactions) {
        on_settled(redactions);
        send_eof_when_drained();
    });
    m_output_relay.set_settled_callback([this](std::size_t redactions) {
        on_settled(redactions);
        finish_when_drained();
    });
}

PtyWrapAdapter::~PtyWrapAdapter() {
    m_cancelled->store(true);
    m_input_relay.stop();
    m_output_relay.stop();
    if (m_child_channel) {
        m_child_channel->remove();
    }
    m_input->set_close_callback(nullptr);
    m_input->close();
}

void PtyWrapAdapter::start() {
    m_input->set_data_callback([this](net::Connection&, std::string& input) {
        m_keystrokes.push_back(std::move(input));
        input.clear();
        pump();
    });
    m_input->set_close_callback([this](net::Connection&) {
        m_input_closed = true;
        send_eof_when_drained();
    });
    m_input->start_reading();

    m_child_channel = std::make_unique<net::IoChannel>(&m_loop, m_session->fd());
    m_child_channel->set_read_callback([this] { on_child_readable(); });
    m_child_channel->set_write_callback([this] { flush_input(); });
    m_child_channel->set_close_callback([this] {
        m_child_gone = true;
        m_child_channel->remove();
        finish_when_drained();
    });
    m_child_channel->enable_reading();
}

void PtyWrapAdapter::resize(TerminalSize size) {
    if (!m_finished) {
        m_session->resize(size);
    }
}

void PtyWrapAdapter::interrupt() {
    send_to_child(std::string(1, kEndOfText));
}

bool PtyWrapAdapter::flushed() const noexcept {
    return (m_output->closed() || m_output->pending_output() == 0) &&
           (m_notice->closed() || m_notice->pending_output() == 0);
}

int PtyWrapAdapter::wait() {
    return m_session->wait();
}

UnitFilter<std::string> PtyWrapAdapter::make_filter() const {
    Sanitizer* sanitizer = &m_sanitizer;
    return [sanitizer, identity = m_identity, cancelled = m_cancelled](const std::string& chunk, Direction direction) {
        if (is_blank(chunk)) {
            Filtered<std::string> passthrough;
            passthrough.unit = chunk;
            return passthrough;
        }
        return filter_text(*sanitizer, chunk, direction, identity, cancelled.get());
    };
}

BlockedHandler<std::string> PtyWrapAdapter::make_blocked_handler() {
    // Both directions report on the real terminal; the blocked bytes go nowhere.
    return [this](const std::string&, const Blocked& blocked, Channel<std::string>&, Channel<std::string>&) {
        m_terminal_side->write_unit(std::string(kRed) + "[guard] BLOCKED: " + blocked.message + kReset + "\r\n");
    };
}

void PtyWrapAdapter::on_settled(std::size_t redactions) {
    if (redactions > 0) {
        notice(std::string(kYellow) + "[guard] Redacted " + std::to_string(redactions) + " item(s)" + kReset + "\n");
    }
}

void PtyWrapAdapter::notice(const std::string& text) {
    m_notice->send(text);
}

void PtyWrapAdapter::pump() {
    m_input_relay.pump();
    m_output_relay.pump();
}

void PtyWrapAdapter::send_to_child(const std::string& bytes) {
    if (m_finished || m_child_gone) {
        return;
    }
    m_pending_input += bytes;
    flush_input();
}

// Writes what the child's terminal takes now; the rest waits for POLLOUT.
void PtyWrapAdapter::flush_input() {
    if (m_finished || m_child_gone || !m_child_channel) {
        return;
    }
    try {
        while (!m_pending_input.empty()) {
            const std::size_t n = m_session->write_input(m_pending_input);
            if (n == 0) {
                break;
            }
            m_pending_input.erase(0, n);
        }
    } catch (const TransportError& ex) {
        log_warn("wrap", ex.what());
        m_pending_input.clear();
        m_child_gone = true;
        m_child_channel->remove();
        finish_when_drained();
        return;
    }
    if (m_pending_input.empty()) {
        if (m_child_channel->is_writing()) {
            m_child_channel->disable_writing();
        }
    } else if (!m_child_channel->is_writing()) {
        m_child_channel->enable_writing();
    }
}

void PtyWrapAdapter::on_child_readable() {
    std::optional<std::string> chunk = m_session->read_output();
    if (!chunk) {
        m_child_gone = true;
        m_child_channel->remove();
        finish_when_drained();
        return;
    }
    if (!chunk->empty()) {
        m_child_output.push_back(std::move(*chunk));
        pump();
    }
    // A chatty child keeps the fd readable; give queued input its turn too.
    flush_input();
}

// Hands the child an end-of-file in its own line discipline, after every
// keystroke read before it.
void PtyWrapAdapter::send_eof_when_drained() {
    if (m_input_closed && !m_input_relay.busy() && m_keystrokes.empty()) {
        m_input_closed = false;
        send_to_child(std::string(1, kEndOfTransmission));
    }
}

void PtyWrapAdapter::finish_when_drained() {
    if (m_child_gone && !m_output_relay.busy() && m_child_output.empty()) {
        finish();
    }
}

void PtyWrapAdapter::finish() {
    if (m_finished) {
        return;
    }
    m_finished = true;
    m_cancelled->store(true);
    m_input_relay.stop();
    m_output_relay.stop();
    // Half-processed chunks are dropped, never forwarded partially.
    m_keystrokes.clear();
    m_child_output.clear();
    m_pending_input.clear();
    if (m_child_channel) {
        m_child_channel->remove();
    }
    m_input->set_close_callback(nullptr);
    m_input->stop_reading();
    log_debug("wrap", "child terminal closed");
    if (m_finished_callback) {
        m_finished_callback();
    }
}

} // namespace guardrail::transport

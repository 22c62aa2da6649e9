#include "../../include/guardrail/net/connection.hpp"
#include "../../include/guardrail/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace guardrail::net {

namespace {
constexpr std::size_t kReadChunk = 64 * 1024;
}

Connection::Connection(EventLoop* loop, int fd, bool owns_fd)
    : m_fd(fd), m_owns_fd(owns_fd), m_channel(loop, fd) {
    if (!owns_fd) {
        m_saved_flags = ::fcntl(fd, F_GETFL, 0);
    }
    set_nonblocking(fd);
    m_channel.set_read_callback([this] { handle_read(); });
    m_channel.set_write_callback([this] { handle_write(); });
    m_channel.set_close_callback([this] { close(); });
}

Connection::~Connection() {
    m_channel.remove();
    if (m_owns_fd && m_fd >= 0) {
        ::close(m_fd);
    } else if (!m_owns_fd && m_saved_flags >= 0) {
        ::fcntl(m_fd, F_SETFL, m_saved_flags);
    }
}

void Connection::start_reading() {
    if (!m_closed) {
        m_channel.enable_reading();
    }
}

void Connection::stop_reading() {
    if (!m_closed) {
        m_channel.disable_reading();
    }
}

void Connection::send(std::string_view data) {
    if (m_closed || data.empty()) {
        return;
    }
    m_output.append(data.data(), data.size());
    if (!m_channel.is_writing() && flush() && !m_output.empty()) {
        m_channel.enable_writing();
    }
}

void Connection::shutdown_when_flushed() {
    if (m_output.empty()) {
        close();
        return;
    }
    m_close_after_flush = true;
}

void Connection::close() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_channel.disable_all();
    m_channel.remove();
    if (m_owns_fd) {
        ::close(m_fd);
        m_fd = -1;
    }
    // The callback may drop the last owning reference.
    auto self = shared_from_this();
    if (m_close_callback) {
        m_close_callback(*this);
    }
}

void Connection::handle_read() {
    char buffer[kReadChunk];
    const ssize_t n = ::read(m_fd, buffer, sizeof buffer);
    if (n > 0) {
        m_input.append(buffer, static_cast<std::size_t>(n));
        if (m_data_callback) {
            auto self = shared_from_this();
            m_data_callback(*this, m_input);
        }
        return;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return;
    }
    if (n < 0 && errno != EIO) {
        log_debug("net", std::string("read failed: ") + std::strerror(errno));
    }
    close();
}

void Connection::handle_write() {
    if (!flush()) {
        return;
    }
    if (m_output.empty()) {
        m_channel.disable_writing();
        if (m_close_after_flush) {
            close();
        }
    }
}

bool Connection::flush() {
    while (!m_output.empty()) {
        const ssize_t n = ::write(m_fd, m_output.data(), m_output.size());
        if (n > 0) {
            m_output.erase(0, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        log_debug("net", std::string("write failed: ") + std::strerror(errno));
        close();
        return false;
    }
    return true;
}

} // namespace guardrail::net

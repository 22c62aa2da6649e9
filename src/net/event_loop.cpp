#include "../../include/guardrail/net/event_loop.hpp"
#include "../../include/guardrail/errors.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace guardrail::net {

IoChannel::IoChannel(EventLoop* loop, int fd) : m_loop(loop), m_fd(fd) {}

IoChannel::~IoChannel() {
    if (m_registered) {
        m_loop->remove_channel(this);
    }
}

void IoChannel::enable_reading() {
    m_events |= POLLIN;
    update();
}

void IoChannel::disable_reading() {
    m_events &= ~POLLIN;
    update();
}

void IoChannel::enable_writing() {
    m_events |= POLLOUT;
    update();
}

void IoChannel::disable_writing() {
    m_events &= ~POLLOUT;
    update();
}

void IoChannel::disable_all() {
    m_events = 0;
    update();
}

void IoChannel::remove() {
    if (m_registered) {
        m_loop->remove_channel(this);
        m_registered = false;
    }
}

bool IoChannel::is_reading() const noexcept {
    return (m_events & POLLIN) != 0;
}

bool IoChannel::is_writing() const noexcept {
    return (m_events & POLLOUT) != 0;
}

void IoChannel::update() {
    m_loop->update_channel(this);
    m_registered = true;
}

void IoChannel::handle_event(short revents) {
    if ((revents & POLLNVAL) != 0) {
        if (m_close_callback) {
            m_close_callback();
        }
        return;
    }
    const bool hangup = (revents & (POLLHUP | POLLERR)) != 0;
    if ((revents & (POLLIN | POLLPRI)) != 0 || (hangup && is_reading())) {
        // A reader sees the hang-up as EOF or an error from read(2).
        if (m_read_callback) {
            m_read_callback();
        }
        return;
    }
    if (hangup) {
        if (m_close_callback) {
            m_close_callback();
        }
        return;
    }
    if ((revents & POLLOUT) != 0 && m_write_callback) {
        m_write_callback();
    }
}

EventLoop::EventLoop() {
    m_wakeup_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_wakeup_fd < 0) {
        throw TransportError(std::string("eventfd failed: ") + std::strerror(errno));
    }
    m_wakeup_channel = std::make_unique<IoChannel>(this, m_wakeup_fd);
    m_wakeup_channel->set_read_callback([this] { drain_wakeup(); });
    m_wakeup_channel->enable_reading();
}

EventLoop::~EventLoop() {
    m_wakeup_channel->remove();
    m_wakeup_channel.reset();
    ::close(m_wakeup_fd);
}

void EventLoop::run() {
    m_quit.store(false);
    while (!m_quit.load()) {
        poll_once(1000);
    }
}

int EventLoop::poll_once(int timeout_ms) {
    std::vector<pollfd> fds;
    fds.reserve(m_channels.size());
    for (const auto& [fd, channel] : m_channels) {
        if (channel->events() != 0) {
            fds.push_back(pollfd{fd, channel->events(), 0});
        }
    }

    const int ready = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeout_ms);
    if (ready < 0 && errno != EINTR) {
        throw TransportError(std::string("poll failed: ") + std::strerror(errno));
    }
    if (ready > 0) {
        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }
            // A callback earlier in this round may have removed the channel.
            auto it = m_channels.find(entry.fd);
            if (it == m_channels.end()) {
                continue;
            }
            it->second->handle_event(entry.revents);
        }
    }
    run_pending();
    return ready < 0 ? 0 : ready;
}

void EventLoop::quit() {
    m_quit.store(true);
    wakeup();
}

void EventLoop::queue_in_loop(std::function<void()> fn) {
    {
        std::scoped_lock lock(m_pending_mutex);
        m_pending.push_back(std::move(fn));
    }
    wakeup();
}

void EventLoop::update_channel(IoChannel* channel) {
    m_channels[channel->fd()] = channel;
}

void EventLoop::remove_channel(IoChannel* channel) {
    auto it = m_channels.find(channel->fd());
    if (it != m_channels.end() && it->second == channel) {
        m_channels.erase(it);
    }
}

void EventLoop::wakeup() {
    const std::uint64_t one = 1;
    // EAGAIN only means the counter is already non-zero, so the loop wakes anyway.
    [[maybe_unused]] const ssize_t written = ::write(m_wakeup_fd, &one, sizeof one);
}

void EventLoop::drain_wakeup() {
    std::uint64_t value = 0;
    while (::read(m_wakeup_fd, &value, sizeof value) > 0) {
    }
}

void EventLoop::run_pending() {
    std::vector<std::function<void()>> functors;
    {
        std::scoped_lock lock(m_pending_mutex);
        functors.swap(m_pending);
    }
    for (auto& fn : functors) {
        fn();
    }
}

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw TransportError(std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno));
    }
}

} // namespace guardrail::net

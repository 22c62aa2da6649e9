#pragma once

#include "event_loop.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace guardrail::net {

// Buffered non-blocking byte stream on one fd, driven by an EventLoop.
// Reads are delivered into an input buffer the owner consumes from; writes
// are queued and flushed when the fd becomes writable.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using DataCallback = std::function<void(Connection&, std::string& input)>;
    using CloseCallback = std::function<void(Connection&)>;

    // A borrowed fd (owns_fd false) gets its original file status flags back
    // on destruction.
    Connection(EventLoop* loop, int fd, bool owns_fd = true);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void set_data_callback(DataCallback cb) { m_data_callback = std::move(cb); }
    void set_close_callback(CloseCallback cb) { m_close_callback = std::move(cb); }

    void start_reading();
    void stop_reading();
    void send(std::string_view data);
    // Closes once every queued byte has been written.
    void shutdown_when_flushed();
    void close();

    bool closed() const noexcept { return m_closed; }
    int fd() const noexcept { return m_fd; }
    std::size_t pending_output() const noexcept { return m_output.size(); }

private:
    int m_fd;
    bool m_owns_fd;
    int m_saved_flags = -1;
    bool m_closed = false;
    bool m_close_after_flush = false;
    IoChannel m_channel;
    std::string m_input;
    std::string m_output;
    DataCallback m_data_callback;
    CloseCallback m_close_callback;

    void handle_read();
    void handle_write();
    bool flush();
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace guardrail::net

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace guardrail::net {

class EventLoop;

// One watched file descriptor. Does not own the fd.
class IoChannel {
public:
    using EventCallback = std::function<void()>;

    IoChannel(EventLoop* loop, int fd);
    ~IoChannel();

    IoChannel(const IoChannel&) = delete;
    IoChannel& operator=(const IoChannel&) = delete;

    void set_read_callback(EventCallback cb) { m_read_callback = std::move(cb); }
    void set_write_callback(EventCallback cb) { m_write_callback = std::move(cb); }
    // Hang-up or error on a channel that is not reading.
    void set_close_callback(EventCallback cb) { m_close_callback = std::move(cb); }

    void enable_reading();
    void disable_reading();
    void enable_writing();
    void disable_writing();
    void disable_all();
    void remove();

    bool is_reading() const noexcept;
    bool is_writing() const noexcept;
    int fd() const noexcept { return m_fd; }
    short events() const noexcept { return m_events; }

    void handle_event(short revents);

private:
    EventLoop* m_loop;
    int m_fd;
    short m_events = 0;
    bool m_registered = false;
    EventCallback m_read_callback;
    EventCallback m_write_callback;
    EventCallback m_close_callback;

    void update();
};

// poll(2) reactor. All channel callbacks run on the thread calling run().
class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Dispatches events until quit() is called.
    void run();
    // One poll round plus queued functors; returns the number of ready fds.
    int poll_once(int timeout_ms);
    // Thread-safe.
    void quit();
    bool quitting() const noexcept { return m_quit.load(); }

    // Thread-safe; the functor runs on the loop thread.
    void queue_in_loop(std::function<void()> fn);

    void update_channel(IoChannel* channel);
    void remove_channel(IoChannel* channel);
    std::size_t channel_count() const noexcept { return m_channels.size(); }

private:
    std::map<int, IoChannel*> m_channels;
    int m_wakeup_fd = -1;
    std::unique_ptr<IoChannel> m_wakeup_channel;
    std::mutex m_pending_mutex;
    std::vector<std::function<void()>> m_pending;
    std::atomic<bool> m_quit{false};

    void wakeup();
    void drain_wakeup();
    void run_pending();
};

// Puts the fd into non-blocking mode; throws TransportError on failure.
void set_nonblocking(int fd);

} // namespace guardrail::net

#pragma once

#include "../net/connection.hpp"
#include "../net/event_loop.hpp"
#include "../net/worker_pool.hpp"
#include "../sanitizer.hpp"
#include "http_message.hpp"
#include "relay.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace guardrail::transport {

// Where sanitized requests are sent. Implementations block; the proxy calls
// them from its worker pool.
class Upstream {
public:
    virtual ~Upstream() = default;

    // Throws TransportError when no response could be obtained.
    virtual HttpMessage forward(const HttpMessage& request, const std::atomic<bool>* cancelled) = 0;
};

class CurlUpstream final : public Upstream {
public:
    explicit CurlUpstream(std::string base_url, long timeout_ms = -1);

    HttpMessage forward(const HttpMessage& request, const std::atomic<bool>* cancelled) override;

    const std::string& base_url() const noexcept { return m_base_url; }

private:
    std::string m_base_url;
    long m_timeout_ms;
};

// Decimal listen port; throws ConfigError unless it is within 1..65535.
std::uint16_t parse_port(const std::string& text);

// base "https://host/v1/" + target "/chat" -> "https://host/v1/chat".
std::string join_url(const std::string& base, const std::string& target);

// Request headers minus Host, Content-Length, Connection, Transfer-Encoding,
// the other hop-by-hop headers and Accept-Encoding (bodies must stay readable).
net::HeaderList upstream_headers(const net::HeaderList& headers);

// Sanitizes a request or response body: JSON bodies field by field, anything
// else as plain text. The message spends one rate-limit token up front,
// however many fields it carries; empty bodies are metered and then pass
// untouched.
Filtered<HttpMessage> filter_http_message(Sanitizer& sanitizer,
                                          const HttpMessage& message,
                                          Direction direction,
                                          const std::string& identity,
                                          const std::atomic<bool>* cancelled = nullptr);

// Sanitizing HTTP/1.1 reverse proxy in front of one upstream. Sanitization
// and upstream calls run on `pool`, which must be destroyed before the
// sanitizer and the loop.
class HttpProxyAdapter {
public:
    HttpProxyAdapter(net::EventLoop& loop,
                     Sanitizer& sanitizer,
                     std::shared_ptr<Upstream> upstream,
                     net::WorkerPool& pool);
    ~HttpProxyAdapter();

    HttpProxyAdapter(const HttpProxyAdapter&) = delete;
    HttpProxyAdapter& operator=(const HttpProxyAdapter&) = delete;

    // Binds and starts accepting. Returns the bound port, which is useful
    // when `port` is 0. Throws TransportError.
    std::uint16_t listen(const std::string& address, std::uint16_t port);

    // Serves an already connected stream socket; `peer` is the rate-limit identity.
    void adopt(int fd, std::string peer);

    std::size_t session_count() const noexcept { return m_sessions.size(); }
    void close_all();

private:
    class Session;

    net::EventLoop& m_loop;
    Sanitizer& m_sanitizer;
    std::shared_ptr<Upstream> m_upstream;
    net::WorkerPool& m_pool;
    int m_listen_fd = -1;
    std::unique_ptr<net::IoChannel> m_accept_channel;
    std::map<std::uint64_t, std::shared_ptr<Session>> m_sessions;
    std::uint64_t m_next_session = 1;
    std::shared_ptr<HttpProxyAdapter*> m_token;

    void handle_accept();
    void release_session(std::uint64_t id);
};

} // namespace guardrail::transport

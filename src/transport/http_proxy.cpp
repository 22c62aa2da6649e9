#include "../../include/guardrail/transport/http_proxy.hpp"
#include "../../include/guardrail/errors.hpp"
#include "../../include/guardrail/json.hpp"
#include "../../include/guardrail/log.hpp"
#include "../../include/guardrail/transport/json_content.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <exception>
#include <netinet/in.h>
#include <optional>
#include <sys/socket.h>
#include <unistd.h>
#include <variant>

namespace guardrail::transport {

namespace {

const char* const kDroppedRequestHeaders[] = {
    "Host", "Content-Length", "Connection", "Transfer-Encoding", "Keep-Alive",
    "Proxy-Connection", "Upgrade", "TE", "Accept-Encoding", "Expect",
};

constexpr const char* kContinue = "HTTP/1.1 100 Continue\r\n\r\n";

const char* const kDroppedResponseHeaders[] = {
    "Content-Length", "Transfer-Encoding", "Connection", "Keep-Alive",
};

template <std::size_t N>
bool is_listed(const std::string& name, const char* const (&list)[N]) {
    for (const char* entry : list) {
        if (iequals(name, entry)) {
            return true;
        }
    }
    return false;
}

std::optional<Json> try_parse_json(const std::string& body) {
    try {
        return Json::parse(body);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

int input_block_status(const Blocked& blocked) {
    switch (blocked.reason) {
    case BlockReason::RateLimited: return 429;
    case BlockReason::Internal: return 500;
    default: return 400;
    }
}

} // namespace

std::uint16_t parse_port(const std::string& text) {
    const bool digits = !text.empty() && text.size() <= 5 &&
                        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    const unsigned long value = digits ? std::strtoul(text.c_str(), nullptr, 10) : 0;
    if (value < 1 || value > 65535) {
        throw ConfigError("invalid port: " + text);
    }
    return static_cast<std::uint16_t>(value);
}

std::string join_url(const std::string& base, const std::string& target) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (target.empty() || target.front() != '/') {
        url.push_back('/');
    }
    return url + target;
}

net::HeaderList upstream_headers(const net::HeaderList& headers) {
    net::HeaderList out;
    for (const auto& [name, value] : headers) {
        if (!is_listed(name, kDroppedRequestHeaders)) {
            out.emplace_back(name, value);
        }
    }
    return out;
}

Filtered<HttpMessage> filter_http_message(Sanitizer& sanitizer,
                                          const HttpMessage& message,
                                          Direction direction,
                                          const std::string& identity,
                                          const std::atomic<bool>* cancelled) {
    Filtered<HttpMessage> out;
    // One token per message, bodiless ones included.
    if (auto blocked = sanitizer.admit(identity, direction, message.body)) {
        out.blocked = std::move(blocked);
        return out;
    }
    if (message.body.empty()) {
        out.unit = message;
        return out;
    }

    std::optional<Json> parsed = try_parse_json(message.body);
    if (!parsed) {
        Filtered<std::string> text =
            filter_text(sanitizer, message.body, direction, identity, cancelled, Admission::Granted);
        out.redactions = text.redactions;
        if (text.blocked) {
            out.blocked = std::move(text.blocked);
            return out;
        }
        out.unit = message;
        out.unit->body = std::move(*text.unit);
        return out;
    }

    FieldContext ctx{sanitizer, direction, identity, cancelled};
    std::optional<Blocked> blocked = parsed->is_string()
        ? sanitize_field(ctx, parsed->as_string())
        : sanitize_chat_body(ctx, *parsed);
    out.redactions = ctx.redactions;
    if (blocked) {
        out.blocked = std::move(blocked);
        return out;
    }
    out.unit = message;
    // Untouched bodies keep their original bytes and key order.
    if (ctx.redactions > 0) {
        out.unit->body = parsed->dump();
    }
    return out;
}

CurlUpstream::CurlUpstream(std::string base_url, long timeout_ms)
    : m_base_url(std::move(base_url)), m_timeout_ms(timeout_ms) {}

HttpMessage CurlUpstream::forward(const HttpMessage& request, const std::atomic<bool>* cancelled) {
    net::HttpResponse response = net::perform(request.method,
                                               join_url(m_base_url, request.target),
                                               upstream_headers(request.headers),
                                               request.body,
                                               m_timeout_ms,
                                               cancelled);
    HttpMessage out;
    out.status = static_cast<int>(response.status);
    out.reason = reason_phrase(out.status);
    for (auto& [name, value] : response.headers) {
        if (!is_listed(name, kDroppedResponseHeaders)) {
            out.headers.emplace_back(std::move(name), std::move(value));
        }
    }
    out.body = std::move(response.body);
    return out;
}

// One client connection. Requests are answered strictly in order with at
// most one of them at the upstream at a time.
class HttpProxyAdapter::Session : public std::enable_shared_from_this<Session> {
public:
    Session(HttpProxyAdapter& owner, std::uint64_t id, net::ConnectionPtr connection, std::string peer)
        : m_owner(owner),
          m_id(id),
          m_connection(std::move(connection)),
          m_peer(std::move(peer)),
          m_cancelled(std::make_shared<std::atomic<bool>>(false)),
          m_client(*this),
          m_server(*this),
          m_output_relay(owner.m_loop, owner.m_pool, m_server, m_client, Direction::Output, make_filter(),
                         [](const HttpMessage&, const Blocked& blocked, Channel<HttpMessage>&, Channel<HttpMessage>& to) {
                             to.write_unit(make_error_response(500, "Output blocked: " + blocked.message));
                         }),
          m_input_relay(owner.m_loop, owner.m_pool, m_client, m_server, Direction::Input, make_filter(),
                        [](const HttpMessage&, const Blocked& blocked, Channel<HttpMessage>& from, Channel<HttpMessage>&) {
                            from.write_unit(make_error_response(input_block_status(blocked),
                                                                "Input blocked: " + blocked.message));
                        }) {
        m_output_relay.set_settled_callback([this](std::size_t) { pump(); });
        m_input_relay.set_settled_callback([this](std::size_t) { pump(); });
    }

    void start() {
        std::weak_ptr<Session> weak = shared_from_this();
        m_connection->set_data_callback([weak](net::Connection&, std::string& input) {
            if (auto session = weak.lock()) {
                session->on_data(input);
            }
        });
        std::weak_ptr<HttpProxyAdapter*> token = m_owner.m_token;
        net::EventLoop* loop = &m_owner.m_loop;
        const std::uint64_t id = m_id;
        m_connection->set_close_callback([weak, token, loop, id](net::Connection&) {
            if (auto session = weak.lock()) {
                session->cancel();
            }
            // Released later so no session is destroyed inside its own callback.
            loop->queue_in_loop([token, id] {
                if (auto adapter = token.lock()) {
                    (*adapter)->release_session(id);
                }
            });
        });
        m_connection->start_reading();
    }

    // Aborts whatever is in flight for this connection; late verdicts and
    // upstream replies are dropped.
    void cancel() {
        m_cancelled->store(true);
        m_input_relay.stop();
        m_output_relay.stop();
    }

    void close() {
        cancel();
        m_connection->close();
    }

private:
    class ClientSide final : public Channel<HttpMessage> {
    public:
        explicit ClientSide(Session& session) : m_session(session) {}

        std::optional<HttpMessage> read_unit() override {
            Session& s = m_session;
            if (s.m_awaiting || s.m_draining || s.m_requests.empty() || s.m_connection->closed()) {
                return std::nullopt;
            }
            HttpMessage request = std::move(s.m_requests.front());
            s.m_requests.pop_front();
            s.m_awaiting = true;
            s.m_keep_alive = request.keep_alive();
            log_debug("proxy", s.m_peer + " " + request.method + " " + request.target);
            return request;
        }

        void write_unit(HttpMessage response) override {
            Session& s = m_session;
            s.m_awaiting = false;
            if (s.m_connection->closed()) {
                return;
            }
            log_debug("proxy", s.m_peer + " <- " + std::to_string(response.status));
            s.m_connection->send(serialize_response(response, s.m_keep_alive));
            if (!s.m_keep_alive) {
                s.m_draining = true;
                s.m_connection->shutdown_when_flushed();
                return;
            }
            s.send_continue_if_due();
        }

        void close() override { m_session.close(); }

    private:
        Session& m_session;
    };

    class UpstreamSide final : public Channel<HttpMessage> {
    public:
        explicit UpstreamSide(Session& session) : m_session(session) {}

        std::optional<HttpMessage> read_unit() override {
            auto& responses = m_session.m_responses;
            if (responses.empty()) {
                return std::nullopt;
            }
            HttpMessage response = std::move(responses.front());
            responses.pop_front();
            return response;
        }

        void write_unit(HttpMessage request) override {
            if (!m_session.m_cancelled->load()) {
                m_session.dispatch(std::move(request));
            }
        }

        void close() override { m_session.cancel(); }

    private:
        Session& m_session;
    };

    HttpProxyAdapter& m_owner;
    std::uint64_t m_id;
    net::ConnectionPtr m_connection;
    std::string m_peer;
    std::shared_ptr<std::atomic<bool>> m_cancelled;
    HttpRequestParser m_parser;
    std::deque<HttpMessage> m_requests;
    std::deque<HttpMessage> m_responses;
    std::optional<HttpMessage> m_parse_failure;
    bool m_awaiting = false;
    bool m_keep_alive = true;
    bool m_draining = false;
    bool m_continue_owed = false;
    ClientSide m_client;
    UpstreamSide m_server;
    Relay<HttpMessage> m_output_relay;
    Relay<HttpMessage> m_input_relay;

    // Runs on a pool thread, so it holds nothing owned by the session.
    UnitFilter<HttpMessage> make_filter() const {
        Sanitizer* sanitizer = &m_owner.m_sanitizer;
        std::string peer = m_peer;
        std::shared_ptr<std::atomic<bool>> cancelled = m_cancelled;
        return [sanitizer, peer, cancelled](const HttpMessage& message, Direction direction) {
            return filter_http_message(*sanitizer, message, direction, peer, cancelled.get());
        };
    }

    void on_data(std::string& input) {
        while (!m_parse_failure) {
            HttpMessage request;
            const auto state = m_parser.parse(input, request);
            if (state == HttpRequestParser::State::NeedMore) {
                break;
            }
            if (state == HttpRequestParser::State::Error) {
                log_warn("proxy", m_peer + ": " + m_parser.error());
                m_parse_failure = make_error_response(m_parser.error_status(), m_parser.error());
                m_connection->stop_reading();
                input.clear();
                break;
            }
            m_continue_owed = false;
            m_requests.push_back(std::move(request));
        }
        if (m_parser.take_continue()) {
            m_continue_owed = true;
        }
        send_continue_if_due();
        pump();
    }

    // The interim reply may only go out once every earlier request was answered.
    void send_continue_if_due() {
        if (m_continue_owed && !m_awaiting && m_requests.empty() && !m_parse_failure && !m_connection->closed()) {
            m_continue_owed = false;
            m_connection->send(kContinue);
        }
    }

    void pump() {
        m_output_relay.pump();
        m_input_relay.pump();
        if (m_parse_failure && !m_awaiting && m_requests.empty() && !m_draining) {
            m_keep_alive = false;
            m_client.write_unit(std::move(*m_parse_failure));
        }
    }

    void dispatch(HttpMessage request) {
        std::weak_ptr<Session> weak = shared_from_this();
        std::shared_ptr<Upstream> upstream = m_owner.m_upstream;
        std::shared_ptr<std::atomic<bool>> cancelled = m_cancelled;
        net::EventLoop* loop = &m_owner.m_loop;
        m_owner.m_pool.submit([weak, upstream, cancelled, loop, request = std::move(request)] {
            std::optional<HttpMessage> response;
            std::string failure;
            try {
                response = upstream->forward(request, cancelled.get());
            } catch (const std::exception& ex) {
                failure = ex.what();
            }
            loop->queue_in_loop([weak, response = std::move(response), failure = std::move(failure)]() mutable {
                auto session = weak.lock();
                if (!session) {
                    return;
                }
                if (response) {
                    session->deliver(std::move(*response));
                } else {
                    session->fail_upstream(failure);
                }
            });
        });
    }

    void deliver(HttpMessage response) {
        m_responses.push_back(std::move(response));
        pump();
    }

    void fail_upstream(const std::string& detail) {
        log_warn("proxy", "upstream error: " + detail);
        m_client.write_unit(make_error_response(502, "Upstream error: " + detail));
        pump();
    }
};

HttpProxyAdapter::HttpProxyAdapter(net::EventLoop& loop,
                                   Sanitizer& sanitizer,
                                   std::shared_ptr<Upstream> upstream,
                                   net::WorkerPool& pool)
    : m_loop(loop),
      m_sanitizer(sanitizer),
      m_upstream(std::move(upstream)),
      m_pool(pool),
      m_token(std::make_shared<HttpProxyAdapter*>(this)) {
    if (!m_upstream) {
        throw ConfigError("proxy requires an upstream");
    }
}

HttpProxyAdapter::~HttpProxyAdapter() {
    m_token.reset();
    close_all();
    if (m_accept_channel) {
        m_accept_channel->remove();
        m_accept_channel.reset();
    }
    if (m_listen_fd >= 0) {
        ::close(m_listen_fd);
    }
}

std::uint16_t HttpProxyAdapter::listen(const std::string& address, std::uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        throw TransportError("invalid listen address: " + address);
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        throw TransportError(std::string("socket failed: ") + std::strerror(errno));
    }
    const int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof addr) < 0 || ::listen(fd, SOMAXCONN) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw TransportError("cannot listen on " + address + ":" + std::to_string(port) + ": " + reason);
    }

    sockaddr_in bound{};
    socklen_t length = sizeof bound;
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &length);

    m_listen_fd = fd;
    m_accept_channel = std::make_unique<net::IoChannel>(&m_loop, fd);
    m_accept_channel->set_read_callback([this] { handle_accept(); });
    m_accept_channel->enable_reading();
    return ntohs(bound.sin_port);
}

void HttpProxyAdapter::handle_accept() {
    for (;;) {
        sockaddr_in peer{};
        socklen_t length = sizeof peer;
        const int fd = ::accept4(m_listen_fd, reinterpret_cast<sockaddr*>(&peer), &length, SOCK_CLOEXEC | SOCK_NONBLOCK);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                log_warn("proxy", std::string("accept failed: ") + std::strerror(errno));
            }
            return;
        }
        char ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof ip);
        adopt(fd, ip);
    }
}

void HttpProxyAdapter::adopt(int fd, std::string peer) {
    auto connection = std::make_shared<net::Connection>(&m_loop, fd);
    const std::uint64_t id = m_next_session++;
    auto session = std::make_shared<Session>(*this, id, std::move(connection), std::move(peer));
    m_sessions.emplace(id, session);
    session->start();
}

void HttpProxyAdapter::close_all() {
    // Connection close callbacks only queue the release, so iterating is safe.
    for (auto& [id, session] : m_sessions) {
        session->close();
    }
    m_sessions.clear();
}

void HttpProxyAdapter::release_session(std::uint64_t id) {
    m_sessions.erase(id);
}

} // namespace guardrail::transport

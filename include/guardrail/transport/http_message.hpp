#pragma once

#include "../net/http.hpp"

#include <cstddef>
#include <string>

namespace guardrail::transport {

// Request or response, depending on which start-line fields are set.
struct HttpMessage {
    std::string method;
    std::string target;
    std::string version = "HTTP/1.1";
    int status = 0;
    std::string reason;
    net::HeaderList headers;
    std::string body;

    // Case-insensitive lookup; nullptr when absent.
    const std::string* header(const std::string& name) const;
    void set_header(const std::string& name, std::string value);
    void remove_header(const std::string& name);
    bool keep_alive() const;
};

bool iequals(const std::string& a, const std::string& b);

// Incremental HTTP/1.1 request reader. Bodies are framed by Content-Length
// or chunked transfer encoding. Parsed bytes are consumed from the caller's
// buffer as they arrive and the parser keeps its place between calls, so a
// request is read in time linear in its size however it is split.
class HttpRequestParser {
public:
    enum class State { NeedMore, Complete, Error };

    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
    static constexpr std::size_t kMaxBodyBytes = 32 * 1024 * 1024;

    // Consumes what it can from the front of `buffer`; Complete once one
    // whole request sits in `out`.
    State parse(std::string& buffer, HttpMessage& out);

    // True once per request that sent `Expect: 100-continue` and whose body
    // has not fully arrived.
    bool take_continue() noexcept;

    int error_status() const noexcept { return m_error_status; }
    const std::string& error() const noexcept { return m_error; }

private:
    enum class Phase { Head, Body, ChunkSize, ChunkData, ChunkEnd, Trailer };

    Phase m_phase = Phase::Head;
    HttpMessage m_message;
    std::size_t m_remaining = 0;
    std::size_t m_scanned = 0;
    std::size_t m_trailer_bytes = 0;
    bool m_continue = false;
    int m_error_status = 400;
    std::string m_error;

    State parse_head(std::string& buffer);
    State parse_body(const std::string& buffer, std::size_t& pos, HttpMessage& out);
    State complete(HttpMessage& out);
    State fail(int status, std::string message);
};

std::string serialize_response(const HttpMessage& response, bool keep_alive);

// `{"error":{"message":...,"type":"guard_error"}}` with a JSON content type.
HttpMessage make_error_response(int status, const std::string& message);

std::string reason_phrase(int status);

} // namespace guardrail::transport

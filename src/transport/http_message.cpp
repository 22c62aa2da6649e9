#include "../../include/guardrail/transport/http_message.hpp"
#include "../../include/guardrail/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace guardrail::transport {

namespace {

std::string trim(const std::string& text) {
    std::size_t start = 0;
    std::size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

bool contains_token(const std::string& value, const std::string& token) {
    std::size_t pos = 0;
    while (pos <= value.size()) {
        std::size_t comma = value.find(',', pos);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        if (iequals(trim(value.substr(pos, comma - pos)), token)) {
            return true;
        }
        pos = comma + 1;
    }
    return false;
}

bool parse_size(const std::string& text, int base, std::size_t& out) {
    if (text.empty() || !std::isxdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, base);
    if (end == text.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

} // namespace

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

const std::string* HttpMessage::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

void HttpMessage::set_header(const std::string& name, std::string value) {
    remove_header(name);
    headers.emplace_back(name, std::move(value));
}

void HttpMessage::remove_header(const std::string& name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&](const auto& entry) { return iequals(entry.first, name); }),
                  headers.end());
}

bool HttpMessage::keep_alive() const {
    const std::string* connection = header("Connection");
    if (version == "HTTP/1.0") {
        return connection && contains_token(*connection, "keep-alive");
    }
    return !(connection && contains_token(*connection, "close"));
}

namespace {
constexpr std::size_t kMaxChunkLine = 1024;
}

HttpRequestParser::State HttpRequestParser::fail(int status, std::string message) {
    m_error_status = status;
    m_error = std::move(message);
    return State::Error;
}

bool HttpRequestParser::take_continue() noexcept {
    return std::exchange(m_continue, false);
}

HttpRequestParser::State HttpRequestParser::complete(HttpMessage& out) {
    out = std::move(m_message);
    m_message = HttpMessage();
    m_phase = Phase::Head;
    m_scanned = 0;
    m_continue = false;
    return State::Complete;
}

HttpRequestParser::State HttpRequestParser::parse_head(std::string& buffer) {
    // The blank line may straddle the previous read.
    const std::size_t from = m_scanned >= 3 ? m_scanned - 3 : 0;
    const std::size_t head_end = buffer.find("\r\n\r\n", from);
    if (head_end == std::string::npos) {
        if (buffer.size() > kMaxHeaderBytes) {
            return fail(431, "request header too large");
        }
        m_scanned = buffer.size();
        return State::NeedMore;
    }

    HttpMessage& message = m_message;
    const std::size_t line_end = buffer.find("\r\n");
    const std::string request_line = buffer.substr(0, line_end);
    const std::size_t sp1 = request_line.find(' ');
    const std::size_t sp2 = sp1 == std::string::npos ? std::string::npos : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) {
        return fail(400, "malformed request line");
    }
    message.method = request_line.substr(0, sp1);
    message.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    message.version = request_line.substr(sp2 + 1);
    if (message.method.empty() || message.target.empty() || message.version.rfind("HTTP/1.", 0) != 0) {
        return fail(400, "malformed request line");
    }

    std::size_t pos = line_end + 2;
    while (pos < head_end) {
        std::size_t eol = buffer.find("\r\n", pos);
        const std::string line = buffer.substr(pos, eol - pos);
        pos = eol + 2;
        const std::size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return fail(400, "malformed header line");
        }
        message.headers.emplace_back(line.substr(0, colon), trim(line.substr(colon + 1)));
    }
    buffer.erase(0, head_end + 4);

    const std::string* transfer_encoding = message.header("Transfer-Encoding");
    if (transfer_encoding && contains_token(*transfer_encoding, "chunked")) {
        message.remove_header("Transfer-Encoding");
        m_phase = Phase::ChunkSize;
    } else if (const std::string* length = message.header("Content-Length")) {
        std::size_t size = 0;
        if (!parse_size(*length, 10, size)) {
            return fail(400, "invalid Content-Length");
        }
        if (size > kMaxBodyBytes) {
            return fail(413, "request body too large");
        }
        m_remaining = size;
        m_phase = Phase::Body;
    } else {
        return State::Complete;
    }

    // Answered here; the upstream receives a complete body.
    if (const std::string* expect = message.header("Expect")) {
        m_continue = contains_token(*expect, "100-continue");
        message.remove_header("Expect");
    }
    return State::NeedMore;
}

HttpRequestParser::State HttpRequestParser::parse(std::string& buffer, HttpMessage& out) {
    if (m_phase == Phase::Head) {
        const State state = parse_head(buffer);
        if (state == State::Complete) {
            return complete(out);
        }
        if (state == State::Error || m_phase == Phase::Head) {
            return state;
        }
    }
    // Body bytes are consumed through a cursor and erased once on the way out.
    std::size_t pos = 0;
    const State state = parse_body(buffer, pos, out);
    buffer.erase(0, pos);
    return state;
}

HttpRequestParser::State HttpRequestParser::parse_body(const std::string& buffer, std::size_t& pos, HttpMessage& out) {
    for (;;) {
        const std::size_t available = buffer.size() - pos;
        switch (m_phase) {
        case Phase::Head:
            return State::NeedMore;
        case Phase::Body:
        case Phase::ChunkData: {
            const std::size_t take = std::min(m_remaining, available);
            m_message.body.append(buffer, pos, take);
            pos += take;
            m_remaining -= take;
            if (m_remaining > 0) {
                return State::NeedMore;
            }
            if (m_phase == Phase::Body) {
                return complete(out);
            }
            m_phase = Phase::ChunkEnd;
            break;
        }
        case Phase::ChunkSize: {
            const std::size_t size_end = buffer.find("\r\n", pos);
            if (size_end == std::string::npos) {
                if (available > kMaxChunkLine) {
                    return fail(400, "malformed chunk size");
                }
                return State::NeedMore;
            }
            std::string size_text = buffer.substr(pos, size_end - pos);
            if (auto ext = size_text.find(';'); ext != std::string::npos) {
                size_text.resize(ext);
            }
            std::size_t chunk = 0;
            if (!parse_size(trim(size_text), 16, chunk)) {
                return fail(400, "malformed chunk size");
            }
            if (chunk > kMaxBodyBytes || m_message.body.size() + chunk > kMaxBodyBytes) {
                return fail(413, "request body too large");
            }
            pos = size_end + 2;
            m_remaining = chunk;
            m_trailer_bytes = 0;
            m_phase = chunk == 0 ? Phase::Trailer : Phase::ChunkData;
            break;
        }
        case Phase::ChunkEnd:
            if (available < 2) {
                return State::NeedMore;
            }
            if (buffer.compare(pos, 2, "\r\n") != 0) {
                return fail(400, "malformed chunk terminator");
            }
            pos += 2;
            m_phase = Phase::ChunkSize;
            break;
        case Phase::Trailer: {
            // Trailer fields are dropped; the section ends with an empty line.
            const std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos) {
                if (m_trailer_bytes + available > kMaxHeaderBytes) {
                    return fail(431, "request trailer too large");
                }
                return State::NeedMore;
            }
            const std::size_t line = eol - pos;
            pos = eol + 2;
            if (line == 0) {
                return complete(out);
            }
            m_trailer_bytes += line + 2;
            break;
        }
        }
    }
}

std::string reason_phrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "Status";
    }
}

std::string serialize_response(const HttpMessage& response, bool keep_alive) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + ' ' +
                      (response.reason.empty() ? reason_phrase(response.status) : response.reason) + "\r\n";
    for (const auto& [name, value] : response.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Transfer-Encoding") || iequals(name, "Connection")) {
            continue;
        }
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    out += response.body;
    return out;
}

HttpMessage make_error_response(int status, const std::string& message) {
    JsonObject error;
    error["message"] = Json(message);
    error["type"] = Json("guard_error");
    JsonObject root;
    root["error"] = Json(std::move(error));

    HttpMessage response;
    response.status = status;
    response.reason = reason_phrase(status);
    response.headers.emplace_back("content-type", "application/json");
    response.body = Json(std::move(root)).dump();
    return response;
}

} // namespace guardrail::transport

#pragma once

#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace guardrail::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status = 0;
    HeaderList headers;
    std::string body;
};

// POSTs a JSON body and returns the response body. Throws TransportError on
// connection failure, cancellation or a non-2xx status.
std::string post_json(const std::string& url,
                      const std::string& body,
                      const HeaderList& headers,
                      long timeout_ms = -1,
                      const std::atomic<bool>* cancelled = nullptr);

// Issues an arbitrary request and returns whatever status the server sent.
// Throws TransportError only when no response could be obtained. Setting
// *cancelled aborts the transfer.
HttpResponse perform(const std::string& method,
                     const std::string& url,
                     const HeaderList& headers,
                     const std::string& body,
                     long timeout_ms = -1,
                     const std::atomic<bool>* cancelled = nullptr);

// timeout_ms when positive, else GUARDRAIL_HTTP_TIMEOUT_MS, else 60 s.
long resolve_timeout(long timeout_ms);

} // namespace guardrail::net

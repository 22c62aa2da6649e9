#include "../../include/guardrail/net/http.hpp"
#include "../../include/guardrail/config.hpp"
#include "../../include/guardrail/errors.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

void ensure_curl_global() {
    static CurlGlobal global_guard;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* headers = static_cast<guardrail::net::HeaderList*>(userdata);
    const std::string line(ptr, total);
    if (line.rfind("HTTP/", 0) == 0) {
        // A new status line (after 100 Continue or a redirect) starts a fresh header block.
        headers->clear();
        return total;
    }
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        headers->emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancelled = static_cast<const std::atomic<bool>*>(userdata);
    return cancelled && cancelled->load(std::memory_order_relaxed) ? 1 : 0;
}

struct CurlHandle {
    CURL* handle = nullptr;
    struct curl_slist* header_list = nullptr;

    CurlHandle() : handle(curl_easy_init()) {}
    ~CurlHandle() {
        if (header_list) {
            curl_slist_free_all(header_list);
        }
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

} // namespace

namespace guardrail::net {

long resolve_timeout(long timeout_ms) {
    if (timeout_ms > 0) {
        return timeout_ms;
    }

    long resolved = 60000; // upstream model servers can take a while to answer.
    const std::string raw = read_environment_variable("GUARDRAIL_HTTP_TIMEOUT_MS");
    if (!raw.empty()) {
        char* end = nullptr;
        const long candidate = std::strtol(raw.c_str(), &end, 10);
        if (end != raw.c_str() && candidate > 0) {
            resolved = candidate;
        }
    }
    return resolved;
}

HttpResponse perform(const std::string& method,
                     const std::string& url,
                     const HeaderList& headers,
                     const std::string& body,
                     long timeout_ms,
                     const std::atomic<bool>* cancelled) {
    ensure_curl_global();

    const long resolved_timeout = resolve_timeout(timeout_ms);

    CurlHandle curl;
    if (!curl.handle) {
        throw TransportError("curl_easy_init failed");
    }

    HttpResponse response;
    CURL* handle = curl.handle;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    if (method == "GET" && body.empty()) {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else {
        if (method != "POST") {
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
        }
        if (!body.empty() || method == "POST" || method == "PUT" || method == "PATCH") {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        }
    }
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, resolved_timeout);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, resolved_timeout);
    if (cancelled) {
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(cancelled));
    }

    // Let the caller's headers through verbatim; suppress curl's own defaults.
    curl.header_list = curl_slist_append(curl.header_list, "Expect:");
    bool has_accept = false;
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        curl.header_list = curl_slist_append(curl.header_list, line.c_str());
        std::string lowered = header.first;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        has_accept = has_accept || lowered == "accept";
    }
    if (!has_accept) {
        curl.header_list = curl_slist_append(curl.header_list, "Accept:");
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, curl.header_list);

    const CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << method << ' ' << url << " failed " << (code == CURLE_ABORTED_BY_CALLBACK ? "cancelled" : curl_easy_strerror(code));
        throw TransportError(oss.str());
    }
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::string post_json(const std::string& url,
                      const std::string& body,
                      const HeaderList& headers,
                      long timeout_ms,
                      const std::atomic<bool>* cancelled) {
    HeaderList all_headers;
    all_headers.emplace_back("Content-Type", "application/json");
    all_headers.insert(all_headers.end(), headers.begin(), headers.end());

    HttpResponse response = perform("POST", url, all_headers, body, timeout_ms, cancelled);
    if (response.status < 200 || response.status >= 300) {
        std::ostringstream oss;
        oss << "POST " << url << " failed " << response.status;
        throw TransportError(oss.str());
    }
    return std::move(response.body);
}

} // namespace guardrail::net

#pragma once

#include "config.hpp"
#include "json.hpp"
#include "types.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace guardrail {

struct AuditRecord {
    std::string timestamp;
    std::string identity;
    Direction direction = Direction::Input;
    std::string verdict;
    // SHA-256 of the original, pre-redaction text.
    std::string content_hash;
    std::optional<std::string> category;
    std::optional<double> score;
    std::vector<std::string> redaction_categories;
    // Injection category that scored above sensitivity without blocking.
    std::optional<std::string> flagged;
    // Only populated when log_content is set.
    std::optional<std::string> content;

    Json to_json() const;
};

// Append-only audit trail. Records are queued and written in order by a
// background writer; the destructor drains the queue before returning.
class AuditRecorder {
public:
    // Throws ConfigError when log_file cannot be opened for appending.
    explicit AuditRecorder(const AuditConfig& config);
    ~AuditRecorder();

    AuditRecorder(const AuditRecorder&) = delete;
    AuditRecorder& operator=(const AuditRecorder&) = delete;

    bool enabled() const noexcept { return m_config.enabled; }
    bool log_content() const noexcept { return m_config.log_content; }

    void record(AuditRecord record);

    // Blocks until everything queued so far has reached the sink.
    void flush();

    // Newest records kept in process when no log_file is configured.
    static constexpr std::size_t kMaxKept = 1024;

    // Oldest first; at most kMaxKept.
    std::vector<AuditRecord> records() const;

    std::size_t failed_writes() const;

private:
    AuditConfig m_config;
    std::ofstream m_file;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained_cv;
    std::deque<AuditRecord> m_queue;
    std::deque<AuditRecord> m_memory;
    std::size_t m_enqueued = 0;
    std::size_t m_written = 0;
    std::size_t m_failed = 0;
    bool m_stopping = false;
    std::thread m_writer;

    void writer_loop();
    bool write_line(const std::string& line);
};

} // namespace guardrail

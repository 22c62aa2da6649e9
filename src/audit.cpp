#include "../include/guardrail/audit.hpp"
#include "../include/guardrail/errors.hpp"
#include "../include/guardrail/log.hpp"

#include <utility>

namespace guardrail {

Json AuditRecord::to_json() const {
    JsonObject obj;
    obj["timestamp"] = Json(timestamp);
    obj["identity"] = Json(identity);
    obj["direction"] = Json(direction_name(direction));
    obj["verdict"] = Json(verdict);
    obj["content_hash"] = Json(content_hash);
    if (category) {
        obj["category"] = Json(*category);
    }
    if (score) {
        obj["score"] = Json(*score);
    }
    if (!redaction_categories.empty()) {
        JsonArray categories;
        for (const auto& name : redaction_categories) {
            categories.emplace_back(Json(name));
        }
        obj["redactions"] = Json(categories);
    }
    if (flagged) {
        obj["flagged"] = Json(*flagged);
    }
    if (content) {
        obj["content"] = Json(*content);
    }
    return Json(obj);
}

AuditRecorder::AuditRecorder(const AuditConfig& config) : m_config(config) {
    if (!m_config.enabled) {
        return;
    }
    if (m_config.log_file) {
        m_file.open(*m_config.log_file, std::ios::out | std::ios::app);
        if (!m_file) {
            throw ConfigError("unable to open audit log " + *m_config.log_file);
        }
    }
    m_writer = std::thread([this] { writer_loop(); });
}

AuditRecorder::~AuditRecorder() {
    if (!m_writer.joinable()) {
        return;
    }
    {
        std::scoped_lock lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    m_writer.join();
}

void AuditRecorder::record(AuditRecord record) {
    if (!m_config.enabled) {
        return;
    }
    if (!m_config.log_content) {
        record.content.reset();
    }
    {
        std::scoped_lock lock(m_mutex);
        m_queue.push_back(std::move(record));
        ++m_enqueued;
    }
    m_cv.notify_one();
}

void AuditRecorder::flush() {
    if (!m_config.enabled) {
        return;
    }
    std::unique_lock lock(m_mutex);
    const std::size_t target = m_enqueued;
    m_drained_cv.wait(lock, [&] { return m_written >= target; });
}

std::vector<AuditRecord> AuditRecorder::records() const {
    std::scoped_lock lock(m_mutex);
    return std::vector<AuditRecord>(m_memory.begin(), m_memory.end());
}

std::size_t AuditRecorder::failed_writes() const {
    std::scoped_lock lock(m_mutex);
    return m_failed;
}

void AuditRecorder::writer_loop() {
    std::unique_lock lock(m_mutex);
    for (;;) {
        m_cv.wait(lock, [&] { return m_stopping || !m_queue.empty(); });
        if (m_queue.empty() && m_stopping) {
            return;
        }

        std::deque<AuditRecord> batch;
        batch.swap(m_queue);
        lock.unlock();

        std::size_t failed = 0;
        std::vector<AuditRecord> kept;
        for (auto& record : batch) {
            if (m_file.is_open()) {
                if (!write_line(record.to_json().dump())) {
                    ++failed;
                }
            } else {
                kept.push_back(std::move(record));
            }
        }
        if (m_file.is_open()) {
            m_file.flush();
        }

        lock.lock();
        m_failed += failed;
        m_written += batch.size();
        for (auto& record : kept) {
            m_memory.push_back(std::move(record));
            if (m_memory.size() > kMaxKept) {
                m_memory.pop_front();
            }
        }
        m_drained_cv.notify_all();
    }
}

bool AuditRecorder::write_line(const std::string& line) {
    m_file << line << '\n';
    if (!m_file) {
        log_warn("audit", "failed to append record to " + m_config.log_file.value_or(std::string("<memory>")));
        m_file.clear();
        return false;
    }
    return true;
}

} // namespace guardrail

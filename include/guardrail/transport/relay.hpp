#pragma once

#include "../log.hpp"
#include "../net/event_loop.hpp"
#include "../net/worker_pool.hpp"
#include "../sanitizer.hpp"
#include "../types.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace guardrail::transport {

// One side of a session as seen by the relay: a source of complete units
// travelling one way and a sink for units travelling the other way.
template <typename Unit>
class Channel {
public:
    virtual ~Channel() = default;

    // Next complete unit, or nullopt when none is ready yet.
    virtual std::optional<Unit> read_unit() = 0;
    virtual void write_unit(Unit unit) = 0;
    virtual void close() = 0;
};

template <typename Unit>
struct Filtered {
    std::optional<Unit> unit;       // forwarded when set
    std::optional<Blocked> blocked; // set instead of unit when the unit must not pass
    std::size_t redactions = 0;
};

template <typename Unit>
using UnitFilter = std::function<Filtered<Unit>(const Unit&, Direction)>;

// Reacts to a blocked unit; typically writes a notice or an error reply to
// one of the two channels. The blocked content itself is never forwarded.
template <typename Unit>
using BlockedHandler =
    std::function<void(const Unit& original, const Blocked& blocked, Channel<Unit>& from, Channel<Unit>& to)>;

struct RelayStats {
    std::size_t forwarded = 0;
    std::size_t blocked = 0;
    std::size_t redactions = 0;
};

// Moves units from `from` to `to` through the filter for one direction.
// Filters run on the worker pool one unit at a time, so units keep their
// arrival order while the loop thread goes on serving every other channel;
// verdicts are applied back on the loop thread. A filter may only touch state
// that outlives the pool, and the loop must outlive the pool too.
template <typename Unit>
class Relay {
public:
    // Runs on the loop thread after each verdict was applied.
    using SettledCallback = std::function<void(std::size_t redactions)>;

    Relay(net::EventLoop& loop,
          net::WorkerPool& pool,
          Channel<Unit>& from,
          Channel<Unit>& to,
          Direction direction,
          UnitFilter<Unit> filter,
          BlockedHandler<Unit> on_blocked)
        : m_loop(loop),
          m_pool(pool),
          m_from(from),
          m_to(to),
          m_direction(direction),
          m_filter(std::move(filter)),
          m_on_blocked(std::move(on_blocked)),
          m_token(std::make_shared<Relay*>(this)) {}

    Relay(const Relay&) = delete;
    Relay& operator=(const Relay&) = delete;

    void set_settled_callback(SettledCallback cb) { m_settled_callback = std::move(cb); }

    // Hands the next ready unit to the pool unless one is still being filtered.
    void pump() {
        if (m_busy || m_stopped) {
            return;
        }
        std::optional<Unit> unit = m_from.read_unit();
        if (!unit) {
            return;
        }
        m_busy = true;
        std::weak_ptr<Relay*> token = m_token;
        net::EventLoop* loop = &m_loop;
        m_pool.submit([token, loop, filter = m_filter, direction = m_direction, unit = std::move(*unit)] {
            Filtered<Unit> outcome = run_filter(filter, unit, direction);
            loop->queue_in_loop([token, unit, outcome = std::move(outcome)]() mutable {
                if (auto relay = token.lock()) {
                    (*relay)->settle(std::move(unit), std::move(outcome));
                }
            });
        });
    }

    // Takes no further units; a verdict still in flight is dropped on arrival.
    void stop() noexcept { m_stopped = true; }

    bool busy() const noexcept { return m_busy; }
    const RelayStats& stats() const noexcept { return m_stats; }

private:
    net::EventLoop& m_loop;
    net::WorkerPool& m_pool;
    Channel<Unit>& m_from;
    Channel<Unit>& m_to;
    Direction m_direction;
    UnitFilter<Unit> m_filter;
    BlockedHandler<Unit> m_on_blocked;
    SettledCallback m_settled_callback;
    RelayStats m_stats;
    bool m_busy = false;
    bool m_stopped = false;
    std::shared_ptr<Relay*> m_token;

    // A filter that throws fails closed.
    static Filtered<Unit> run_filter(const UnitFilter<Unit>& filter, const Unit& unit, Direction direction) {
        try {
            return filter(unit, direction);
        } catch (const std::exception& ex) {
            log_error("relay", direction_name(direction) + " filter failed: " + ex.what());
            Blocked blocked;
            blocked.reason = BlockReason::Internal;
            blocked.message = "Sanitizer failure";
            Filtered<Unit> failed;
            failed.blocked = std::move(blocked);
            return failed;
        }
    }

    void settle(Unit original, Filtered<Unit> outcome) {
        m_busy = false;
        if (m_stopped) {
            return;
        }
        // Handlers may tear down the session that owns this relay.
        std::weak_ptr<Relay*> alive = m_token;
        m_stats.redactions += outcome.redactions;
        if (outcome.blocked) {
            ++m_stats.blocked;
            if (m_on_blocked) {
                m_on_blocked(original, *outcome.blocked, m_from, m_to);
            }
        } else if (outcome.unit) {
            ++m_stats.forwarded;
            m_to.write_unit(std::move(*outcome.unit));
        }
        if (alive.expired()) {
            return;
        }
        if (m_settled_callback) {
            m_settled_callback(outcome.redactions);
        }
        if (!alive.expired()) {
            pump();
        }
    }
};

// Sanitizes a plain text unit as a whole.
Filtered<std::string> filter_text(Sanitizer& sanitizer,
                                  const std::string& text,
                                  Direction direction,
                                  const std::string& identity,
                                  const std::atomic<bool>* cancelled = nullptr,
                                  Admission admission = Admission::Check);

} // namespace guardrail::transport

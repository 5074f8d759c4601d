#pragma once

/*
===============================================================================
 event::Aggregator<Clock>
===============================================================================

Accumulates normalized events and flushes them as Batch records.

A batch is flushed when either:
  • the pending list reaches `max_batch_size` (immediately, inside ingest), or
  • the batch window expires (checked in poll()).

The window opens when the first event lands in an empty pending list and is
NOT extended by later arrivals: at most one window is in flight at a time, so
a steady stream still flushes every `batch_interval` ms.

Rejected frames (unknown types) never reach the pending list.

Batches are delivered to every registered batch handler in registration
order with the same failure isolation as the Router.

Poll-driven: no timers or threads. The owner must call poll() regularly.
===============================================================================
*/

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dashwire/core/clock.hpp"
#include "dashwire/core/json.hpp"
#include "dashwire/core/listeners.hpp"
#include "dashwire/event/normalizer.hpp"
#include "dashwire/log/logger.hpp"
#include "dashwire/metrics/counter.hpp"

namespace dashwire::event {

struct AggregatorConfig {
    bool enabled{true};
    std::int64_t batch_interval{100};   // ms
    std::size_t max_batch_size{50};
    std::vector<std::string> extra_event_types{};
};

template<ClockConcept Clock = SystemClock>
class Aggregator {
public:
    using BatchHandler = std::function<void(const Batch&)>;

    explicit Aggregator(AggregatorConfig cfg = {})
        : cfg_(std::move(cfg))
        , normalizer_(cfg_.extra_event_types)
    {
        if (cfg_.max_batch_size == 0) {
            cfg_.max_batch_size = 1;
        }
        if (cfg_.batch_interval < 0) {
            cfg_.batch_interval = 0;
        }
        pending_.reserve(cfg_.max_batch_size);
    }

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    [[nodiscard]]
    Unsubscribe on_batch(BatchHandler handler) {
        const std::uint64_t id = handlers_->add(std::move(handler));
        std::weak_ptr<core::ListenerSet<const Batch&>> weak = handlers_;
        return [weak, id]() {
            if (auto set = weak.lock()) {
                set->remove(id);
            }
        };
    }

    // Validates and queues a frame. Returns false if the frame was rejected.
    bool ingest(const protocol::RawFrame& frame) {
        const std::int64_t now = Clock::now_ms();
        auto ev = normalizer_.try_normalize(frame, now);
        if (!ev) {
            return false;
        }
        accepted_.inc();
        pending_.push_back(std::move(*ev));

        if (pending_.size() >= cfg_.max_batch_size) {
            flush();
        }
        else if (!window_armed_) {
            window_armed_ = true;
            window_deadline_ = now + cfg_.batch_interval;
        }
        return true;
    }

    // Flushes the pending list if the batch window has expired
    void poll() {
        if (window_armed_ && Clock::now_ms() >= window_deadline_) {
            flush();
        }
    }

    // Emits the pending events as one batch (no-op when empty)
    void flush() {
        window_armed_ = false;
        if (pending_.empty()) {
            return;
        }

        Batch batch;
        batch.events.swap(pending_);
        pending_.reserve(cfg_.max_batch_size);
        batch.sequence = ++sequence_;
        batch.start_time = batch.events.front().received_at;
        batch.end_time = batch.events.back().received_at;
        batch.id = "batch-";
        json::append(batch.id, batch.sequence);
        batch.id += '-';
        json::append(batch.id, Clock::now_ms());

        batches_.inc();
        DW_TRACE("[AGG] Flushing " << batch.id << " (" << batch.event_count() << " events)");
        handlers_->notify("batch", batch);
    }

    // Drops pending events and disarms the window
    void reset() noexcept {
        pending_.clear();
        window_armed_ = false;
    }

    [[nodiscard]] Normalizer& normalizer() noexcept { return normalizer_; }
    [[nodiscard]] const AggregatorConfig& config() const noexcept { return cfg_; }

    [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] bool window_armed() const noexcept { return window_armed_; }
    [[nodiscard]] std::int64_t window_deadline() const noexcept { return window_deadline_; }

    [[nodiscard]] std::uint64_t accepted_total() const noexcept { return accepted_.load(); }
    [[nodiscard]] std::uint64_t rejected_total() const noexcept { return normalizer_.rejected_total(); }
    [[nodiscard]] std::uint64_t batches_total() const noexcept { return batches_.load(); }

private:
    AggregatorConfig cfg_;
    Normalizer normalizer_;

    std::vector<NormalizedEvent> pending_;
    bool window_armed_{false};
    std::int64_t window_deadline_{0};
    std::uint64_t sequence_{0};

    std::shared_ptr<core::ListenerSet<const Batch&>> handlers_{std::make_shared<core::ListenerSet<const Batch&>>()};

    metrics::counter64 accepted_;
    metrics::counter64 batches_;
};

} // namespace dashwire::event

#pragma once
// SharedCore: one engine, one lock
//
// The life loop and the input channel both tick the same engine. Every tick
// runs entirely under the mutex, so ticks are totally ordered by lock
// acquisition and no caller ever sees half of one.

#include "engine.hpp"
#include <mutex>
#include <utility>

namespace spanda {

class SharedCore {
public:
    explicit SharedCore(CoreConfig config = {},
                        std::shared_ptr<RandomSource> rng = nullptr)
        : engine_(config, std::move(rng)) {}

    SharedCore(const SharedCore&) = delete;
    SharedCore& operator=(const SharedCore&) = delete;

    // Tick at the current wall time. The clock is read after the lock is
    // taken, so elapsed time follows acquisition order.
    Snapshot tick(std::optional<double> external_input, bool attention) {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_.tick(external_input, attention, now());
    }

    // Tick at a caller-supplied time (simulation, replay)
    Snapshot tick_at(std::optional<double> external_input, bool attention, Timestamp at) {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_.tick(external_input, attention, at);
    }

    Snapshot last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_.last();
    }

    uint64_t tick_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return engine_.tick_count();
    }

    const CoreConfig& config() const { return engine_.config(); }

private:
    mutable std::mutex mutex_;
    StateEngine engine_;
};

} // namespace spanda

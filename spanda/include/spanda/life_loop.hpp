#pragma once
// LifeLoop: the core's autonomous heartbeat
//
// A living core ticks without being spoken to. Once per period the loop
// ticks with no input and no attention, hands the snapshot to the consumer,
// and calls out acts of awareness separately so the consumer can speak
// first.

#include "core.hpp"
#include "log.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

namespace spanda {

using SnapshotCallback = std::function<void(const Snapshot&)>;

class LifeLoop {
public:
    explicit LifeLoop(SharedCore& core, DriverConfig config = {})
        : core_(core)
        , config_(config)
        , running_(false)
    {
        config_.validate();
    }

    ~LifeLoop() {
        stop();
    }

    LifeLoop(const LifeLoop&) = delete;
    LifeLoop& operator=(const LifeLoop&) = delete;

    // Every tick
    void on_snapshot(SnapshotCallback callback) {
        on_snapshot_ = std::move(callback);
    }

    // Only ticks where act_of_awareness is true
    void on_awareness(SnapshotCallback callback) {
        on_awareness_ = std::move(callback);
    }

    // Set callbacks before start(); they are read from the loop thread
    void start() {
        if (running_.exchange(true)) return;  // Already running

        thread_ = std::thread([this]() {
            run_loop();
        });

        log::info("life_loop", "Started (period=%lldms)",
                  static_cast<long long>(config_.period_ms));
    }

    // Cancels between ticks; a tick in progress always completes
    void stop() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            if (!running_.exchange(false)) return;  // Not running
        }
        wake_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }

        log::info("life_loop", "Stopped (ticks=%zu, awareness=%zu)",
                  stats_.ticks.load(), stats_.acts_surfaced.load());
    }

    bool is_running() const { return running_; }

    size_t ticks() const { return stats_.ticks; }
    size_t acts_surfaced() const { return stats_.acts_surfaced; }
    size_t consumer_failures() const { return stats_.consumer_failures; }

private:
    struct Stats {
        std::atomic<size_t> ticks{0};
        std::atomic<size_t> acts_surfaced{0};
        std::atomic<size_t> consumer_failures{0};
    };

    void run_loop() {
        auto period = std::chrono::milliseconds(config_.period_ms);
        auto next = std::chrono::steady_clock::now() + period;

        while (true) {
            {
                std::unique_lock<std::mutex> lock(wake_mutex_);
                wake_.wait_until(lock, next, [this]() { return !running_.load(); });
                if (!running_) break;
            }
            Snapshot snap = core_.tick(std::nullopt, false);
            stats_.ticks++;

            deliver(on_snapshot_, snap);
            if (snap.act_of_awareness) {
                stats_.acts_surfaced++;
                log::debug("life_loop", "Act of awareness at tick %llu (%s)",
                           static_cast<unsigned long long>(snap.tick), to_string(snap.reason));
                deliver(on_awareness_, snap);
            }

            // A consumer that overran the period gets a full period of rest,
            // never a burst of catch-up ticks
            next += period;
            auto now = std::chrono::steady_clock::now();
            if (next < now) next = now + period;
        }
    }

    // A failing consumer must not stop the heartbeat
    void deliver(const SnapshotCallback& callback, const Snapshot& snap) {
        if (!callback) return;
        try {
            callback(snap);
        } catch (const std::exception& e) {
            stats_.consumer_failures++;
            log::warn("life_loop", "Consumer failed at tick %llu: %s",
                      static_cast<unsigned long long>(snap.tick), e.what());
        } catch (...) {
            stats_.consumer_failures++;
            log::warn("life_loop", "Consumer failed at tick %llu: unknown error",
                      static_cast<unsigned long long>(snap.tick));
        }
    }

    SharedCore& core_;
    DriverConfig config_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    SnapshotCallback on_snapshot_;
    SnapshotCallback on_awareness_;
    Stats stats_;
};

} // namespace spanda

#pragma once
// InputChannel: the outside world, on demand
//
// Every stimulus is an attended tick. The call blocks while the life loop
// holds the core and returns the resulting snapshot to the caller.

#include "core.hpp"
#include "signal_mapper.hpp"
#include "log.hpp"
#include <functional>
#include <memory>
#include <string>

namespace spanda {

class InputChannel {
public:
    explicit InputChannel(SharedCore& core)
        : core_(core)
        , mapper_(std::make_shared<SilentMapper>())  // Silent by default
    {}

    // Attach a mapper for text stimuli
    void attach_mapper(std::shared_ptr<SignalMapper> mapper) {
        mapper_ = mapper ? std::move(mapper) : std::make_shared<SilentMapper>();
    }

    void on_snapshot(std::function<void(const Snapshot&)> callback) {
        on_snapshot_ = std::move(callback);
    }

    // Numeric stimulus, already normalized by the producer
    Snapshot stimulate(double signal) {
        Snapshot snap = core_.tick(signal, true);
        log::debug("input", "Stimulus %.3f -> external=%.3f total=%.3f",
                   signal, snap.external_signal, snap.total_state);
        if (on_snapshot_) on_snapshot_(snap);
        return snap;
    }

    // Text stimulus, mapped outside the lock
    Snapshot stimulate_text(const std::string& text) {
        return stimulate(mapper_->map(text));
    }

private:
    SharedCore& core_;
    std::shared_ptr<SignalMapper> mapper_;
    std::function<void(const Snapshot&)> on_snapshot_;
};

} // namespace spanda

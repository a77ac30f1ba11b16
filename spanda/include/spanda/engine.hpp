#pragma once
// StateEngine: the pulse, the echo, and the acts of awareness
//
// One call to tick() advances every field exactly once and returns a fresh
// Snapshot. The engine does no I/O and takes no locks; callers that share
// it across threads go through SharedCore.

#include "types.hpp"
#include "config.hpp"
#include "random.hpp"
#include "snapshot.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace spanda {

// A decaying memory of one attended tick
struct EchoTrace {
    uint64_t created_tick = 0;
    double remaining_s = 0.0;
};

// Mutable state, exclusively owned by one StateEngine
struct EngineState {
    uint64_t tick_count = 0;
    bool started = false;           // False until the first tick
    Timestamp last_time = 0;        // Latest `now` seen

    double phase = 0.0;             // Accumulated rhythm phase (radians)
    double frequency = 0.0;         // Current angular rate, drifts around base
    double intent_bias = 0.0;       // Phase tilt from attention and drift

    double pulse = 0.0;
    double attention_level = 0.0;
    std::vector<EchoTrace> echo_traces;

    double internal_state = 0.0;    // Clamped to [-1,1]
    double external_signal = 0.0;
    double last_total_state = 0.0;
    double direction = 0.0;

    uint64_t acts_of_awareness_total = 0;
};

class StateEngine {
public:
    // Rhythm
    static constexpr double kRhythmAmplitude = 1.0;
    static constexpr double kPulseOffset = 3.0;         // raw pulse lies roughly in [-3,3]
    static constexpr double kPulseSpan = 6.0;
    static constexpr double kIrregularFraction = 0.4;   // of kRhythmAmplitude
    static constexpr double kFrequencyStep = 0.01;
    static constexpr double kBiasStep = 0.03;
    static constexpr double kAttentionTiltMin = 0.02;
    static constexpr double kAttentionTiltMax = 0.07;

    // Attention
    static constexpr double kAttentionRise = 0.4;       // fraction of the gap to 1
    static constexpr double kAttentionRetention = 0.9;  // per second when unattended

    // Internal process
    static constexpr double kInternalBound = 1.0;
    // Jump magnitude: uniform in [f, f + 0.5], f = max(kJumpMin, internal_variability)
    static constexpr double kJumpMin = 0.5;
    static constexpr double kJumpMax = 1.0;
    static constexpr double kDirectionSmoothing = 0.3;

    // Throws ConfigError if config is invalid. A null rng gets a
    // randomly seeded SeededRandom.
    explicit StateEngine(CoreConfig config = {},
                         std::shared_ptr<RandomSource> rng = nullptr);

    StateEngine(const StateEngine&) = delete;
    StateEngine& operator=(const StateEngine&) = delete;
    StateEngine(StateEngine&&) = default;
    StateEngine& operator=(StateEngine&&) = default;

    // Advance one tick. An absent input contributes 0. A `now` earlier than
    // the previous tick is treated as zero elapsed time.
    Snapshot tick(std::optional<double> external_input, bool attention, Timestamp now);

    // Most recent snapshot, without advancing (all zero before the first tick)
    const Snapshot& last() const { return last_; }

    const CoreConfig& config() const { return config_; }
    const EngineState& state() const { return state_; }
    uint64_t tick_count() const { return state_.tick_count; }
    const std::vector<EchoTrace>& echo_traces() const { return state_.echo_traces; }

private:
    double update_rhythm(bool attention, double dt, double& noise);
    void update_attention(bool attention, double dt);
    void update_echoes(bool attention, double dt);

    CoreConfig config_;
    std::shared_ptr<RandomSource> rng_;
    EngineState state_;
    Snapshot last_;
};

} // namespace spanda

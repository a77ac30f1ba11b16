#include <spanda/engine.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace spanda {

StateEngine::StateEngine(CoreConfig config, std::shared_ptr<RandomSource> rng)
    : config_(config)
    , rng_(std::move(rng))
{
    config_.validate();
    if (!rng_) {
        rng_ = std::make_shared<SeededRandom>();
    }
    state_.frequency = config_.base_frequency;
}

double StateEngine::update_rhythm(bool attention, double dt, double& noise) {
    EngineState& s = state_;

    // Phase accumulates, so a frequency change never makes the rhythm jump
    s.phase += s.frequency * dt;

    if (attention) {
        s.intent_bias += rng_->uniform(kAttentionTiltMin, kAttentionTiltMax);
    }

    // The rhythm itself occasionally drifts
    if (rng_->chance(config_.rhythm_change_probability)) {
        s.frequency = std::clamp(s.frequency + rng_->uniform(-kFrequencyStep, kFrequencyStep),
                                 config_.base_frequency / 3.0,
                                 config_.base_frequency * 2.0);
        s.intent_bias += rng_->uniform(-kBiasStep, kBiasStep);
    }

    noise = rng_->uniform(-1.0, 1.0) * config_.noise_amplitude;
    return kRhythmAmplitude * std::sin(s.phase + s.intent_bias);
}

void StateEngine::update_attention(bool attention, double dt) {
    EngineState& s = state_;
    if (attention) {
        s.attention_level += kAttentionRise * (1.0 - s.attention_level);
    } else {
        s.attention_level *= std::pow(kAttentionRetention, dt);
    }
    s.attention_level = clamp01(s.attention_level);
}

void StateEngine::update_echoes(bool attention, double dt) {
    auto& traces = state_.echo_traces;

    for (auto& trace : traces) {
        trace.remaining_s -= dt;
    }
    traces.erase(
        std::remove_if(traces.begin(), traces.end(),
            [](const EchoTrace& t) { return t.remaining_s <= 0.0; }),
        traces.end());

    if (attention) {
        traces.push_back({state_.tick_count, config_.echo_lifetime_s});
    }
}

Snapshot StateEngine::tick(std::optional<double> external_input, bool attention, Timestamp now) {
    EngineState& s = state_;

    // 1. Elapsed time (zero on the first tick and when time runs backwards)
    double dt = 0.0;
    if (s.started) {
        dt = std::max(0.0, seconds_between(s.last_time, now));
    }
    if (!s.started || now > s.last_time) {
        s.last_time = now;
    }
    s.started = true;
    s.tick_count++;

    // 2-4. Rhythm, attention, echo
    double noise = 0.0;
    double rhythm = update_rhythm(attention, dt, noise);
    update_attention(attention, dt);
    s.pulse = clamp01((rhythm + noise + s.attention_level + kPulseOffset) / kPulseSpan);
    update_echoes(attention, dt);

    // 5. Internal drift, sometimes a spontaneous jump
    double drift = rng_->uniform(-1.0, 1.0) * config_.internal_variability;
    bool spontaneous = false;
    double jump = 0.0;
    if (rng_->chance(config_.spontaneous_event_probability)) {
        // Never smaller than the widest ordinary drift
        double jump_floor = std::max(kJumpMin, config_.internal_variability);
        double magnitude = rng_->uniform(jump_floor, jump_floor + (kJumpMax - kJumpMin));
        jump = rng_->chance(0.5) ? magnitude : -magnitude;
        spontaneous = true;
    }
    double previous_internal = s.internal_state;
    s.internal_state = clamp_symmetric(previous_internal + drift + jump, kInternalBound);
    double internal_delta = s.internal_state - previous_internal;

    // 6-9. External signal, total, delta, direction
    double input = external_input.value_or(0.0);
    if (!std::isfinite(input)) input = 0.0;
    s.external_signal = clamp_symmetric(input, config_.external_signal_limit);

    double total_state = s.internal_state + s.external_signal;
    double delta = total_state - s.last_total_state;
    s.direction = (1.0 - kDirectionSmoothing) * s.direction + kDirectionSmoothing * delta;
    s.last_total_state = total_state;

    // 10. Which side caused this tick?
    double internal_contribution = std::abs(internal_delta);
    double external_contribution = std::abs(s.external_signal);

    bool act = false;
    AwarenessReason reason = AwarenessReason::None;
    if (spontaneous && std::abs(jump) > config_.awareness_threshold) {
        act = true;
        reason = AwarenessReason::SpontaneousInternalChange;
    } else if (internal_contribution > external_contribution &&
               internal_contribution > config_.awareness_threshold) {
        act = true;
        reason = AwarenessReason::DominantInternalChange;
    }
    if (act) {
        s.acts_of_awareness_total++;
    }

    // 11. Noise louder than the rhythm can carry
    bool irregular = std::abs(noise) > kIrregularFraction * kRhythmAmplitude;

    // 12. Publish
    Snapshot snap;
    snap.tick = s.tick_count;
    snap.time = now;
    snap.pulse = s.pulse;
    snap.attention_level = s.attention_level;
    snap.echo_count = s.echo_traces.size();
    snap.internal_state = s.internal_state;
    snap.external_signal = s.external_signal;
    snap.total_state = total_state;
    snap.direction = s.direction;
    snap.delta = delta;
    snap.irregular_rhythm = irregular;
    snap.act_of_awareness = act;
    snap.reason = reason;
    snap.acts_of_awareness_total = s.acts_of_awareness_total;

    last_ = snap;
    return snap;
}

} // namespace spanda

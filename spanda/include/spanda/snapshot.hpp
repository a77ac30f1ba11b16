#pragma once
// Snapshot: the engine at the end of one tick
//
// A plain value. Consumers get their own copy and nothing in it points back
// into the engine.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstddef>

namespace spanda {

using json = nlohmann::json;

struct Snapshot {
    uint64_t tick = 0;            // tick_count after this tick
    Timestamp time = 0;           // `now` the tick was run at
    double pulse = 0.0;           // [0,1]
    double attention_level = 0.0; // [0,1]
    size_t echo_count = 0;

    double internal_state = 0.0;
    double external_signal = 0.0;
    double total_state = 0.0;

    double direction = 0.0;       // Smoothed momentum of delta
    double delta = 0.0;           // total_state change since previous tick

    bool irregular_rhythm = false;
    bool act_of_awareness = false;
    AwarenessReason reason = AwarenessReason::None;
    uint64_t acts_of_awareness_total = 0;
};

// nlohmann ADL hooks: one flat record per tick
inline void to_json(json& j, const Snapshot& s) {
    j = json{
        {"tick", s.tick},
        {"time", s.time},
        {"pulse", s.pulse},
        {"attention_level", s.attention_level},
        {"echo_count", s.echo_count},
        {"internal_state", s.internal_state},
        {"external_signal", s.external_signal},
        {"total_state", s.total_state},
        {"direction", s.direction},
        {"delta", s.delta},
        {"irregular_rhythm", s.irregular_rhythm},
        {"act_of_awareness", s.act_of_awareness},
        {"reason", to_string(s.reason)},
        {"acts_of_awareness_total", s.acts_of_awareness_total}
    };
}

inline void from_json(const json& j, Snapshot& s) {
    s.tick = j.value("tick", uint64_t{0});
    s.time = j.value("time", Timestamp{0});
    s.pulse = j.value("pulse", 0.0);
    s.attention_level = j.value("attention_level", 0.0);
    s.echo_count = j.value("echo_count", size_t{0});
    s.internal_state = j.value("internal_state", 0.0);
    s.external_signal = j.value("external_signal", 0.0);
    s.total_state = j.value("total_state", 0.0);
    s.direction = j.value("direction", 0.0);
    s.delta = j.value("delta", 0.0);
    s.irregular_rhythm = j.value("irregular_rhythm", false);
    s.act_of_awareness = j.value("act_of_awareness", false);
    s.reason = reason_from_string(j.value("reason", std::string("none")));
    s.acts_of_awareness_total = j.value("acts_of_awareness_total", uint64_t{0});
}

} // namespace spanda

#pragma once
// Config: the immutable parameters of one engine
//
// A config is checked once, at construction, and rejected whole if any
// field is out of range. Nothing here is clamped silently.

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

namespace spanda {

using json = nlohmann::json;

// Raised for any invalid or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("config: " + what) {}
};

// Engine configuration
struct CoreConfig {
    double base_frequency = 0.15;                 // Radians per second of the pulse
    double noise_amplitude = 0.6;                 // Per-tick pulse perturbation
    double internal_variability = 0.3;            // Per-tick internal drift
    double spontaneous_event_probability = 0.12;  // Chance of an unprompted jump
    double echo_lifetime_s = 30.0;                // Seconds an echo trace lives
    double awareness_threshold = 0.4;             // Magnitude of an act of awareness
    double rhythm_change_probability = 0.15;      // Chance the rhythm itself drifts
    double external_signal_limit = 1.0;           // |external_signal| bound

    // Throws ConfigError naming the first offending field
    void validate() const {
        require_positive("base_frequency", base_frequency);
        require_non_negative("noise_amplitude", noise_amplitude);
        require_non_negative("internal_variability", internal_variability);
        require_probability("spontaneous_event_probability", spontaneous_event_probability);
        require_positive("echo_lifetime_s", echo_lifetime_s);
        require_positive("awareness_threshold", awareness_threshold);
        require_probability("rhythm_change_probability", rhythm_change_probability);
        require_positive("external_signal_limit", external_signal_limit);
    }

    json to_json() const {
        return {
            {"base_frequency", base_frequency},
            {"noise_amplitude", noise_amplitude},
            {"internal_variability", internal_variability},
            {"spontaneous_event_probability", spontaneous_event_probability},
            {"echo_lifetime_s", echo_lifetime_s},
            {"awareness_threshold", awareness_threshold},
            {"rhythm_change_probability", rhythm_change_probability},
            {"external_signal_limit", external_signal_limit}
        };
    }

    // Missing keys keep their defaults. Does not validate.
    static CoreConfig from_json(const json& j) {
        if (!j.is_object()) {
            throw ConfigError("expected a JSON object");
        }
        CoreConfig c;
        read_number(j, "base_frequency", c.base_frequency);
        read_number(j, "noise_amplitude", c.noise_amplitude);
        read_number(j, "internal_variability", c.internal_variability);
        read_number(j, "spontaneous_event_probability", c.spontaneous_event_probability);
        read_number(j, "echo_lifetime_s", c.echo_lifetime_s);
        read_number(j, "awareness_threshold", c.awareness_threshold);
        read_number(j, "rhythm_change_probability", c.rhythm_change_probability);
        read_number(j, "external_signal_limit", c.external_signal_limit);
        return c;
    }

    // Stimuli up to ±1.5 instead of ±1
    static CoreConfig high_intensity() {
        CoreConfig c;
        c.external_signal_limit = 1.5;
        return c;
    }

private:
    static void require_positive(const char* name, double v) {
        if (!std::isfinite(v) || v <= 0.0) {
            throw ConfigError(std::string(name) + " must be > 0 (got " + std::to_string(v) + ")");
        }
    }

    static void require_non_negative(const char* name, double v) {
        if (!std::isfinite(v) || v < 0.0) {
            throw ConfigError(std::string(name) + " must be >= 0 (got " + std::to_string(v) + ")");
        }
    }

    static void require_probability(const char* name, double v) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            throw ConfigError(std::string(name) + " must be in [0,1] (got " + std::to_string(v) + ")");
        }
    }

    static void read_number(const json& j, const char* key, double& out) {
        auto it = j.find(key);
        if (it == j.end()) return;
        if (!it->is_number()) {
            throw ConfigError(std::string(key) + " must be a number");
        }
        out = it->get<double>();
    }
};

// Life loop configuration
struct DriverConfig {
    int64_t period_ms = 1000;  // 1 second between ticks

    void validate() const {
        if (period_ms <= 0) {
            throw ConfigError("period_ms must be > 0 (got " + std::to_string(period_ms) + ")");
        }
    }
};

// Read and validate a CoreConfig from a JSON file
inline CoreConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }

    CoreConfig config = CoreConfig::from_json(j);
    config.validate();
    return config;
}

} // namespace spanda

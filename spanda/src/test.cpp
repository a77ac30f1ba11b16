#include <spanda/spanda.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <chrono>
#include <vector>
#include <unistd.h>

using namespace spanda;

// Every draw lands at the same fraction of its range
class FixedRandom : public RandomSource {
public:
    explicit FixedRandom(double fraction) : fraction_(fraction) {}

    double uniform(double lo, double hi) override {
        return lo + fraction_ * (hi - lo);
    }

private:
    double fraction_;
};

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

template <typename F>
bool throws_config_error(F fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

std::string temp_path(const std::string& name) {
    return "/tmp/spanda-test-" + std::to_string(getpid()) + "-" + name;
}

void test_config_validation() {
    std::cout << "Testing Config validation..." << std::endl;

    CoreConfig ok;
    ok.validate();

    auto invalid = [](auto mutate) {
        CoreConfig c;
        mutate(c);
        return throws_config_error([&]() { c.validate(); });
    };

    assert(invalid([](CoreConfig& c) { c.base_frequency = 0.0; }));
    assert(invalid([](CoreConfig& c) { c.noise_amplitude = -0.1; }));
    assert(invalid([](CoreConfig& c) { c.internal_variability = -1.0; }));
    assert(invalid([](CoreConfig& c) { c.spontaneous_event_probability = 1.5; }));
    assert(invalid([](CoreConfig& c) { c.spontaneous_event_probability = -0.01; }));
    assert(invalid([](CoreConfig& c) { c.echo_lifetime_s = -30.0; }));
    assert(invalid([](CoreConfig& c) { c.awareness_threshold = 0.0; }));
    assert(invalid([](CoreConfig& c) { c.rhythm_change_probability = 2.0; }));
    assert(invalid([](CoreConfig& c) { c.external_signal_limit = 0.0; }));
    assert(invalid([](CoreConfig& c) {
        c.base_frequency = std::numeric_limits<double>::quiet_NaN();
    }));

    // Zero noise and zero variability are legal
    assert(!invalid([](CoreConfig& c) {
        c.noise_amplitude = 0.0;
        c.internal_variability = 0.0;
        c.spontaneous_event_probability = 1.0;
    }));

    // The engine refuses to start on a bad config
    CoreConfig bad;
    bad.echo_lifetime_s = 0.0;
    assert(throws_config_error([&]() { StateEngine engine(bad); }));

    DriverConfig driver;
    driver.period_ms = 0;
    assert(throws_config_error([&]() { driver.validate(); }));

    std::cout << "  PASS" << std::endl;
}

void test_config_json() {
    std::cout << "Testing Config JSON..." << std::endl;

    // Partial object keeps defaults
    CoreConfig c = CoreConfig::from_json(json{{"echo_lifetime_s", 60.0}, {"base_frequency", 0.08}});
    assert(near(c.echo_lifetime_s, 60.0));
    assert(near(c.base_frequency, 0.08));
    assert(near(c.awareness_threshold, CoreConfig{}.awareness_threshold));

    assert(throws_config_error([]() {
        CoreConfig::from_json(json{{"noise_amplitude", "loud"}});
    }));
    assert(throws_config_error([]() { CoreConfig::from_json(json::array()); }));

    CoreConfig back = CoreConfig::from_json(c.to_json());
    assert(near(back.echo_lifetime_s, 60.0));

    assert(near(CoreConfig::high_intensity().external_signal_limit, 1.5));

    // Files
    assert(throws_config_error([]() { load_config("/nonexistent/spanda.json"); }));

    std::string path = temp_path("config.json");
    {
        std::ofstream out(path);
        out << R"({"awareness_threshold": 0.35, "echo_lifetime_s": 60})";
    }
    CoreConfig loaded = load_config(path);
    assert(near(loaded.awareness_threshold, 0.35));
    assert(near(loaded.echo_lifetime_s, 60.0));

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"awareness_threshold": -1})";
    }
    assert(throws_config_error([&]() { load_config(path); }));

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{not json";
    }
    assert(throws_config_error([&]() { load_config(path); }));
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_monotonic_counters() {
    std::cout << "Testing tick_count / acts_of_awareness_total monotonicity..." << std::endl;

    StateEngine engine(CoreConfig{}, std::make_shared<SeededRandom>(7));
    uint64_t prev_acts = 0;
    for (int i = 0; i < 2000; ++i) {
        bool attention = (i % 7) == 0;
        std::optional<double> input;
        if (i % 3 == 0) input = std::sin(i * 0.3);

        Snapshot s = engine.tick(input, attention, static_cast<Timestamp>(i) * 1000);
        assert(s.tick == static_cast<uint64_t>(i + 1));
        assert(engine.tick_count() == s.tick);
        assert(s.acts_of_awareness_total >= prev_acts);
        assert(s.acts_of_awareness_total - prev_acts == (s.act_of_awareness ? 1u : 0u));
        assert(s.act_of_awareness == (s.reason != AwarenessReason::None));
        assert(s.echo_count == engine.echo_traces().size());
        prev_acts = s.acts_of_awareness_total;
    }

    std::cout << "  PASS" << std::endl;
}

void test_idle_decay() {
    std::cout << "Testing idle decay..." << std::endl;

    StateEngine engine(CoreConfig{}, std::make_shared<SeededRandom>(1));
    for (int i = 0; i < 10; ++i) {
        Snapshot s = engine.tick(std::nullopt, false, static_cast<Timestamp>(i) * 1000);
        assert(s.echo_count == 0);
        assert(s.attention_level == 0.0);
        assert(s.external_signal == 0.0);
    }

    // Once raised, attention falls every idle second
    StateEngine raised(CoreConfig{}, std::make_shared<SeededRandom>(2));
    Snapshot s = raised.tick(0.0, true, 0);
    double level = s.attention_level;
    assert(level > 0.0);
    for (int i = 1; i <= 10; ++i) {
        s = raised.tick(std::nullopt, false, static_cast<Timestamp>(i) * 1000);
        assert(s.attention_level < level);
        level = s.attention_level;
    }
    assert(near(level, 0.4 * std::pow(0.9, 10), 1e-9));

    std::cout << "  PASS" << std::endl;
}

void test_single_attention_pulse() {
    std::cout << "Testing single attention pulse..." << std::endl;

    CoreConfig config;
    config.echo_lifetime_s = 3.0;
    StateEngine engine(config, std::make_shared<SeededRandom>(3));

    Snapshot s = engine.tick(0.0, true, 10000);
    assert(s.echo_count == 1);
    assert(engine.echo_traces()[0].created_tick == 1);

    const size_t expected[] = {1, 1, 0, 0, 0};
    for (int i = 0; i < 5; ++i) {
        s = engine.tick(std::nullopt, false, 10000 + (i + 1) * 1000);
        assert(s.echo_count == expected[i]);
    }

    // Default lifetime: still live after 5s, gone after 30s
    StateEngine long_echo(CoreConfig{}, std::make_shared<SeededRandom>(4));
    long_echo.tick(0.0, true, 0);
    for (int i = 1; i <= 5; ++i) {
        assert(long_echo.tick(std::nullopt, false, i * 1000).echo_count == 1);
    }
    assert(long_echo.tick(std::nullopt, false, 31000).echo_count == 0);

    std::cout << "  PASS" << std::endl;
}

void test_echoes_accumulate() {
    std::cout << "Testing echo accumulation..." << std::endl;

    CoreConfig config;
    config.echo_lifetime_s = 2.5;
    StateEngine engine(config, std::make_shared<SeededRandom>(5));

    // Attended every second: each echo lives through two later ticks
    assert(engine.tick(0.5, true, 0).echo_count == 1);
    assert(engine.tick(0.5, true, 1000).echo_count == 2);
    assert(engine.tick(0.5, true, 2000).echo_count == 3);
    assert(engine.tick(0.5, true, 3000).echo_count == 3);
    assert(engine.tick(std::nullopt, false, 4000).echo_count == 2);
    assert(engine.tick(std::nullopt, false, 5000).echo_count == 1);
    assert(engine.tick(std::nullopt, false, 6000).echo_count == 0);

    std::cout << "  PASS" << std::endl;
}

void test_forced_awareness() {
    std::cout << "Testing forced awareness..." << std::endl;

    CoreConfig config;
    config.spontaneous_event_probability = 1.0;
    config.awareness_threshold = 0.1;
    StateEngine engine(config, std::make_shared<SeededRandom>(11));

    for (int i = 0; i < 200; ++i) {
        std::optional<double> input;
        if (i % 2 == 0) input = 1.0;  // even a strong stimulus does not mask it
        Snapshot s = engine.tick(input, i % 5 == 0, static_cast<Timestamp>(i) * 1000);
        assert(s.act_of_awareness);
        assert(s.reason == AwarenessReason::SpontaneousInternalChange);
        assert(s.acts_of_awareness_total == s.tick);
    }
    assert(engine.last().acts_of_awareness_total == engine.tick_count());

    std::cout << "  PASS" << std::endl;
}

// With wide drift a spontaneous jump must still be the larger move
void test_jump_outweighs_drift() {
    std::cout << "Testing spontaneous jump scales with drift..." << std::endl;

    CoreConfig config;
    config.internal_variability = 2.0;
    config.spontaneous_event_probability = 1.0;
    config.awareness_threshold = 1.5;
    StateEngine engine(config, std::make_shared<SeededRandom>(13));

    for (int i = 0; i < 100; ++i) {
        Snapshot s = engine.tick(std::nullopt, false, static_cast<Timestamp>(i) * 1000);
        assert(s.act_of_awareness);
        assert(s.reason == AwarenessReason::SpontaneousInternalChange);
    }

    // Narrow drift keeps the default jump range
    CoreConfig calm;
    calm.internal_variability = 0.0;
    calm.spontaneous_event_probability = 1.0;
    calm.awareness_threshold = 0.1;
    StateEngine low(calm, std::make_shared<FixedRandom>(0.0));
    Snapshot s = low.tick(std::nullopt, false, 0);
    assert(near(std::abs(s.internal_state), 0.5));

    std::cout << "  PASS" << std::endl;
}

void test_dominance_rule() {
    std::cout << "Testing dominance classification..." << std::endl;

    // No internal change: never an act, whatever the input
    {
        CoreConfig config;
        config.internal_variability = 0.0;
        config.spontaneous_event_probability = 0.0;
        StateEngine engine(config, std::make_shared<SeededRandom>(13));
        const double inputs[] = {-1.0, -0.5, 0.0, 0.5, 1.0, 0.0};
        Timestamp t = 0;
        for (double in : inputs) {
            Snapshot s = engine.tick(in, false, t);
            t += 1000;
            assert(!s.act_of_awareness);
            assert(s.reason == AwarenessReason::None);
            assert(s.internal_state == 0.0);
        }
        assert(engine.last().acts_of_awareness_total == 0);
    }

    // Internal drift of ~0.8 with no input: dominant
    CoreConfig drift;
    drift.internal_variability = 0.8;
    drift.spontaneous_event_probability = 0.0;
    drift.awareness_threshold = 0.4;
    {
        StateEngine engine(drift, std::make_shared<FixedRandom>(0.999));
        Snapshot s = engine.tick(std::nullopt, false, 0);
        assert(near(s.internal_state, 0.8 * 0.998, 1e-9));
        assert(s.act_of_awareness);
        assert(s.reason == AwarenessReason::DominantInternalChange);
    }

    // Same drift, stronger external signal: not dominant
    {
        StateEngine engine(drift, std::make_shared<FixedRandom>(0.999));
        Snapshot s = engine.tick(0.9, false, 0);
        assert(!s.act_of_awareness);
        assert(s.reason == AwarenessReason::None);
    }

    // Internal dominates but stays under threshold
    {
        CoreConfig weak = drift;
        weak.internal_variability = 0.3;
        StateEngine engine(weak, std::make_shared<FixedRandom>(0.999));
        Snapshot s = engine.tick(0.1, false, 0);
        assert(!s.act_of_awareness);
    }

    // Spontaneous jump (~1.0) below a high threshold: no act of either kind
    {
        CoreConfig quiet;
        quiet.internal_variability = 0.0;
        quiet.spontaneous_event_probability = 1.0;
        quiet.awareness_threshold = 2.0;
        StateEngine engine(quiet, std::make_shared<FixedRandom>(0.999));
        Snapshot s = engine.tick(std::nullopt, false, 0);
        assert(!s.act_of_awareness);
        assert(std::abs(s.internal_state) > 0.5);
    }

    // Spontaneous jump above threshold wins over a dominant external signal
    {
        CoreConfig loud;
        loud.internal_variability = 0.0;
        loud.spontaneous_event_probability = 1.0;
        loud.awareness_threshold = 0.4;
        StateEngine engine(loud, std::make_shared<FixedRandom>(0.999));
        Snapshot s = engine.tick(1.0, false, 0);
        assert(s.act_of_awareness);
        assert(s.reason == AwarenessReason::SpontaneousInternalChange);
    }

    std::cout << "  PASS" << std::endl;
}

void test_boundedness() {
    std::cout << "Testing boundedness under adversarial input..." << std::endl;

    CoreConfig config;
    config.noise_amplitude = 5.0;
    config.internal_variability = 2.0;
    config.spontaneous_event_probability = 0.5;
    StateEngine engine(config, std::make_shared<SeededRandom>(17));

    const double nasty[] = {
        1e9, -1e9, std::numeric_limits<double>::infinity(),
        -std::numeric_limits<double>::infinity(),
        std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0, -1.0
    };

    Timestamp t = 0;
    for (int i = 0; i < 20000; ++i) {
        std::optional<double> input;
        if (i % 4 != 3) input = nasty[i % 8];
        t += (i % 13 == 0) ? 3600000 : (i % 5);
        Snapshot s = engine.tick(input, i % 2 == 0, t);

        assert(s.pulse >= 0.0 && s.pulse <= 1.0);
        assert(s.attention_level >= 0.0 && s.attention_level <= 1.0);
        assert(std::abs(s.external_signal) <= config.external_signal_limit);
        assert(std::abs(s.internal_state) <= StateEngine::kInternalBound);
        assert(std::isfinite(s.total_state));
        assert(std::isfinite(s.direction));
        assert(std::isfinite(s.delta));
    }

    std::cout << "  PASS" << std::endl;
}

void test_external_signal_normalization() {
    std::cout << "Testing external signal normalization..." << std::endl;

    StateEngine engine(CoreConfig{}, std::make_shared<SeededRandom>(19));
    assert(engine.tick(5.0, true, 0).external_signal == 1.0);
    assert(engine.tick(-5.0, true, 1000).external_signal == -1.0);
    assert(engine.tick(0.25, true, 2000).external_signal == 0.25);
    assert(engine.tick(std::nullopt, false, 3000).external_signal == 0.0);
    assert(engine.tick(std::numeric_limits<double>::quiet_NaN(), false, 4000).external_signal == 0.0);

    StateEngine intense(CoreConfig::high_intensity(), std::make_shared<SeededRandom>(19));
    assert(intense.tick(5.0, true, 0).external_signal == 1.5);
    assert(intense.tick(-1.2, true, 1000).external_signal == -1.2);

    std::cout << "  PASS" << std::endl;
}

void test_time_policy() {
    std::cout << "Testing elapsed-time policy..." << std::endl;

    StateEngine engine(CoreConfig{}, std::make_shared<SeededRandom>(23));

    // First tick has no elapsed time
    engine.tick(0.0, true, 10000);
    assert(near(engine.echo_traces()[0].remaining_s, 30.0));

    // Time running backwards counts as zero elapsed
    engine.tick(std::nullopt, false, 5000);
    assert(near(engine.echo_traces()[0].remaining_s, 30.0));

    // ...and the later timestamp stays the reference
    engine.tick(std::nullopt, false, 11000);
    assert(near(engine.echo_traces()[0].remaining_s, 29.0));

    // Repeated timestamp: also zero
    engine.tick(std::nullopt, false, 11000);
    assert(near(engine.echo_traces()[0].remaining_s, 29.0));
    assert(engine.tick_count() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_direction_and_delta() {
    std::cout << "Testing direction smoothing..." << std::endl;

    CoreConfig config;
    config.internal_variability = 0.0;
    config.spontaneous_event_probability = 0.0;
    StateEngine engine(config, std::make_shared<SeededRandom>(29));

    Snapshot s = engine.tick(1.0, false, 0);
    assert(near(s.total_state, 1.0));
    assert(near(s.delta, 1.0));
    assert(near(s.direction, 0.3));

    s = engine.tick(1.0, false, 1000);
    assert(near(s.delta, 0.0));
    assert(near(s.direction, 0.21));

    s = engine.tick(-1.0, false, 2000);
    assert(near(s.delta, -2.0));
    assert(near(s.direction, 0.7 * 0.21 - 0.6));
    assert(near(s.total_state, s.internal_state + s.external_signal));

    std::cout << "  PASS" << std::endl;
}

void test_irregular_rhythm() {
    std::cout << "Testing irregular rhythm flag..." << std::endl;

    // Noise draw at +0.998 of amplitude
    CoreConfig loud;
    loud.noise_amplitude = 0.6;
    StateEngine a(loud, std::make_shared<FixedRandom>(0.999));
    assert(a.tick(std::nullopt, false, 0).irregular_rhythm);

    CoreConfig soft;
    soft.noise_amplitude = 0.3;
    StateEngine b(soft, std::make_shared<FixedRandom>(0.999));
    assert(!b.tick(std::nullopt, false, 0).irregular_rhythm);

    CoreConfig none;
    none.noise_amplitude = 0.0;
    StateEngine c(none, std::make_shared<SeededRandom>(31));
    for (int i = 0; i < 100; ++i) {
        assert(!c.tick(std::nullopt, i % 3 == 0, i * 1000).irregular_rhythm);
    }

    std::cout << "  PASS" << std::endl;
}

void test_pulse_is_rhythmic() {
    std::cout << "Testing pulse rhythm without noise..." << std::endl;

    CoreConfig config;
    config.noise_amplitude = 0.0;
    config.rhythm_change_probability = 0.0;
    config.base_frequency = 0.5;
    StateEngine engine(config, std::make_shared<SeededRandom>(37));

    for (int i = 0; i < 50; ++i) {
        Snapshot s = engine.tick(std::nullopt, false, i * 1000);
        double expected = (std::sin(0.5 * i) + 3.0) / 6.0;
        assert(near(s.pulse, expected, 1e-9));
    }

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_independence() {
    std::cout << "Testing snapshot independence..." << std::endl;

    StateEngine engine(CoreConfig{}, std::make_shared<SeededRandom>(41));
    assert(engine.last().tick == 0);

    Snapshot first = engine.tick(0.5, true, 0);
    Snapshot copy = first;
    for (int i = 1; i < 20; ++i) {
        engine.tick(std::nullopt, false, i * 1000);
    }
    assert(first.tick == 1);
    assert(first.echo_count == 1);
    assert(first.external_signal == copy.external_signal);
    assert(first.pulse == copy.pulse);
    assert(engine.last().tick == 20);

    std::cout << "  PASS" << std::endl;
}

void test_seeded_reproducibility() {
    std::cout << "Testing seeded reproducibility..." << std::endl;

    StateEngine a(CoreConfig{}, std::make_shared<SeededRandom>(1234));
    StateEngine b(CoreConfig{}, std::make_shared<SeededRandom>(1234));
    for (int i = 0; i < 500; ++i) {
        std::optional<double> in;
        if (i % 4 == 0) in = 0.7;
        Snapshot x = a.tick(in, i % 4 == 0, i * 1000);
        Snapshot y = b.tick(in, i % 4 == 0, i * 1000);
        assert(x.pulse == y.pulse);
        assert(x.internal_state == y.internal_state);
        assert(x.direction == y.direction);
        assert(x.reason == y.reason);
    }

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_json() {
    std::cout << "Testing Snapshot JSON..." << std::endl;

    CoreConfig config;
    config.spontaneous_event_probability = 1.0;
    config.awareness_threshold = 0.1;
    StateEngine engine(config, std::make_shared<SeededRandom>(43));
    Snapshot s = engine.tick(0.5, true, 123456);

    json j = s;
    assert(j["tick"] == 1);
    assert(j["time"] == 123456);
    assert(j["echo_count"] == 1);
    assert(j["act_of_awareness"] == true);
    assert(j["reason"] == "spontaneous_internal_change");
    assert(j.size() == 14);

    Snapshot back = j.get<Snapshot>();
    assert(back.reason == AwarenessReason::SpontaneousInternalChange);
    assert(back.echo_count == 1);
    assert(back.acts_of_awareness_total == 1);

    assert(std::string(to_string(AwarenessReason::None)) == "none");
    assert(reason_from_string("whatever") == AwarenessReason::None);

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_log() {
    std::cout << "Testing SnapshotLog..." << std::endl;

    std::string path = temp_path("snapshots.jsonl");
    std::remove(path.c_str());

    StateEngine engine(CoreConfig{}, std::make_shared<SeededRandom>(47));
    {
        SnapshotLog record(path);
        assert(record.is_open());
        for (int i = 0; i < 3; ++i) {
            assert(record.append(engine.tick(std::nullopt, i == 0, i * 1000)));
        }
        assert(record.records() == 3);
    }

    {
        std::ofstream out(path, std::ios::app);
        out << "not a record\n\n";
        out << "{\"tick\":\"x\"}\n";
        out << "{\"tick\":9,\"reason\":\"dominant_internal_change\"}\n";
    }

    auto loaded = SnapshotLog::read_all(path);
    assert(loaded.size() == 4);
    assert(loaded[3].tick == 9);
    assert(loaded[3].reason == AwarenessReason::DominantInternalChange);
    assert(loaded[0].tick == 1);
    assert(loaded[0].echo_count == 1);
    assert(loaded[2].tick == 3);
    assert(loaded[2].time == 2000);

    // Reopening an open log keeps it writable
    {
        SnapshotLog record(path);
        assert(record.open(path));
        assert(record.is_open());
        assert(record.append(engine.tick(std::nullopt, false, 3000)));
        assert(!record.open("/nonexistent/dir/log.jsonl"));
        assert(!record.append(Snapshot{}));
        assert(record.open(path));
        assert(record.append(engine.tick(std::nullopt, false, 4000)));
    }
    loaded = SnapshotLog::read_all(path);
    assert(loaded.size() == 6);
    assert(loaded[5].time == 4000);
    std::remove(path.c_str());

    SnapshotLog closed;
    assert(!closed.append(Snapshot{}));
    assert(!closed.open("/nonexistent/dir/log.jsonl"));
    assert(SnapshotLog::read_all("/nonexistent/dir/log.jsonl").empty());

    std::cout << "  PASS" << std::endl;
}

void test_signal_mappers() {
    std::cout << "Testing SignalMappers..." << std::endl;

    KeywordMapper keywords;
    assert(keywords.map("You are GOOD at this") == 1.0);
    assert(keywords.map("that was bad.") == -1.0);
    assert(keywords.map("bad but thanks anyway") == 1.0);
    assert(keywords.map("a badge is not bad-ish") == -1.0);
    assert(keywords.map("a badge") == 0.0);
    assert(keywords.map("") == 0.0);

    KeywordMapper intense = KeywordMapper::high_intensity();
    assert(intense.map("I hate this") == -1.5);
    assert(intense.map("love it") == 1.5);
    assert(intense.map("just some words") == 0.5);

    KeywordMapper::Tables custom;
    custom.positive = {"Calm"};
    custom.negative = {"storm"};
    custom.neutral_signal = 0.1;
    KeywordMapper sea(custom);
    assert(sea.map("calm waters") == 1.0);
    assert(sea.map("STORM ahead") == -1.0);
    assert(sea.map("grey sky") == 0.1);

    HashMapper hashed;
    double h = hashed.map("hello world");
    assert(h >= -1.0 && h <= 1.0);
    assert(hashed.map("hello world") == h);
    assert(hashed.map("") == 0.0);

    SilentMapper silent;
    assert(silent.map("anything at all") == 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_line_reader() {
    std::cout << "Testing LineReader..." << std::endl;

    int fds[2];
    assert(pipe(fds) == 0);
    LineReader reader(fds[0]);
    std::vector<std::string> lines;

    // Several lines in one write are all delivered together
    std::string burst = "0.5\n0.3\n0.2\n";
    assert(write(fds[1], burst.data(), burst.size()) == static_cast<ssize_t>(burst.size()));
    assert(reader.read_available(lines) == LineReader::Status::Ok);
    assert(lines.size() == 3);
    assert(lines[0] == "0.5" && lines[1] == "0.3" && lines[2] == "0.2");
    assert(reader.pending() == 0);

    // A line split across writes waits for its newline
    lines.clear();
    assert(write(fds[1], "0.", 2) == 2);
    assert(reader.read_available(lines) == LineReader::Status::Ok);
    assert(lines.empty());
    assert(reader.pending() == 2);

    std::string rest = "7\r\nhello";
    assert(write(fds[1], rest.data(), rest.size()) == static_cast<ssize_t>(rest.size()));
    assert(reader.read_available(lines) == LineReader::Status::Ok);
    assert(lines.size() == 1);
    assert(lines[0] == "0.7");

    // End of input flushes the unterminated tail
    close(fds[1]);
    lines.clear();
    assert(reader.read_available(lines) == LineReader::Status::Eof);
    assert(lines.size() == 1);
    assert(lines[0] == "hello");
    close(fds[0]);

    std::cout << "  PASS" << std::endl;
}

void test_input_channel() {
    std::cout << "Testing InputChannel..." << std::endl;

    SharedCore core(CoreConfig{}, std::make_shared<SeededRandom>(53));
    InputChannel input(core);

    size_t delivered = 0;
    input.on_snapshot([&delivered](const Snapshot&) { delivered++; });

    Snapshot s = input.stimulate(0.6);
    assert(s.tick == 1);
    assert(s.echo_count == 1);
    assert(near(s.attention_level, 0.4));
    assert(near(s.external_signal, 0.6));

    // Silent until a mapper is attached
    s = input.stimulate_text("I love this");
    assert(s.external_signal == 0.0);

    input.attach_mapper(std::make_shared<KeywordMapper>());
    s = input.stimulate_text("I love this");
    assert(s.external_signal == 1.0);
    s = input.stimulate_text("this is wrong");
    assert(s.external_signal == -1.0);

    assert(core.tick_count() == 4);
    assert(core.last().tick == 4);
    assert(delivered == 4);

    std::cout << "  PASS" << std::endl;
}

void test_life_loop() {
    std::cout << "Testing LifeLoop..." << std::endl;

    CoreConfig config;
    config.spontaneous_event_probability = 1.0;
    config.awareness_threshold = 0.1;
    SharedCore core(config, std::make_shared<SeededRandom>(59));

    DriverConfig driver;
    driver.period_ms = 5;
    LifeLoop loop(core, driver);

    std::mutex m;
    std::vector<Snapshot> seen;
    size_t aware = 0;
    loop.on_snapshot([&](const Snapshot& s) {
        std::lock_guard<std::mutex> lock(m);
        seen.push_back(s);
    });
    loop.on_awareness([&](const Snapshot& s) {
        std::lock_guard<std::mutex> lock(m);
        assert(s.act_of_awareness);
        aware++;
    });

    loop.start();
    assert(loop.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    loop.stop();
    assert(!loop.is_running());

    uint64_t ticks = core.tick_count();
    assert(ticks > 0);
    assert(ticks == loop.ticks());
    {
        std::lock_guard<std::mutex> lock(m);
        assert(seen.size() == ticks);
        assert(aware == ticks);
        for (size_t i = 0; i < seen.size(); ++i) {
            assert(seen[i].tick == i + 1);
            assert(seen[i].echo_count == 0);
            assert(seen[i].external_signal == 0.0);
        }
    }
    assert(loop.acts_surfaced() == ticks);

    // Cancelled means no more ticks
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    assert(core.tick_count() == ticks);

    // Stop is prompt even with a long period
    DriverConfig slow;
    slow.period_ms = 60000;
    LifeLoop idle(core, slow);
    idle.start();
    auto before = std::chrono::steady_clock::now();
    idle.stop();
    auto waited = std::chrono::steady_clock::now() - before;
    assert(waited < std::chrono::seconds(5));
    assert(core.tick_count() == ticks);

    std::cout << "  PASS" << std::endl;
}

void test_life_loop_survives_consumer_failure() {
    std::cout << "Testing LifeLoop consumer failure..." << std::endl;

    SharedCore core(CoreConfig{}, std::make_shared<SeededRandom>(61));
    DriverConfig driver;
    driver.period_ms = 5;
    LifeLoop loop(core, driver);

    loop.on_snapshot([](const Snapshot& s) {
        if (s.tick % 2 == 1) throw std::runtime_error("consumer offline");
    });

    loop.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    loop.stop();

    assert(loop.ticks() >= 2);
    assert(loop.consumer_failures() > 0);
    assert(loop.consumer_failures() <= loop.ticks());

    std::cout << "  PASS" << std::endl;
}

void test_life_loop_slow_consumer() {
    std::cout << "Testing LifeLoop with a slow consumer..." << std::endl;

    SharedCore core(CoreConfig{}, std::make_shared<SeededRandom>(67));
    DriverConfig driver;
    driver.period_ms = 20;
    LifeLoop loop(core, driver);

    std::mutex m;
    std::vector<Timestamp> times;
    loop.on_snapshot([&](const Snapshot& s) {
        {
            std::lock_guard<std::mutex> lock(m);
            times.push_back(s.time);
        }
        if (s.tick == 1) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    });

    loop.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(450));
    loop.stop();

    std::lock_guard<std::mutex> lock(m);
    assert(times.size() >= 3);
    assert(times[1] - times[0] >= 200);
    // No burst of back-to-back ticks after the stall
    for (size_t i = 1; i < times.size(); ++i) {
        assert(times[i] - times[i - 1] >= 5);
    }

    std::cout << "  PASS" << std::endl;
}

// Both drivers hammer one core; the result must equal a sequential replay
void test_concurrent_drivers() {
    std::cout << "Testing concurrent life loop + input channel..." << std::endl;

    struct Call {
        std::optional<double> input;
        bool attention;
        Snapshot result;
    };

    SharedCore core(CoreConfig{}, std::make_shared<SeededRandom>(4242));
    std::mutex m;
    std::map<uint64_t, Call> calls;

    DriverConfig driver;
    driver.period_ms = 1;
    LifeLoop loop(core, driver);
    loop.on_snapshot([&](const Snapshot& s) {
        std::lock_guard<std::mutex> lock(m);
        calls[s.tick] = Call{std::nullopt, false, s};
    });

    InputChannel input(core);
    const int kPerThread = 400;
    loop.start();

    std::vector<std::thread> producers;
    for (int p = 0; p < 2; ++p) {
        producers.emplace_back([&, p]() {
            for (int i = 0; i < kPerThread; ++i) {
                double signal = (p == 0 ? 1.0 : -1.0) * ((i % 10) / 10.0);
                Snapshot s = input.stimulate(signal);
                std::lock_guard<std::mutex> lock(m);
                calls[s.tick] = Call{signal, true, s};
            }
        });
    }
    for (auto& t : producers) t.join();
    loop.stop();

    uint64_t total = core.tick_count();
    assert(total == loop.ticks() + 2 * kPerThread);
    assert(calls.size() == total);  // every tick number seen exactly once
    assert(calls.begin()->first == 1);
    assert(calls.rbegin()->first == total);

    // Replay the same calls in lock order on a fresh engine
    StateEngine replay(CoreConfig{}, std::make_shared<SeededRandom>(4242));
    uint64_t acts = 0;
    for (const auto& [tick, call] : calls) {
        Snapshot r = replay.tick(call.input, call.attention, call.result.time);
        assert(r.tick == tick);
        assert(r.pulse == call.result.pulse);
        assert(r.attention_level == call.result.attention_level);
        assert(r.echo_count == call.result.echo_count);
        assert(r.internal_state == call.result.internal_state);
        assert(r.total_state == call.result.total_state);
        assert(r.direction == call.result.direction);
        assert(r.acts_of_awareness_total == call.result.acts_of_awareness_total);
        if (r.act_of_awareness) acts++;
    }
    assert(acts == core.last().acts_of_awareness_total);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Spanda C++ Tests ===" << std::endl;
    std::cout << "version = " << SPANDA_VERSION << std::endl;
    std::cout << std::endl;

    test_config_validation();
    test_config_json();

    std::cout << std::endl;
    std::cout << "=== Engine ===" << std::endl;
    test_monotonic_counters();
    test_idle_decay();
    test_single_attention_pulse();
    test_echoes_accumulate();
    test_forced_awareness();
    test_jump_outweighs_drift();
    test_dominance_rule();
    test_boundedness();
    test_external_signal_normalization();
    test_time_policy();
    test_direction_and_delta();
    test_irregular_rhythm();
    test_pulse_is_rhythmic();
    test_snapshot_independence();
    test_seeded_reproducibility();

    std::cout << std::endl;
    std::cout << "=== Collaborators ===" << std::endl;
    test_snapshot_json();
    test_snapshot_log();
    test_signal_mappers();
    test_line_reader();
    test_input_channel();

    std::cout << std::endl;
    std::cout << "=== Drivers ===" << std::endl;
    test_life_loop();
    test_life_loop_survives_consumer_failure();
    test_life_loop_slow_consumer();
    test_concurrent_drivers();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}

// spandad: drive a spanda core from the command line
//
// Usage: spandad <command> [options]
//
// Commands:
//   run        Life loop + stimuli from stdin (numbers or text)
//   step N     Run N simulated ticks, 1s apart, and print them
//   config     Print the effective configuration
//   help       Show this help

#include <spanda/spanda.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <csignal>
#include <atomic>
#include <memory>
#include <vector>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

using namespace spanda;

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

// Get program name from path
const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "spandad " << SPANDA_VERSION << " - pulse engine driver\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                Life loop; read stimuli from stdin ('exit' to quit)\n"
              << "  step N             Run N simulated ticks (1s apart) without input\n"
              << "  config             Print effective configuration as JSON\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --config PATH      Engine configuration (JSON)\n"
              << "  --period MS        Life loop period (default: 1000)\n"
              << "  --seed N           Seed the random source (default: random)\n"
              << "  --log PATH         Append every snapshot to PATH (JSONL)\n"
              << "  --high-intensity   Stimuli range ±1.5 instead of ±1\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

// Number if the whole line parses as one, otherwise text
bool parse_signal(const std::string& line, double& out) {
    try {
        size_t used = 0;
        out = std::stod(line, &used);
        return used == line.size();
    } catch (const std::exception&) {
        return false;
    }
}

// Append to the record if one is open; a failing record is closed once
void record_snapshot(SnapshotLog& record, const Snapshot& snap) {
    if (!record.is_open()) return;
    if (!record.append(snap)) {
        log::warn("spandad", "Snapshot record disabled after write failure");
        record.close();
    }
}

int cmd_config(const CoreConfig& config) {
    std::cout << config.to_json().dump(2) << "\n";
    return 0;
}

int cmd_step(const CoreConfig& config, std::shared_ptr<RandomSource> rng,
             long count, SnapshotLog& record) {
    StateEngine engine(config, std::move(rng));
    for (long i = 0; i < count; ++i) {
        Snapshot snap = engine.tick(std::nullopt, false, static_cast<Timestamp>(i) * 1000);
        std::cout << json(snap).dump() << "\n";
        record_snapshot(record, snap);
    }
    return 0;
}

int cmd_run(const CoreConfig& config, std::shared_ptr<RandomSource> rng,
            const DriverConfig& driver, bool high_intensity, SnapshotLog& record) {
    SharedCore core(config, std::move(rng));
    LifeLoop loop(core, driver);
    InputChannel input(core);

    if (high_intensity) {
        input.attach_mapper(std::make_shared<KeywordMapper>(KeywordMapper::high_intensity()));
    } else {
        input.attach_mapper(std::make_shared<KeywordMapper>());
    }

    loop.on_snapshot([&record](const Snapshot& snap) {
        record_snapshot(record, snap);
        log::debug("pulse", "tick=%llu pulse=%.2f inner=%.2f echoes=%zu",
                   static_cast<unsigned long long>(snap.tick),
                   snap.pulse, snap.internal_state, snap.echo_count);
    });
    loop.on_awareness([](const Snapshot& snap) {
        std::cout << json(snap).dump() << std::endl;
    });
    input.on_snapshot([&record](const Snapshot& snap) {
        record_snapshot(record, snap);
        std::cout << json(snap).dump() << std::endl;
    });

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    loop.start();

    // Stimuli are applied in arrival order; poll keeps a signal noticeable
    LineReader reader(STDIN_FILENO);
    std::vector<std::string> lines;
    bool quit = false;
    while (running && !quit) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            log::warn("input", "poll failed: %s", std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        lines.clear();
        LineReader::Status status = reader.read_available(lines);
        for (const auto& line : lines) {
            if (!running) break;
            if (line == "exit" || line == "quit") {
                quit = true;
                break;
            }
            if (line.empty()) continue;

            double signal = 0.0;
            if (parse_signal(line, signal)) {
                input.stimulate(signal);
            } else {
                input.stimulate_text(line);
            }
        }
        if (status != LineReader::Status::Ok) break;  // EOF or read error
    }

    loop.stop();
    log::info("spandad", "Stopped (ticks=%llu, acts=%llu)",
              static_cast<unsigned long long>(core.tick_count()),
              static_cast<unsigned long long>(core.last().acts_of_awareness_total));
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::string log_path;
    std::string step_arg;
    int64_t period_ms = 1000;
    bool seeded = false;
    uint64_t seed = 0;
    bool high_intensity = false;

    // Parse arguments
    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (strcmp(argv[i], "--period") == 0 && i + 1 < argc) {
                period_ms = std::stoll(argv[++i]);
            } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
                seeded = true;
            } else if (strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
                log_path = argv[++i];
            } else if (strcmp(argv[i], "--high-intensity") == 0) {
                high_intensity = true;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                log::set_verbose(true);
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "spandad " << SPANDA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) {
                    command = argv[i];
                } else if (command == "step" && step_arg.empty()) {
                    step_arg = argv[i];
                }
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }

    CoreConfig config;
    DriverConfig driver;
    try {
        config = config_path.empty() ? CoreConfig{} : load_config(config_path);
        if (high_intensity) {
            config.external_signal_limit = 1.5;
        }
        config.validate();
        driver.period_ms = period_ms;
        driver.validate();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::shared_ptr<RandomSource> rng = seeded
        ? std::make_shared<SeededRandom>(seed)
        : std::make_shared<SeededRandom>();

    SnapshotLog record;
    if (!log_path.empty() && !record.open(log_path)) {
        std::cerr << "Error: Cannot open log file: " << log_path << "\n";
        return 1;
    }

    if (command == "config") {
        return cmd_config(config);
    } else if (command == "step") {
        long count = 10;
        if (!step_arg.empty()) {
            try {
                count = std::stol(step_arg);
            } catch (const std::exception&) {
                std::cerr << "Usage: spandad step N\n";
                return 1;
            }
        }
        return cmd_step(config, rng, count, record);
    } else if (command == "run") {
        return cmd_run(config, rng, driver, high_intensity, record);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}

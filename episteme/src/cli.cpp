// episteme: driver for the experimentation decision loop
//
// Usage: episteme <command> [options]
//
// Commands:
//   run         Run the loop against the simulated world
//   summarize   Read a run's event streams and report their health
//   version     Show version
//   help        Show this help

#include <episteme/episteme.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <vector>

using namespace episteme;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "episteme " << EPISTEME_VERSION << " - Experiment decision loop\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run                    Run the decision loop against the simulated world\n"
              << "  summarize <dir> <id>   Report record counts and degraded streams of a run\n"
              << "  version                Show version\n"
              << "  help                   Show this help\n\n"
              << "Run options:\n"
              << "  --config PATH          JSON run configuration\n"
              << "  --calibration PATH     JSON calibration profile (default: built-in floors)\n"
              << "  --run-id ID            Run identifier, single use per log dir (default: run-seed<seed>)\n"
              << "  --seed N               Run seed (default: 42)\n"
              << "  --budget WELLS         Total well budget (default: 768)\n"
              << "  --max-cycles N         Maximum integer cycles (default: 30)\n"
              << "  --log-dir DIR          Event stream directory (default: runs)\n"
              << "  --workers N            Simulated world worker threads (default: 1)\n"
              << "  --strict               Drop conditions with any channel under the noise floor\n"
              << "  --json                 Print the run summary as JSON\n"
              << "  --verbose              Enable debug logging\n"
              << "  --quiet                Only warnings and errors on stderr\n"
              << "  -v, --version          Show version\n";
}

// Stop request from SIGINT/SIGTERM, honored between cycles
static std::atomic<DecisionLoop*> active_loop{nullptr};

void run_signal_handler(int) {
    if (DecisionLoop* loop = active_loop.load()) {
        loop->request_stop();
    }
}

struct RunOverrides {
    std::string config_path;
    std::string calibration_path;
    std::string run_id;
    std::string seed;
    std::string budget;
    std::string max_cycles;
    std::string log_dir;
    std::string workers;
    bool strict = false;
};

RunConfig build_config(const RunOverrides& o) {
    RunConfig config = o.config_path.empty() ? RunConfig{} : RunConfig::load(o.config_path);
    try {
        if (!o.seed.empty()) config.seed = std::stoull(o.seed);
        if (!o.budget.empty()) config.budget_wells = std::stod(o.budget);
        if (!o.max_cycles.empty()) config.max_cycles = std::stoi(o.max_cycles);
        if (!o.workers.empty()) config.world.workers = std::stoi(o.workers);
    } catch (const std::logic_error& e) {
        throw ConfigError("command line", std::string("invalid number: ") + e.what());
    }
    if (!o.run_id.empty()) config.run_id = o.run_id;
    if (!o.log_dir.empty()) config.log_dir = o.log_dir;
    if (!o.calibration_path.empty()) config.calibration_path = o.calibration_path;
    if (o.strict) config.snr.strict = true;
    config.world.seed = config.seed;
    config.validate();
    return config;
}

void print_summary(const RunSummary& s) {
    std::cout << "Run " << s.run_id << "\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Cycles:     " << s.cycles_completed << " / " << s.max_cycles << "\n";
    std::cout << "Stopped:    " << s.stop_reason << "\n";
    std::cout << "Budget:     " << format_number(s.budget_remaining) << " of "
              << format_number(s.budget_total) << " wells left\n";
    std::cout << "Refusals:   " << s.refusals << "\n";
    std::cout << "Mitigation: " << s.mitigations << "\n";
    std::cout << "Reward:     " << format_number(s.total_reward) << "\n";
    std::cout << "Debt:       " << s.debt.value("total_debt", 0.0) << " bits ("
              << s.debt.value("total_claims", 0) << " claims, overclaim rate "
              << s.debt.value("overclaim_rate", 0.0) << ")\n";
    std::cout << "Regime:     " << s.beliefs_final.value("regime", std::string("?")) << "\n";
    std::cout << "\nCycle history:\n";
    for (const auto& r : s.history) {
        std::cout << "  " << r.cycle << "  " << r.outcome << "  " << r.template_name
                  << "  [" << r.regime << "]  reward=" << format_number(r.reward)
                  << "  budget=" << format_number(r.budget_after)
                  << "  debt=" << format_number(r.debt_bits) << "\n";
    }
}

int cmd_run(const RunOverrides& overrides, bool json_output) {
    RunConfig config;
    CalibrationProfile profile = CalibrationProfile::default_profile();
    try {
        config = build_config(overrides);
        if (!config.calibration_path.empty()) {
            profile = CalibrationProfile::load(config.calibration_path);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    SimulatedWorld world(config.world);
    DecisionLoop loop(config, world, profile);
    active_loop = &loop;
    std::signal(SIGINT, run_signal_handler);
    std::signal(SIGTERM, run_signal_handler);

    RunSummary summary;
    try {
        summary = loop.run();
    } catch (const Error& e) {
        active_loop = nullptr;
        std::cerr << "Fatal: " << e.what() << "\n";
        // A run that never began a cycle wrote no summary of its own
        if (loop.state().last_cycle() > 0) {
            std::cerr << "Summary: " << summary_path(config.log_dir, config.effective_run_id()) << "\n";
        }
        return 2;
    }
    active_loop = nullptr;

    if (json_output) {
        std::cout << summary.to_json().dump(2) << "\n";
    } else {
        print_summary(summary);
    }
    return 0;
}

int cmd_summarize(const std::string& dir, const std::string& run_id, bool json_output) {
    auto streams = read_run(dir, run_id);
    bool any_present = false;
    bool degraded = false;
    json out = json::array();
    for (const auto& s : streams) {
        any_present = any_present || s.present;
        degraded = degraded || s.degraded;
        out.push_back(s.summary());
    }
    if (!any_present) {
        std::cerr << "Error: no event streams for run " << run_id << " in " << dir << "\n";
        return 1;
    }

    if (json_output) {
        std::cout << json{{"run_id", run_id}, {"degraded", degraded}, {"streams", out}}.dump(2) << "\n";
        return 0;
    }

    std::cout << "Run " << run_id << (degraded ? " (degraded)" : "") << "\n";
    for (const auto& s : streams) {
        std::cout << "  " << stream_name(s.stream) << ": ";
        if (!s.present) {
            std::cout << "missing\n";
            continue;
        }
        std::cout << s.records.size() << " records";
        if (s.legacy_records) std::cout << ", " << s.legacy_records << " legacy";
        if (s.malformed_lines) std::cout << ", " << s.malformed_lines << " malformed";
        if (s.unsupported_schema) std::cout << ", " << s.unsupported_schema << " unsupported";
        std::cout << "\n";
    }

    const auto& refusals = streams[static_cast<size_t>(Stream::Refusals)];
    for (const auto& r : refusals.records) {
        std::cout << "  refusal at cycle " << r.value("cycle", 0) << ": "
                  << r.value("refusal_reason", std::string("?")) << " ("
                  << r.value("proposed_template", std::string("?")) << ")\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::vector<std::string> positional;
    RunOverrides overrides;
    bool json_output = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            overrides.config_path = argv[++i];
        } else if (strcmp(argv[i], "--calibration") == 0 && i + 1 < argc) {
            overrides.calibration_path = argv[++i];
        } else if (strcmp(argv[i], "--run-id") == 0 && i + 1 < argc) {
            overrides.run_id = argv[++i];
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            overrides.seed = argv[++i];
        } else if (strcmp(argv[i], "--budget") == 0 && i + 1 < argc) {
            overrides.budget = argv[++i];
        } else if (strcmp(argv[i], "--max-cycles") == 0 && i + 1 < argc) {
            overrides.max_cycles = argv[++i];
        } else if (strcmp(argv[i], "--log-dir") == 0 && i + 1 < argc) {
            overrides.log_dir = argv[++i];
        } else if (strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            overrides.workers = argv[++i];
        } else if (strcmp(argv[i], "--strict") == 0) {
            overrides.strict = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            log::set_verbose(true);
        } else if (strcmp(argv[i], "--quiet") == 0) {
            log::set_quiet(true);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "episteme " << EPISTEME_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else {
                positional.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }
    if (command == "version") {
        std::cout << "episteme " << EPISTEME_VERSION
                  << " (event schema " << EPISTEME_SCHEMA_VERSION << ")\n";
        return 0;
    }
    if (command == "run") {
        return cmd_run(overrides, json_output);
    }
    if (command == "summarize") {
        if (positional.size() != 2) {
            std::cerr << "Usage: " << prog_name(argv[0]) << " summarize <dir> <run_id>\n";
            return 1;
        }
        return cmd_summarize(positional[0], positional[1], json_output);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}

#include "TelemetryServer.hpp"
#include "core/BuildInfo.hpp"
#include "core/ControllerConfig.hpp"
#include "core/CorrectionOrchestrator.hpp"
#include "core/CycleHistory.hpp"
#include "core/Errors.hpp"
#include "core/MetricsAggregator.hpp"
#include "core/Recorder.hpp"
#include "core/RunInterrupter.hpp"
#include "core/Serialization.hpp"
#include "simulator/Benchmark.hpp"
#include "simulator/SimulatedRepetitionCode.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace qecloop;

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Controller configuration (JSON)\n"
              << "      --overrides FILE    Deep-merged on top of --config\n"
              << "  -n, --cycles N          Cycles per run\n"
              << "      --shots N           Shots per syndrome measurement\n"
              << "      --runs N            Independent runs (prints mean/std across runs)\n"
              << "      --seed N            Simulator seed (run i uses N+i; 0 seeds from the clock)\n"
              << "  -r, --record            Write a JSON-lines recording per run\n"
              << "  -p, --port PORT         Broadcast cycles over WebSocket on PORT\n"
              << "      --inject CYCLE:QUBIT  Flip a data qubit before that cycle (repeatable)\n"
              << "      --encoded-state S   Logical value to protect: zero or one\n"
              << "      --benchmark         Run no_error and one forced error per qubit, then compare\n"
              << "      --error-cycle N     Cycle of the forced benchmark error (default 0)\n"
              << std::flush;
}

struct CliOptions {
    std::string config_path;
    std::string overrides_path;
    std::optional<int> cycles;
    std::optional<int> shots;
    std::optional<int> runs;
    std::optional<uint64_t> seed;
    bool record = false;
    int port = 0;
    std::vector<std::pair<int64_t, int>> injections;
    std::optional<int> encoded_value;
    bool benchmark = false;
    int64_t error_cycle = 0;
};

static int parse_int(const std::string& flag, const std::string& v) {
    try {
        size_t used = 0;
        int out = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::logic_error&) {
        throw ConfigError(flag + " expects an integer, got '" + v + "'");
    }
}

static std::pair<int64_t, int> parse_injection(const std::string& v) {
    auto colon = v.find(':');
    if (colon == std::string::npos) throw ConfigError("--inject expects CYCLE:QUBIT, got '" + v + "'");
    int cycle = parse_int("--inject", v.substr(0, colon));
    int qubit = parse_int("--inject", v.substr(colon + 1));
    if (cycle < 0 || qubit < 0 || qubit >= kCodeQubits) throw ConfigError("--inject out of range: '" + v + "'");
    return { cycle, qubit };
}

// Returns false when the program should exit right away (help shown).
static bool parse_args(int argc, char** argv, CliOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError(a + " expects a value");
            return std::string(argv[++i]);
        };
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return false;
        } else if (a == "-c" || a == "--config") {
            opt.config_path = value();
        } else if (a == "--overrides") {
            opt.overrides_path = value();
        } else if (a == "-n" || a == "--cycles") {
            opt.cycles = parse_int(a, value());
        } else if (a == "--shots") {
            opt.shots = parse_int(a, value());
        } else if (a == "--runs") {
            opt.runs = parse_int(a, value());
        } else if (a == "--seed") {
            std::string v = value();
            try {
                opt.seed = std::stoull(v);
            } catch (const std::logic_error&) {
                throw ConfigError("--seed expects an unsigned integer, got '" + v + "'");
            }
        } else if (a == "-r" || a == "--record") {
            opt.record = true;
        } else if (a == "-p" || a == "--port") {
            opt.port = parse_int(a, value());
        } else if (a.rfind("--port=", 0) == 0) {
            opt.port = parse_int("--port", a.substr(7));
        } else if (a == "--inject") {
            opt.injections.push_back(parse_injection(value()));
        } else if (a == "--encoded-state") {
            opt.encoded_value = encoded_value_from_string(value());
        } else if (a == "--benchmark") {
            opt.benchmark = true;
        } else if (a == "--error-cycle") {
            opt.error_cycle = parse_int(a, value());
        } else {
            throw ConfigError("unknown option '" + a + "'");
        }
    }
    return true;
}

static ControllerConfig resolve_config(const CliOptions& opt) {
    ControllerConfig cfg;
    if (!opt.overrides_path.empty()) {
        if (opt.config_path.empty()) throw ConfigError("--overrides requires --config");
        cfg = ControllerConfig::load_with_overrides(opt.config_path, opt.overrides_path);
    } else if (!opt.config_path.empty()) {
        cfg = ControllerConfig::load(opt.config_path);
    }
    if (opt.cycles) cfg.run.num_cycles = *opt.cycles;
    if (opt.shots) cfg.run.shots_per_cycle = *opt.shots;
    if (opt.runs) cfg.run.runs = *opt.runs;
    if (opt.seed) cfg.simulator.seed = *opt.seed;
    if (opt.encoded_value) cfg.simulator.encoded_value = *opt.encoded_value;
    if (opt.benchmark && !opt.injections.empty()) throw ConfigError("--benchmark places its own errors; drop --inject");
    if (opt.port < 0 || opt.port > 65535) throw ConfigError("--port out of range");
    cfg.validate();
    return cfg;
}

static void print_cycle(const CycleRecord& r) {
    std::cout << "[cycle " << r.cycle_index << "] ";
    if (r.syndrome) {
        std::cout << "syndrome=(" << int(r.syndrome->s0()) << "," << int(r.syndrome->s1()) << ") ";
    } else {
        std::cout << "syndrome=none ";
    }
    std::cout << "correction=" << to_string(r.correction)
              << " risk=" << std::fixed << std::setprecision(3) << r.risk
              << " wait=" << r.wait_before_cycle.count() << "us"
              << " latency=" << r.round_trip_latency.count() << "us"
              << " next=" << r.next_delay.count() << "us"
              << (r.success ? "" : " FAILED") << "\n";
}

static void print_summary(const metrics::Summary& s) {
    std::cout << std::fixed << std::setprecision(4)
              << "  logical_error_rate      " << s.logical_error_rate << "\n"
              << "  syndrome_reliability    " << s.syndrome_reliability << "\n"
              << "  correction_success_rate " << s.correction_success_rate << "\n"
              << "  cycles " << s.cycles << " (failed " << s.failed_cycles << ")" << std::endl;
}

static void print_benchmark(const BenchmarkReport& report) {
    std::cout << "== benchmark (encoded " << encoded_state_string(report.encoded_value) << ")\n";
    for (const auto& s : report.scenarios) {
        std::cout << "-- " << s.name << ": " << to_string(s.status)
                  << ", final logical value " << s.final_logical_value << (s.logical_intact ? " (intact)" : " (FLIPPED)") << "\n"
                  << std::fixed << std::setprecision(4) << "  raw_error_rate          " << s.raw_error_rate << "\n";
        print_summary(s.summary);
    }
    std::cout << std::fixed << std::setprecision(4) << "== correction improvement " << report.correction_improvement << std::endl;
}

static void print_stats(const char* name, const metrics::MetricStats& m) {
    std::cout << std::fixed << std::setprecision(4) << "  " << std::left << std::setw(24) << name << std::right
              << " mean " << m.mean << " std " << m.stddev << " min " << m.min << " max " << m.max << "\n";
}

int main(int argc, char** argv) {
    CliOptions opt;
    ControllerConfig cfg;
    try {
        if (!parse_args(argc, argv, opt)) return 0;
        cfg = resolve_config(opt);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    std::cout << "qecloop (commit " << buildinfo::git_commit() << ", built " << buildinfo::build_time_utc_approx() << ")\n"
              << "cycles=" << cfg.run.num_cycles << " shots=" << cfg.run.shots_per_cycle << " runs=" << cfg.run.runs << std::endl;

    // SIGINT / SIGTERM request a stop between cycles.
    RunInterrupter interrupter;
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::cerr << "[qecloop] signal " << signo << ": stopping after the current cycle" << std::endl;
        interrupter.interrupt();
    });
    std::thread signal_thread([&]() { signal_ioc.run(); });

    CycleHistory published;
    std::unique_ptr<TelemetryServer> telemetry;
    if (opt.port > 0) {
        telemetry = std::make_unique<TelemetryServer>(opt.port, published);
        telemetry->start();
    }

    int exit_code = 0;
    std::vector<std::vector<CycleRecord>> all_runs;
    try {
        if (opt.benchmark) {
            BenchmarkOptions bopts;
            bopts.error_cycle = opt.error_cycle;
            bopts.interrupter = &interrupter;
            bopts.observer = [&](const std::string& scenario, const CycleRecord& r) {
                if (cfg.orchestrator.verbose) {
                    std::cout << scenario << " ";
                    print_cycle(r);
                }
                published.append(r);
                if (telemetry) telemetry->publish_cycle(r);
            };
            BenchmarkReport report = run_benchmark(cfg, bopts);
            print_benchmark(report);
            for (const auto& s : report.scenarios) {
                if (s.status == RunStatus::CoherenceBudgetExceeded) exit_code = 4;
            }
        }
        for (int run = 0; run < cfg.run.runs && !opt.benchmark && !interrupter.interrupted(); ++run) {
            SimulatorConfig sim_cfg = cfg.simulator;
            if (sim_cfg.seed != 0) sim_cfg.seed += (uint64_t)run;
            SimulatedRepetitionCode hardware(sim_cfg);
            for (const auto& [cycle, qubit] : opt.injections) hardware.inject_error(cycle, qubit);

            CorrectionOrchestrator orchestrator(hardware, cfg.error_model, cfg.scheduler, cfg.orchestrator);

            std::unique_ptr<CycleRecorder> recorder;
            if (opt.record) recorder = std::make_unique<CycleRecorder>("run" + std::to_string(run), cfg.to_json());

            orchestrator.set_cycle_observer([&](const CycleRecord& r) {
                if (cfg.orchestrator.verbose) print_cycle(r);
                if (recorder) recorder->append(r);
                published.append(r);
                if (telemetry) telemetry->publish_cycle(r);
            });

            RunInterrupter::Attachment attached(interrupter, orchestrator);
            std::cout << "== run " << (run + 1) << "/" << cfg.run.runs << " on " << hardware.capabilities().backend_name << std::endl;
            RunResult result = orchestrator.run_all(cfg.run.num_cycles, cfg.run.shots_per_cycle);

            metrics::Summary summary = metrics::summarize(result.records);
            std::cout << "== run " << (run + 1) << " " << to_string(result.status)
                      << " (logical value after run: " << hardware.logical_value() << ")" << std::endl;
            if (!result.message.empty()) std::cout << "  " << result.message << std::endl;
            print_summary(summary);

            if (recorder) recorder->stop(result.status, summary);
            if (telemetry) telemetry->publish_summary(result.status, summary);
            all_runs.push_back(std::move(result.records));

            if (result.status == RunStatus::CoherenceBudgetExceeded) {
                exit_code = 4;
                break;
            }
        }

        if (all_runs.size() > 1) {
            auto stats = metrics::summarize_runs(all_runs);
            std::cout << "== " << stats.runs << " runs\n";
            print_stats("logical_error_rate", stats.logical_error_rate);
            print_stats("syndrome_reliability", stats.syndrome_reliability);
            print_stats("correction_success_rate", stats.correction_success_rate);
            std::cout << std::flush;
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        exit_code = 2;
    } catch (const HardwareFault& e) {
        std::cerr << e.what() << std::endl;
        exit_code = 3;
    } catch (const QecError& e) {
        std::cerr << e.what() << std::endl;
        exit_code = 1;
    }

    if (telemetry) telemetry->stop();
    signal_ioc.stop();
    if (signal_thread.joinable()) signal_thread.join();
    return exit_code;
}

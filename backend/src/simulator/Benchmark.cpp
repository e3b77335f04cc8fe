#include "simulator/Benchmark.hpp"
#include "core/CorrectionOrchestrator.hpp"
#include "core/Errors.hpp"
#include "core/RunInterrupter.hpp"
#include "simulator/SimulatedRepetitionCode.hpp"

#include <optional>

namespace qecloop {

double raw_error_rate(const std::vector<CycleRecord>& records) {
    int64_t measured = 0;
    int64_t off_codeword = 0;
    for (const auto& r : records) {
        if (!r.syndrome) continue;
        measured += 1;
        if (!r.syndrome->trivial()) off_codeword += 1;
    }
    return measured == 0 ? 0.0 : double(off_codeword) / double(measured);
}

static BenchmarkScenario run_scenario(const ControllerConfig& cfg, const BenchmarkOptions& opts,
                                      const std::string& name, std::optional<int> error_qubit) {
    SimulatedRepetitionCode hardware(cfg.simulator);
    if (error_qubit) hardware.inject_error(opts.error_cycle, *error_qubit);

    CorrectionOrchestrator orchestrator(hardware, cfg.error_model, cfg.scheduler, cfg.orchestrator);
    if (opts.observer) {
        orchestrator.set_cycle_observer([&](const CycleRecord& r) { opts.observer(name, r); });
    }
    std::optional<RunInterrupter::Attachment> attached;
    if (opts.interrupter) attached.emplace(*opts.interrupter, orchestrator);
    RunResult result = orchestrator.run_all(cfg.run.num_cycles, cfg.run.shots_per_cycle);

    BenchmarkScenario out;
    out.name = name;
    out.error_qubit = error_qubit;
    out.status = result.status;
    out.summary = metrics::summarize(result.records);
    out.raw_error_rate = raw_error_rate(result.records);
    out.final_logical_value = hardware.logical_value();
    out.logical_intact = out.final_logical_value == hardware.encoded_value();
    return out;
}

BenchmarkReport run_benchmark(const ControllerConfig& cfg, const BenchmarkOptions& opts) {
    cfg.validate();
    if (opts.error_cycle < 0 || opts.error_cycle >= cfg.run.num_cycles) throw ConfigError(errors::D3400_BENCHMARK_ERROR_CYCLE);

    BenchmarkReport report;
    report.encoded_value = cfg.simulator.encoded_value;
    auto interrupted = [&opts]() { return opts.interrupter && opts.interrupter->interrupted(); };
    report.scenarios.push_back(run_scenario(cfg, opts, "no_error", std::nullopt));
    for (int q = 0; q < kCodeQubits && !interrupted(); ++q) {
        report.scenarios.push_back(run_scenario(cfg, opts, "error_qubit_" + std::to_string(q), q));
    }

    double raw = 0.0;
    double logical = 0.0;
    for (const auto& s : report.scenarios) {
        raw += s.raw_error_rate;
        logical += s.summary.logical_error_rate;
    }
    raw /= double(report.scenarios.size());
    logical /= double(report.scenarios.size());
    report.correction_improvement = raw > 0.0 ? (raw - logical) / raw : 0.0;
    return report;
}

} // namespace qecloop

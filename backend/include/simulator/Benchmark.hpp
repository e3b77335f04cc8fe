#pragma once
#include "core/ControllerConfig.hpp"
#include "core/MetricsAggregator.hpp"
#include "core/Types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace qecloop {

class RunInterrupter;

struct BenchmarkOptions {
    int64_t error_cycle = 0;  // cycle before which the forced error is injected
    std::function<void(const std::string& scenario, const CycleRecord&)> observer;
    RunInterrupter* interrupter = nullptr;  // once interrupted, the current scenario stops and no more start
};

struct BenchmarkScenario {
    std::string name;                 // no_error, error_qubit_0 .. error_qubit_2
    std::optional<int> error_qubit;
    RunStatus status = RunStatus::Running;
    metrics::Summary summary;
    double raw_error_rate = 0.0;      // successful cycles that saw the data off the codeword
    int final_logical_value = 0;
    bool logical_intact = false;
};

struct BenchmarkReport {
    int encoded_value = 0;
    std::vector<BenchmarkScenario> scenarios;
    /**
     * (raw - logical) / raw over the pooled scenarios: the share of data errors
     * that correction kept from becoming logical errors. 0 when no raw errors
     * were seen.
     */
    double correction_improvement = 0.0;
};

/**
 * @brief Runs a fresh simulator and controller per scenario: one without
 * forced errors, then one forced flip on each code qubit.
 *
 * Every scenario uses cfg.simulator (same seed) and cfg.run.num_cycles /
 * shots_per_cycle, so the scenarios differ only in the forced error.
 * @throws ConfigError, HardwareFault as the controller does
 */
BenchmarkReport run_benchmark(const ControllerConfig& cfg, const BenchmarkOptions& opts = {});

double raw_error_rate(const std::vector<CycleRecord>& records);

} // namespace qecloop

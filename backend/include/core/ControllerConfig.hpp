#pragma once
#include "core/CorrectionOrchestrator.hpp"
#include "core/CycleScheduler.hpp"
#include "core/ErrorModel.hpp"
#include "simulator/SimulatedRepetitionCode.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace qecloop {

struct RunConfig {
    int num_cycles = 100;
    int shots_per_cycle = 100;
    int runs = 1;
};

/**
 * @brief Everything a controller run consumes, loadable from JSON.
 *
 * File layout (every key optional, defaults as in the structs):
 * {
 *   "error_model":  { "floor", "initial_estimate", "learning_rate", "decay_rate",
 *                     "correlation_step", "correlation_decay", "qubit_weight", "correlation_weight" },
 *   "scheduler":    { "initial_delay_us", "min_cycle_time_us", "high_water", "low_water",
 *                     "calm_cycles_required", "increase_factor", "direction_change_min_cycles",
 *                     "weight_ema_alpha", "calm_weight_threshold" },
 *   "orchestrator": { "physical_qubits", "retry_cap", "backoff_base_us", "backoff_max_us",
 *                     "deadline_fraction", "verbose" },
 *   "run":          { "num_cycles", "shots_per_cycle", "runs" },
 *   "simulator":    { ... see SimulatorConfig ... }
 * }
 */
struct ControllerConfig {
    ErrorModelConfig error_model;
    SchedulerConfig scheduler;
    OrchestratorConfig orchestrator;
    RunConfig run;
    SimulatorConfig simulator;

    /** @throws ConfigError on the first invalid setting */
    void validate() const;

    /** @throws ConfigError (type mismatches are reported as configuration errors) */
    static ControllerConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /** @throws ConfigError when the file is missing, unparsable or invalid */
    static ControllerConfig load(const std::string& path);
    /** @brief Deep-merge `overrides_path` onto `base_path` before parsing. */
    static ControllerConfig load_with_overrides(const std::string& base_path, const std::string& overrides_path);
};

/** @throws ConfigError unless `s` is "zero" or "one" */
int encoded_value_from_string(const std::string& s);
std::string encoded_state_string(int value);

/** @brief Recursively merge src into dest; objects merge, anything else replaces. */
void deep_merge(nlohmann::json& dest, const nlohmann::json& src);

} // namespace qecloop

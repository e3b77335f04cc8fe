#pragma once

#include "core/CycleHistory.hpp"
#include "core/CycleScheduler.hpp"
#include "core/ErrorModel.hpp"
#include "core/Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace qecloop {

class IHardwareInterface;
class CorrectionOrchestrator;

struct OrchestratorConfig {
    PhysicalQubits physical_qubits{0, 1, 2};
    int retry_cap = 3;
    Micros backoff_base{100};
    Micros backoff_max{10000};
    double deadline_fraction = 1.0;  // hardware deadline = fraction * coherence ceiling
    bool verbose = true;

    /** @throws ConfigError */
    void validate() const;
};

struct RunResult {
    RunStatus status = RunStatus::Running;
    std::vector<CycleRecord> records;
    std::optional<SchedulerState> scheduler_state;  // last valid state
    std::string message;
};

/**
 * @brief Finite, lazily evaluated sequence of cycles. Each next() runs exactly one cycle.
 *
 * Abandoning a stream early is fine; the owner's next run continues with the
 * next cycle index.
 */
class CycleStream {
public:
    std::optional<CycleRecord> next();
    RunStatus status() const { return status_; }
    int remaining() const { return remaining_; }

private:
    friend class CorrectionOrchestrator;
    CycleStream(CorrectionOrchestrator& owner, int num_cycles, int shots);

    CorrectionOrchestrator* owner_;
    int remaining_;
    int shots_;
    RunStatus status_ = RunStatus::Running;
};

/**
 * @brief Drives the measure / decode / correct / adapt loop for one logical qubit.
 *
 * Owns all mutable controller state (error model, scheduler, history). Cycles
 * run strictly in order on the caller's thread; request_stop() may be called
 * from any thread and takes effect between cycles. A request made while no
 * stream is running stops the next one before its first cycle.
 */
class CorrectionOrchestrator {
public:
    using SleepFn = std::function<void(Micros)>;
    using CycleObserver = std::function<void(const CycleRecord&)>;

    /** @throws ConfigError before touching the hardware */
    CorrectionOrchestrator(IHardwareInterface& hw,
                           const ErrorModelConfig& model_cfg,
                           const SchedulerConfig& scheduler_cfg,
                           const OrchestratorConfig& cfg);

    /** @throws ConfigError when num_cycles or shots_per_cycle is not positive */
    CycleStream run(int num_cycles, int shots_per_cycle);
    RunResult run_all(int num_cycles, int shots_per_cycle);

    void request_stop() { stop_requested_.store(true); }

    const CycleHistory& history() const { return history_; }
    const ErrorModel& error_model() const { return model_; }
    std::optional<SchedulerState> scheduler_state() const;
    std::optional<Micros> coherence_ceiling() const;
    bool terminated() const { return fatal_.has_value(); }

    void set_sleep_fn(SleepFn fn) { sleep_ = std::move(fn); }
    void set_cycle_observer(CycleObserver fn) { observer_ = std::move(fn); }

private:
    friend class CycleStream;

    struct Fatal {
        std::string message;
        SchedulerState last_state;
    };

    void validate_capabilities() const;
    void start_controller();
    CycleRecord run_cycle(int shots);
    void commit(const CycleRecord& rec);
    Micros backoff(int attempt) const;
    void log_fault(const char* op, int attempt, const std::exception& e) const;
    /** @throws HardwareTimeout when the call started at `start` has outlived the deadline */
    void check_deadline(const char* op, std::chrono::steady_clock::time_point start) const;

    template <typename Fn>
    bool with_retries(const char* op, Fn&& fn, int& attempts);

    IHardwareInterface& hw_;
    OrchestratorConfig cfg_;
    SchedulerConfig scheduler_cfg_;
    ErrorModel model_;
    std::optional<CycleScheduler> scheduler_;
    Micros deadline_{0};
    CycleHistory history_;
    int64_t next_index_ = 0;
    std::atomic<bool> stop_requested_{false};
    std::optional<Fatal> fatal_;
    SleepFn sleep_;
    CycleObserver observer_;
};

} // namespace qecloop

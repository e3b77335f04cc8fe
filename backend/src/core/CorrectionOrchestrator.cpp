#include "core/CorrectionOrchestrator.hpp"
#include "core/Errors.hpp"
#include "core/SyndromeDecoder.hpp"
#include "hardware/IHardwareInterface.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <set>
#include <thread>

namespace qecloop {

static int64_t now_ms() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void OrchestratorConfig::validate() const {
    std::set<int> distinct(physical_qubits.begin(), physical_qubits.end());
    if (distinct.size() != physical_qubits.size() || *distinct.begin() < 0) throw ConfigError(errors::D3400_PHYSICAL_QUBITS);
    if (retry_cap < 0) throw ConfigError(errors::D3400_RETRY_CAP);
    if (backoff_base.count() < 0 || backoff_max < backoff_base) throw ConfigError(errors::D3400_BACKOFF);
    if (!(deadline_fraction > 0.0) || deadline_fraction > 1.0) throw ConfigError(errors::D3400_DEADLINE_FRACTION);
}

// ---------------------------------------------------------------------------
// CycleStream

CycleStream::CycleStream(CorrectionOrchestrator& owner, int num_cycles, int shots)
: owner_(&owner), remaining_(num_cycles), shots_(shots) {}

std::optional<CycleRecord> CycleStream::next() {
    if (status_ != RunStatus::Running) return std::nullopt;
    if (owner_->fatal_) {
        status_ = RunStatus::CoherenceBudgetExceeded;
        return std::nullopt;
    }
    if (remaining_ <= 0) {
        status_ = RunStatus::Completed;
        return std::nullopt;
    }
    // A stop request is consumed by the stream that honours it.
    if (owner_->stop_requested_.exchange(false)) {
        status_ = RunStatus::Stopped;
        return std::nullopt;
    }

    CycleRecord rec = owner_->run_cycle(shots_);
    remaining_ -= 1;
    if (owner_->fatal_) {
        status_ = RunStatus::CoherenceBudgetExceeded;
    } else if (remaining_ == 0) {
        status_ = RunStatus::Completed;
    }
    return rec;
}

// ---------------------------------------------------------------------------
// CorrectionOrchestrator

CorrectionOrchestrator::CorrectionOrchestrator(IHardwareInterface& hw,
                                               const ErrorModelConfig& model_cfg,
                                               const SchedulerConfig& scheduler_cfg,
                                               const OrchestratorConfig& cfg)
: hw_(hw), cfg_(cfg), scheduler_cfg_(scheduler_cfg), model_(model_cfg, kCodeQubits) {
    cfg_.validate();
    scheduler_cfg_.validate();
    validate_capabilities();
    sleep_ = [](Micros d) {
        if (d.count() > 0) std::this_thread::sleep_for(d);
    };
}

void CorrectionOrchestrator::validate_capabilities() const {
    const HardwareCapabilities caps = hw_.capabilities();
    if (!caps.dynamic_circuits) throw ConfigError(errors::D3400_NO_DYNAMIC_CIRCUITS);
    for (int q : cfg_.physical_qubits) {
        if (q >= caps.num_qubits) throw ConfigError(errors::D3400_QUBIT_OUT_OF_RANGE);
    }
    if (caps.coupling_map.empty()) return;
    auto coupled = [&caps](int a, int b) {
        return std::any_of(caps.coupling_map.begin(), caps.coupling_map.end(), [a, b](const std::pair<int, int>& e) {
            return (e.first == a && e.second == b) || (e.first == b && e.second == a);
        });
    };
    const auto& q = cfg_.physical_qubits;
    if (!coupled(q[0], q[1]) || !coupled(q[1], q[2])) throw ConfigError(errors::D3400_NOT_COUPLED);
}

Micros CorrectionOrchestrator::backoff(int attempt) const {
    double scaled = double(cfg_.backoff_base.count()) * std::pow(2.0, attempt);
    double capped = std::min(scaled, double(cfg_.backoff_max.count()));
    return Micros((Micros::rep)capped);
}

void CorrectionOrchestrator::log_fault(const char* op, int attempt, const std::exception& e) const {
    if (!cfg_.verbose) return;
    std::cerr << "[orchestrator] " << op << " attempt " << (attempt + 1) << "/"
              << (cfg_.retry_cap + 1) << " failed: " << e.what() << std::endl;
}

template <typename Fn>
bool CorrectionOrchestrator::with_retries(const char* op, Fn&& fn, int& attempts) {
    for (int attempt = 0; attempt <= cfg_.retry_cap; ++attempt) {
        ++attempts;
        try {
            fn();
            return true;
        } catch (const HardwareFault& e) {
            log_fault(op, attempt, e);
            if (attempt < cfg_.retry_cap) sleep_(backoff(attempt));
        }
    }
    return false;
}

void CorrectionOrchestrator::check_deadline(const char* op, std::chrono::steady_clock::time_point start) const {
    auto latency = std::chrono::duration_cast<Micros>(std::chrono::steady_clock::now() - start);
    if (latency > deadline_) {
        throw HardwareTimeout(std::string(op) + " round trip " + std::to_string(latency.count()) + "us exceeded "
                              + std::to_string(deadline_.count()) + "us deadline");
    }
}

void CorrectionOrchestrator::start_controller() {
    CoherenceTimes coherence;
    int attempts = 0;
    bool ok = with_retries("coherence_times", [&]() { coherence = hw_.coherence_times(); }, attempts);
    if (!ok) throw HardwareUnavailable("coherence_times failed after retries");

    try {
        scheduler_.emplace(scheduler_cfg_, coherence);
    } catch (const CoherenceBudgetExceeded& e) {
        fatal_ = Fatal{e.what(), e.last_state()};
        std::cerr << "[orchestrator] " << e.what() << std::endl;
        return;
    }

    auto ceiling_us = scheduler_->ceiling().count();
    deadline_ = Micros(std::max<Micros::rep>(1, (Micros::rep)std::floor(ceiling_us * cfg_.deadline_fraction)));
    if (cfg_.verbose) {
        std::cerr << "[orchestrator] started: T1=" << coherence.t1_min.count() << "us T2=" << coherence.t2_min.count()
                  << "us ceiling=" << ceiling_us << "us deadline=" << deadline_.count() << "us" << std::endl;
    }
}

CycleStream CorrectionOrchestrator::run(int num_cycles, int shots_per_cycle) {
    if (num_cycles <= 0) throw ConfigError(errors::D3400_ZERO_CYCLES);
    if (shots_per_cycle <= 0) throw ConfigError(errors::D3400_ZERO_SHOTS);
    if (!scheduler_ && !fatal_) start_controller();
    return CycleStream(*this, num_cycles, shots_per_cycle);
}

RunResult CorrectionOrchestrator::run_all(int num_cycles, int shots_per_cycle) {
    RunResult result;
    CycleStream stream = run(num_cycles, shots_per_cycle);
    while (auto rec = stream.next()) {
        result.records.push_back(std::move(*rec));
    }
    result.status = stream.status();
    if (fatal_) {
        result.scheduler_state = fatal_->last_state;
        result.message = fatal_->message;
    } else {
        result.scheduler_state = scheduler_state();
    }
    return result;
}

std::optional<SchedulerState> CorrectionOrchestrator::scheduler_state() const {
    if (fatal_) return fatal_->last_state;
    if (!scheduler_) return std::nullopt;
    return scheduler_->state();
}

std::optional<Micros> CorrectionOrchestrator::coherence_ceiling() const {
    if (!scheduler_) return std::nullopt;
    return scheduler_->ceiling();
}

CycleRecord CorrectionOrchestrator::run_cycle(int shots) {
    CycleRecord rec;
    rec.cycle_index = next_index_++;
    rec.shots = shots;

    const Micros wait = scheduler_->state().current_delay;
    sleep_(wait);
    rec.wait_before_cycle = wait;
    rec.timestamp_ms = now_ms();

    SyndromeReadout readout;
    bool measured = with_retries("measure_syndrome", [&]() {
        auto start = std::chrono::steady_clock::now();
        SyndromeReadout r = hw_.measure_syndrome(cfg_.physical_qubits, shots, deadline_);
        rec.round_trip_latency = std::chrono::duration_cast<Micros>(std::chrono::steady_clock::now() - start);
        check_deadline("measure_syndrome", start);
        readout = r;
    }, rec.measurement_attempts);

    if (!measured) {
        rec.success = false;
        rec.risk = model_.aggregate_risk();
        rec.qubit_error = model_.estimate().qubit_error;
        rec.next_delay = wait;
        if (cfg_.verbose) std::cerr << "[orchestrator] cycle " << rec.cycle_index << " marked failed: no syndrome" << std::endl;
        commit(rec);
        return rec;
    }

    rec.syndrome = readout.outcome;
    rec.shot_counts = readout.shot_counts;
    int counted = 0;
    for (int c : rec.shot_counts) counted += c;
    if (counted == 0) rec.shot_counts[readout.outcome.index()] = shots;

    rec.correction = decoder::decode(readout.outcome);
    bool applied = true;
    if (rec.correction != CorrectionOperator::Identity) {
        int apply_attempts = 0;
        applied = with_retries("apply_correction", [&]() {
            auto start = std::chrono::steady_clock::now();
            hw_.apply_correction(rec.correction, cfg_.physical_qubits, deadline_);
            check_deadline("apply_correction", start);
        }, apply_attempts);
        if (!applied && cfg_.verbose) {
            std::cerr << "[orchestrator] cycle " << rec.cycle_index << " marked failed: " << to_string(rec.correction)
                      << " not applied" << std::endl;
        }
    }
    rec.success = applied;

    model_.observe(readout.outcome);
    rec.risk = model_.aggregate_risk();
    rec.qubit_error = model_.estimate().qubit_error;

    scheduler_->record_syndrome_weight(readout.outcome.weight());
    try {
        rec.next_delay = scheduler_->next_delay(rec.risk, wait);
    } catch (const CoherenceBudgetExceeded& e) {
        rec.next_delay = wait;
        fatal_ = Fatal{e.what(), e.last_state()};
        std::cerr << "[orchestrator] cycle " << rec.cycle_index << " terminated run: " << e.what() << std::endl;
    }

    commit(rec);
    return rec;
}

void CorrectionOrchestrator::commit(const CycleRecord& rec) {
    history_.append(rec);
    if (observer_) observer_(rec);
}

} // namespace qecloop

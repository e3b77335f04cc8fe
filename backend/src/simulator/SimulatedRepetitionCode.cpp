#include "simulator/SimulatedRepetitionCode.hpp"
#include "core/Errors.hpp"
#include "core/SyndromeDecoder.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace qecloop {

static constexpr double kPi = 3.14159265358979323846;

void SimulatorConfig::validate() const {
    auto unit = [](double x) { return std::isfinite(x) && x >= 0.0 && x <= 1.0; };
    if (flip_probability.size() != static_cast<size_t>(kCodeQubits)) throw ConfigError(errors::D3400_SIMULATOR);
    for (double p : flip_probability) {
        if (!unit(p)) throw ConfigError(errors::D3400_SIMULATOR);
    }
    if (!unit(correlated_flip_probability) || !unit(readout_error) || !unit(unavailable_probability) ||
        !unit(drift_amplitude)) {
        throw ConfigError(errors::D3400_SIMULATOR);
    }
    if (!std::isfinite(latency_jitter) || latency_jitter < 0.0 || latency_mean.count() < 0) {
        throw ConfigError(errors::D3400_SIMULATOR_LATENCY);
    }
    if (t1.count() <= 0 || t2.count() <= 0) throw ConfigError(errors::D3400_COHERENCE_TIMES);
    if (num_qubits < kCodeQubits) throw ConfigError(errors::D3400_QUBIT_OUT_OF_RANGE);
    if (encoded_value != 0 && encoded_value != 1) throw ConfigError(errors::D3400_ENCODED_STATE);
}

SimulatedRepetitionCode::SimulatedRepetitionCode(const SimulatorConfig& cfg) : cfg_(cfg) {
    cfg_.validate();
    state_.fill(uint8_t(cfg_.encoded_value));
    if (cfg_.seed == 0) {
        rng_.seed((unsigned)std::chrono::high_resolution_clock::now().time_since_epoch().count());
    } else {
        rng_.seed(cfg_.seed);
    }
}

HardwareCapabilities SimulatedRepetitionCode::capabilities() const {
    HardwareCapabilities caps;
    caps.backend_name = cfg_.backend_name;
    caps.num_qubits = cfg_.num_qubits;
    caps.dynamic_circuits = cfg_.dynamic_circuits;
    caps.coupling_map = cfg_.coupling_map;
    return caps;
}

CoherenceTimes SimulatedRepetitionCode::coherence_times() {
    std::lock_guard<std::mutex> lk(m_);
    maybe_unavailable("coherence_times");
    return { cfg_.t1, cfg_.t2 };
}

void SimulatedRepetitionCode::maybe_unavailable(const char* op) {
    if (forced_unavailable_ > 0) {
        forced_unavailable_ -= 1;
        throw HardwareUnavailable(std::string(op) + ": injected outage");
    }
    if (cfg_.unavailable_probability > 0.0 &&
        std::bernoulli_distribution(cfg_.unavailable_probability)(rng_)) {
        throw HardwareUnavailable(std::string(op) + ": backend busy");
    }
}

double SimulatedRepetitionCode::drifted_probability(int qubit) const {
    // Slow thermal drift around the calibrated rate; qubits drift out of phase.
    double phase = 2.0 * kPi * double(cycle_) / std::max(1.0, cfg_.drift_period_cycles);
    double p = cfg_.flip_probability.at(qubit) * (1.0 + cfg_.drift_amplitude * std::sin(phase + qubit));
    return std::min(1.0, std::max(0.0, p));
}

double SimulatedRepetitionCode::flip_probability(int qubit) const {
    std::lock_guard<std::mutex> lk(m_);
    return drifted_probability(qubit);
}

void SimulatedRepetitionCode::apply_noise() {
    for (int q = 0; q < kCodeQubits; ++q) {
        if (std::bernoulli_distribution(drifted_probability(q))(rng_)) state_[q] ^= 1;
    }
    for (int q = 0; q + 1 < kCodeQubits; ++q) {
        if (std::bernoulli_distribution(cfg_.correlated_flip_probability)(rng_)) {
            state_[q] ^= 1;
            state_[q + 1] ^= 1;
        }
    }
    auto range = injections_.equal_range(cycle_);
    for (auto it = range.first; it != range.second; ++it) state_[it->second] ^= 1;
    injections_.erase(range.first, range.second);
}

void SimulatedRepetitionCode::check_qubits(const PhysicalQubits& qubits) const {
    for (int q : qubits) {
        if (q < 0 || q >= cfg_.num_qubits) throw HardwareUnavailable("qubit " + std::to_string(q) + " not on backend");
    }
}

double SimulatedRepetitionCode::sample_latency_us() {
    double mean = double(cfg_.latency_mean.count());
    if (mean <= 0.0) return 0.0;
    if (cfg_.latency_jitter <= 0.0) return mean;
    std::normal_distribution<double> d(mean, mean * cfg_.latency_jitter);
    return std::max(0.0, d(rng_));
}

SyndromeReadout SimulatedRepetitionCode::measure_syndrome(const PhysicalQubits& qubits, int shots, Micros deadline) {
    SyndromeReadout out;
    Micros latency{0};
    {
        std::lock_guard<std::mutex> lk(m_);
        check_qubits(qubits);
        maybe_unavailable("measure_syndrome");

        latency = Micros((Micros::rep)sample_latency_us());
        if (latency > deadline) {
            // The job is abandoned; the qubits sat idle for the whole deadline.
            std::this_thread::sleep_for(deadline);
            throw HardwareTimeout("syndrome job exceeded " + std::to_string(deadline.count()) + "us");
        }

        apply_noise();
        cycle_ += 1;

        const SyndromeOutcome truth = decoder::syndrome_of(state_);
        std::bernoulli_distribution readout_flip(cfg_.readout_error);
        for (int s = 0; s < shots; ++s) {
            bool s0 = truth.s0() != readout_flip(rng_);
            bool s1 = truth.s1() != readout_flip(rng_);
            out.shot_counts[SyndromeOutcome(s0, s1).index()] += 1;
        }
        int best = 0;
        for (int i = 1; i < kSyndromeOutcomes; ++i) {
            if (out.shot_counts[i] > out.shot_counts[best]) best = i;
        }
        out.outcome = SyndromeOutcome::from_index(best);
    }
    if (latency.count() > 0) std::this_thread::sleep_for(latency);
    return out;
}

// Feed-forward corrections complete within the syndrome job, so they never hit the deadline.
void SimulatedRepetitionCode::apply_correction(CorrectionOperator op, const PhysicalQubits& qubits, Micros /*deadline*/) {
    std::lock_guard<std::mutex> lk(m_);
    check_qubits(qubits);
    maybe_unavailable("apply_correction");
    state_ = decoder::apply(op, state_);
}

void SimulatedRepetitionCode::inject_error(int64_t cycle, int qubit) {
    std::lock_guard<std::mutex> lk(m_);
    if (qubit < 0 || qubit >= kCodeQubits) throw std::out_of_range("inject_error: code qubit " + std::to_string(qubit));
    injections_.emplace(cycle, qubit);
}

void SimulatedRepetitionCode::inject_unavailable(int count) {
    std::lock_guard<std::mutex> lk(m_);
    forced_unavailable_ += count;
}

int SimulatedRepetitionCode::logical_value() const {
    std::lock_guard<std::mutex> lk(m_);
    return decoder::majority(state_);
}

QubitState SimulatedRepetitionCode::data_state() const {
    std::lock_guard<std::mutex> lk(m_);
    return state_;
}

int64_t SimulatedRepetitionCode::cycles_measured() const {
    std::lock_guard<std::mutex> lk(m_);
    return cycle_;
}

} // namespace qecloop

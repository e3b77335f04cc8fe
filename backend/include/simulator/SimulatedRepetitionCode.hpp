#pragma once
#include "hardware/IHardwareInterface.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace qecloop {

struct SimulatorConfig {
    std::string backend_name = "qecloop-sim";
    int num_qubits = 5;
    bool dynamic_circuits = true;
    std::vector<std::pair<int, int>> coupling_map{{0, 1}, {1, 2}, {2, 3}, {3, 4}};
    Micros t1{100000};
    Micros t2{80000};
    std::vector<double> flip_probability{0.01, 0.01, 0.01};  // per code qubit, per cycle
    double drift_amplitude = 0.5;           // relative modulation of flip_probability
    double drift_period_cycles = 200.0;
    double correlated_flip_probability = 0.002;  // adjacent pair flips together
    double readout_error = 0.01;            // per syndrome bit, per shot
    Micros latency_mean{200};
    double latency_jitter = 0.2;            // relative std-dev of the latency
    double unavailable_probability = 0.0;
    uint64_t seed = 0;                      // 0: seed from the clock
    int encoded_value = 0;                  // logical 0 encodes as 000, logical 1 as 111

    /** @throws ConfigError */
    void validate() const;
};

/**
 * @brief In-process stand-in for a backend holding a 3-qubit repetition code.
 *
 * Tracks the classical bit pattern of the data qubits (logical 0 encoded as
 * 000, logical 1 as 111). Each syndrome measurement first lets noise act: independent flips
 * with a slowly drifting rate plus correlated flips of adjacent pairs. Shots
 * then read the parity syndrome through a noisy readout.
 */
class SimulatedRepetitionCode : public IHardwareInterface {
public:
    explicit SimulatedRepetitionCode(const SimulatorConfig& cfg);
    ~SimulatedRepetitionCode() override = default;

    HardwareCapabilities capabilities() const override;
    CoherenceTimes coherence_times() override;
    SyndromeReadout measure_syndrome(const PhysicalQubits& qubits, int shots, Micros deadline) override;
    void apply_correction(CorrectionOperator op, const PhysicalQubits& qubits, Micros deadline) override;

    /** @brief Flip `qubit` just before the measurement of cycle `cycle` (0-based). */
    void inject_error(int64_t cycle, int qubit);
    /** @brief Make the next `count` hardware calls fail with HardwareUnavailable. */
    void inject_unavailable(int count);

    /** @brief Ground truth: majority vote of the data qubits. */
    int logical_value() const;
    int encoded_value() const { return cfg_.encoded_value; }
    QubitState data_state() const;
    int64_t cycles_measured() const;
    /** @brief Current (drifted) flip probability of a code qubit. */
    double flip_probability(int qubit) const;

private:
    void maybe_unavailable(const char* op);
    void check_qubits(const PhysicalQubits& qubits) const;
    double drifted_probability(int qubit) const;
    void apply_noise();
    double sample_latency_us();

    SimulatorConfig cfg_;
    mutable std::mutex m_;
    std::mt19937_64 rng_;
    QubitState state_{};
    int64_t cycle_ = 0;
    int forced_unavailable_ = 0;
    std::multimap<int64_t, int> injections_;
};

} // namespace qecloop

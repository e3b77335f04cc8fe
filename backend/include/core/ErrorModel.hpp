#pragma once

#include "core/Types.hpp"

#include <optional>

namespace qecloop {

struct ErrorModelConfig {
    double floor = 0.001;              // residual noise; estimates never drop below
    double initial_estimate = 0.001;
    double learning_rate = 0.2;        // step added to an implicated qubit
    double decay_rate = 0.15;          // fraction of (p - floor) removed each cycle
    double correlation_step = 0.1;
    double correlation_decay = 0.15;
    double qubit_weight = 1.0;
    double correlation_weight = 2.0;

    /** @throws ConfigError */
    void validate() const;
};

/**
 * @brief Running estimate of per-qubit bit-flip probability on a linear chain.
 *
 * Estimates drift back toward the floor every cycle (error rates are not
 * stationary) and are pushed up for the qubit a non-trivial syndrome implicates.
 * Implications on adjacent qubits in consecutive cycles feed the pair's
 * correlation entry.
 */
class ErrorModel {
public:
    explicit ErrorModel(const ErrorModelConfig& cfg, int num_qubits = kCodeQubits);

    /** @brief Fold one cycle's syndrome into the estimate and return the result. */
    const ErrorEstimate& observe(const SyndromeOutcome& outcome);

    /** @brief Weighted combination of qubit and correlation terms, clamped to [0, 1]. */
    double aggregate_risk() const;

    const ErrorEstimate& estimate() const { return estimate_; }
    double qubit_error(int qubit) const;
    /** @brief Correlation entry of adjacent qubits a and b (|a - b| must be 1). */
    double correlation(int a, int b) const;

    const ErrorModelConfig& config() const { return cfg_; }

private:
    void decay();

    ErrorModelConfig cfg_;
    int num_qubits_;
    ErrorEstimate estimate_;
    std::optional<int> last_implicated_;
};

} // namespace qecloop

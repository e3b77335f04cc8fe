#include "core/ErrorModel.hpp"
#include "core/Errors.hpp"
#include "core/SyndromeDecoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace qecloop {

static bool in_unit(double x) {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

static double clamp(double x, double lo, double hi) {
    return std::min(hi, std::max(lo, x));
}

void ErrorModelConfig::validate() const {
    if (!in_unit(floor) || floor >= 1.0) throw ConfigError(errors::D3400_FLOOR);
    if (!in_unit(initial_estimate) || initial_estimate < floor) throw ConfigError(errors::D3400_INITIAL_ESTIMATE);
    if (!in_unit(learning_rate) || learning_rate == 0.0) throw ConfigError(errors::D3400_LEARNING_RATE);
    if (!in_unit(decay_rate) || !in_unit(correlation_decay)) throw ConfigError(errors::D3400_DECAY);
    if (!in_unit(correlation_step)) throw ConfigError(errors::D3400_CORRELATION_STEP);
    if (!(qubit_weight >= 0.0) || !(correlation_weight >= 0.0)) throw ConfigError(errors::D3400_WEIGHTS);
}

ErrorModel::ErrorModel(const ErrorModelConfig& cfg, int num_qubits)
: cfg_(cfg), num_qubits_(num_qubits) {
    cfg_.validate();
    if (num_qubits_ < 2) throw ConfigError(errors::D3400_PHYSICAL_QUBITS);
    estimate_.qubit_error.assign(num_qubits_, cfg_.initial_estimate);
    estimate_.correlation.assign(num_qubits_ - 1, 0.0);
}

void ErrorModel::decay() {
    for (auto& p : estimate_.qubit_error) {
        p = cfg_.floor + (p - cfg_.floor) * (1.0 - cfg_.decay_rate);
        p = clamp(p, cfg_.floor, 1.0);
    }
    for (auto& c : estimate_.correlation) {
        c = clamp(c * (1.0 - cfg_.correlation_decay), 0.0, 1.0);
    }
}

const ErrorEstimate& ErrorModel::observe(const SyndromeOutcome& outcome) {
    decay();

    int implicated = decoder::target_qubit(decoder::decode(outcome));
    if (implicated < 0 || implicated >= num_qubits_) {
        last_implicated_.reset();
        return estimate_;
    }

    auto& p = estimate_.qubit_error[implicated];
    p = clamp(p + cfg_.learning_rate, cfg_.floor, 1.0);

    // Adjacent qubits flagged back to back point at a correlated source.
    if (last_implicated_ && std::abs(*last_implicated_ - implicated) == 1) {
        int pair = std::min(*last_implicated_, implicated);
        auto& c = estimate_.correlation[pair];
        c = clamp(c + cfg_.correlation_step, 0.0, 1.0);
    }
    last_implicated_ = implicated;
    return estimate_;
}

double ErrorModel::aggregate_risk() const {
    double qubit_term = 0.0;
    for (double p : estimate_.qubit_error) qubit_term += p;
    double corr_term = 0.0;
    for (double c : estimate_.correlation) corr_term += c;
    return clamp(cfg_.qubit_weight * qubit_term + cfg_.correlation_weight * corr_term, 0.0, 1.0);
}

double ErrorModel::qubit_error(int qubit) const {
    return estimate_.qubit_error.at(qubit);
}

double ErrorModel::correlation(int a, int b) const {
    if (std::abs(a - b) != 1) return 0.0;
    return estimate_.correlation.at(std::min(a, b));
}

} // namespace qecloop

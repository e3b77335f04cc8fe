#pragma once

#include "core/Types.hpp"

namespace qecloop {

struct SchedulerConfig {
    Micros initial_delay{1000};
    Micros min_cycle_time{10};            // hardware minimum, lower bound when shortening
    double high_water = 0.15;             // risk above: halve the delay
    double low_water = 0.05;              // risk below for calm_cycles_required cycles: lengthen
    int calm_cycles_required = 1;         // calm cycles before the first lengthening; later calm cycles keep lengthening
    double increase_factor = 1.5;
    int direction_change_min_cycles = 3;  // at most one shorten<->lengthen flip per this many cycles
    double weight_ema_alpha = 0.3;
    double calm_weight_threshold = 0.5;   // syndrome-weight EMA must also be below this to lengthen

    /** @throws ConfigError */
    void validate() const;
};

/**
 * @brief Chooses the delay before the next correction cycle.
 *
 * The delay never exceeds the coherence ceiling, min(T1, T2) / 10. An initial
 * delay above the ceiling is rejected at construction. Lengthening stops at the
 * ceiling; a delay that has to be kept (or cannot be shortened enough) above the
 * ceiling raises CoherenceBudgetExceeded instead of being clamped.
 */
class CycleScheduler {
public:
    /** @throws ConfigError, CoherenceBudgetExceeded */
    CycleScheduler(const SchedulerConfig& cfg, const CoherenceTimes& coherence);

    /** @brief Fold the number of fired stabilizers of the latest cycle into the EMA. */
    void record_syndrome_weight(int weight);

    /**
     * @brief Decide the next delay from the current risk.
     * @throws CoherenceBudgetExceeded carrying the state before this call.
     */
    Micros next_delay(double risk, Micros previous_delay);

    const SchedulerState& state() const { return state_; }
    Micros ceiling() const { return ceiling_; }
    const SchedulerConfig& config() const { return cfg_; }

    static Micros ceiling_for(const CoherenceTimes& coherence);

private:
    bool direction_allowed(AdjustDirection want) const;

    SchedulerConfig cfg_;
    Micros ceiling_;
    SchedulerState state_;
};

} // namespace qecloop

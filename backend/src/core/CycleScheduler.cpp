#include "core/CycleScheduler.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace qecloop {

void SchedulerConfig::validate() const {
    auto unit = [](double x) { return std::isfinite(x) && x >= 0.0 && x <= 1.0; };
    if (!unit(low_water) || !unit(high_water)) throw ConfigError(errors::D3400_WATERMARK_RANGE);
    if (!(low_water < high_water)) throw ConfigError(errors::D3400_WATERMARKS);
    if (initial_delay.count() <= 0) throw ConfigError(errors::D3400_INITIAL_DELAY);
    if (min_cycle_time.count() <= 0 || min_cycle_time > initial_delay) throw ConfigError(errors::D3400_MIN_CYCLE);
    if (!(increase_factor > 1.0) || !std::isfinite(increase_factor)) throw ConfigError(errors::D3400_INCREASE_FACTOR);
    if (calm_cycles_required < 1 || direction_change_min_cycles < 0) throw ConfigError(errors::D3400_CALM_CYCLES);
    if (!(weight_ema_alpha > 0.0) || weight_ema_alpha > 1.0) throw ConfigError(errors::D3400_EMA_ALPHA);
}

Micros CycleScheduler::ceiling_for(const CoherenceTimes& coherence) {
    return std::min(coherence.t1_min, coherence.t2_min) / 10;
}

CycleScheduler::CycleScheduler(const SchedulerConfig& cfg, const CoherenceTimes& coherence)
: cfg_(cfg) {
    cfg_.validate();
    if (coherence.t1_min.count() <= 0 || coherence.t2_min.count() <= 0) throw ConfigError(errors::D3400_COHERENCE_TIMES);
    ceiling_ = ceiling_for(coherence);

    state_.current_delay = cfg_.initial_delay;
    state_.adjustment_factor = 1.0;

    if (cfg_.min_cycle_time > ceiling_) {
        throw CoherenceBudgetExceeded(errors::D3300_MIN_CYCLE_ABOVE_CEILING, state_, ceiling_);
    }
    if (cfg_.initial_delay > ceiling_) {
        throw CoherenceBudgetExceeded(errors::D3300_INITIAL_DELAY_ABOVE_CEILING, state_, ceiling_);
    }
}

void CycleScheduler::record_syndrome_weight(int weight) {
    state_.syndrome_weight_ema = cfg_.weight_ema_alpha * weight + (1.0 - cfg_.weight_ema_alpha) * state_.syndrome_weight_ema;
}

bool CycleScheduler::direction_allowed(AdjustDirection want) const {
    if (state_.last_direction == AdjustDirection::None || state_.last_direction == want) return true;
    return state_.cycles_since_direction_change >= cfg_.direction_change_min_cycles;
}

Micros CycleScheduler::next_delay(double risk, Micros previous_delay) {
    const SchedulerState last_valid = state_;

    state_.cycles_observed += 1;
    state_.cycles_since_direction_change += 1;

    AdjustDirection want = AdjustDirection::None;
    if (risk > cfg_.high_water) {
        state_.calm_streak = 0;
        want = AdjustDirection::Shorten;
    } else if (risk < cfg_.low_water && state_.syndrome_weight_ema < cfg_.calm_weight_threshold) {
        state_.calm_streak += 1;
        if (state_.calm_streak >= cfg_.calm_cycles_required) want = AdjustDirection::Lengthen;
    } else {
        state_.calm_streak = 0;
    }

    Micros next = previous_delay;
    if (want != AdjustDirection::None && direction_allowed(want)) {
        if (want == AdjustDirection::Shorten) {
            next = std::max(previous_delay / 2, cfg_.min_cycle_time);
        } else if (previous_delay < ceiling_) {
            auto grown = Micros(static_cast<Micros::rep>(std::ceil(previous_delay.count() * cfg_.increase_factor)));
            next = std::min(grown, ceiling_);
        }
        if (next != previous_delay) {
            if (state_.last_direction != AdjustDirection::None && state_.last_direction != want) {
                state_.cycles_since_direction_change = 0;
            }
            state_.last_direction = want;
        }
    }

    if (next > ceiling_) {
        state_ = last_valid;
        throw CoherenceBudgetExceeded(errors::D3300_DELAY_ABOVE_CEILING, last_valid, ceiling_);
    }

    state_.current_delay = next;
    state_.adjustment_factor = double(next.count()) / double(cfg_.initial_delay.count());
    return next;
}

} // namespace qecloop

#include <gtest/gtest.h>
#include "core/CycleScheduler.hpp"
#include "core/ErrorModel.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <vector>

using namespace qecloop;

static CoherenceTimes coherence_us(int64_t t1, int64_t t2) {
    CoherenceTimes c;
    c.t1_min = Micros(t1);
    c.t2_min = Micros(t2);
    return c;
}

TEST(CycleScheduler, CeilingIsTenthOfShorterCoherenceTime) {
    EXPECT_EQ(CycleScheduler::ceiling_for(coherence_us(50000, 80000)), Micros(5000));
    EXPECT_EQ(CycleScheduler::ceiling_for(coherence_us(90000, 30000)), Micros(3000));
}

TEST(CycleScheduler, LengtheningStopsAtCeiling) {
    SchedulerConfig cfg;
    cfg.initial_delay = Micros(4000);
    cfg.calm_cycles_required = 1;
    CycleScheduler sched(cfg, coherence_us(50000, 80000));

    Micros d = sched.next_delay(0.0, cfg.initial_delay);
    EXPECT_EQ(d, Micros(5000));
    for (int i = 0; i < 5; ++i) {
        d = sched.next_delay(0.0, d);
        EXPECT_EQ(d, Micros(5000));
        EXPECT_LE(d, sched.ceiling());
    }
}

TEST(CycleScheduler, RaisesInsteadOfClampingAboveCeiling) {
    SchedulerConfig cfg;
    cfg.initial_delay = Micros(1000);
    CycleScheduler sched(cfg, coherence_us(10000, 10000));
    ASSERT_EQ(sched.ceiling(), Micros(1000));

    // Holding a delay that is already past the ceiling.
    try {
        sched.next_delay(0.1, Micros(2000));
        FAIL() << "expected CoherenceBudgetExceeded";
    } catch (const CoherenceBudgetExceeded& e) {
        EXPECT_EQ(e.code(), errors::E3300_COHERENCE_BUDGET_EXCEEDED);
        EXPECT_EQ(e.ceiling(), Micros(1000));
        EXPECT_EQ(e.last_state().current_delay, Micros(1000));
        EXPECT_EQ(e.last_state().cycles_observed, 0);
    }
    // State rolled back to the last valid one.
    EXPECT_EQ(sched.state().cycles_observed, 0);

    // Shortening that still lands above the ceiling is fatal too.
    EXPECT_THROW(sched.next_delay(0.9, Micros(8000)), CoherenceBudgetExceeded);
    EXPECT_EQ(sched.state().cycles_observed, 0);
    EXPECT_EQ(sched.next_delay(0.9, Micros(1000)), Micros(500));
}

TEST(CycleScheduler, InitialDelayAboveCeilingFailsAtConstruction) {
    SchedulerConfig cfg;
    cfg.initial_delay = Micros(2000);
    try {
        CycleScheduler sched(cfg, coherence_us(10000, 10000));
        FAIL() << "expected CoherenceBudgetExceeded";
    } catch (const CoherenceBudgetExceeded& e) {
        EXPECT_EQ(e.ceiling(), Micros(1000));
        EXPECT_EQ(e.last_state().current_delay, Micros(2000));
    }
    cfg.initial_delay = Micros(1000);
    EXPECT_NO_THROW((CycleScheduler{cfg, coherence_us(10000, 10000)}));
}

TEST(CycleScheduler, CalmStreakKeepsLengtheningOnceReached) {
    SchedulerConfig cfg;
    cfg.calm_cycles_required = 3;
    CycleScheduler sched(cfg, coherence_us(1000000, 1000000));

    std::vector<Micros> delays;
    Micros d = cfg.initial_delay;
    for (int i = 0; i < 5; ++i) {
        d = sched.next_delay(0.0, d);
        delays.push_back(d);
    }
    EXPECT_EQ(delays, (std::vector<Micros>{Micros(1000), Micros(1000), Micros(1500), Micros(2250), Micros(3375)}));

    // Any non-calm cycle restarts the count.
    d = sched.next_delay(0.1, d);
    EXPECT_EQ(d, Micros(3375));
    d = sched.next_delay(0.0, d);
    EXPECT_EQ(d, Micros(3375));
}

TEST(CycleScheduler, DefaultsLengthenOnEveryCalmCycle) {
    SchedulerConfig cfg;
    CycleScheduler sched(cfg, coherence_us(1000000, 1000000));
    Micros d = cfg.initial_delay;
    for (int i = 0; i < 10; ++i) {
        Micros next = sched.next_delay(0.0, d);
        EXPECT_GT(next, d) << "cycle " << i;
        d = next;
    }
}

TEST(CycleScheduler, MinimumCycleAboveCeilingFailsAtConstruction) {
    SchedulerConfig cfg;
    cfg.initial_delay = Micros(3000);
    cfg.min_cycle_time = Micros(2000);
    EXPECT_THROW((CycleScheduler{cfg, coherence_us(10000, 10000)}), CoherenceBudgetExceeded);
    EXPECT_THROW((CycleScheduler{cfg, coherence_us(0, 10000)}), ConfigError);
}

TEST(CycleScheduler, ShortensAfterErrorsAndLengthensAfterCalm) {
    ErrorModel model(ErrorModelConfig{});
    SchedulerConfig cfg;
    CycleScheduler sched(cfg, coherence_us(1000000, 1000000));

    auto step = [&](const SyndromeOutcome& s, Micros prev) {
        model.observe(s);
        sched.record_syndrome_weight(s.weight());
        return sched.next_delay(model.aggregate_risk(), prev);
    };

    Micros d = cfg.initial_delay;
    for (int i = 0; i < 5; ++i) d = step(SyndromeOutcome(false, false), d);
    const Micros after_trivial = d;
    EXPECT_GT(after_trivial, cfg.initial_delay);

    Micros prev = d;
    for (int i = 0; i < 3; ++i) {
        d = step(SyndromeOutcome(true, false), d);
        EXPECT_LT(d, prev);
        prev = d;
    }
    const Micros after_errors = d;
    EXPECT_LT(after_errors, after_trivial);

    // Risk stays high for a few trivial cycles, then calm cycles grow the delay back.
    Micros lowest = d;
    for (int i = 0; i < 100; ++i) {
        d = step(SyndromeOutcome(false, false), d);
        lowest = std::min(lowest, d);
    }
    EXPECT_GT(d, lowest);
    EXPECT_GT(d, after_errors);
    EXPECT_EQ(d, sched.ceiling());
}

TEST(CycleScheduler, DirectionChangesAreRateLimited) {
    SchedulerConfig cfg;
    cfg.calm_cycles_required = 1;
    cfg.direction_change_min_cycles = 3;
    CycleScheduler sched(cfg, coherence_us(1000000, 1000000));

    Micros d = sched.next_delay(0.0, Micros(1000));
    EXPECT_EQ(d, Micros(1500));
    d = sched.next_delay(0.5, d);
    EXPECT_EQ(d, Micros(1500));  // too soon to reverse
    d = sched.next_delay(0.5, d);
    EXPECT_EQ(d, Micros(750));
    EXPECT_EQ(sched.state().last_direction, AdjustDirection::Shorten);
    d = sched.next_delay(0.0, d);
    EXPECT_EQ(d, Micros(750));
    d = sched.next_delay(0.0, d);
    EXPECT_EQ(d, Micros(750));
    d = sched.next_delay(0.0, d);
    EXPECT_EQ(d, Micros(1125));
}

TEST(CycleScheduler, ShorteningRespectsMinimumCycleTime) {
    SchedulerConfig cfg;
    cfg.initial_delay = Micros(100);
    cfg.min_cycle_time = Micros(40);
    CycleScheduler sched(cfg, coherence_us(1000000, 1000000));
    Micros d = sched.next_delay(1.0, cfg.initial_delay);
    EXPECT_EQ(d, Micros(50));
    d = sched.next_delay(1.0, d);
    EXPECT_EQ(d, Micros(40));
    d = sched.next_delay(1.0, d);
    EXPECT_EQ(d, Micros(40));
    EXPECT_DOUBLE_EQ(sched.state().adjustment_factor, 0.4);
}

TEST(CycleScheduler, RejectsInvalidConfig) {
    SchedulerConfig cfg;
    cfg.low_water = 0.2;
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg = SchedulerConfig{};
    cfg.increase_factor = 1.0;
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg = SchedulerConfig{};
    cfg.min_cycle_time = Micros(5000);
    EXPECT_THROW(cfg.validate(), ConfigError);
}

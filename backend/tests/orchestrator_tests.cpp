#include <gtest/gtest.h>
#include "StubHardware.hpp"
#include "core/CorrectionOrchestrator.hpp"
#include "core/Errors.hpp"
#include "core/MetricsAggregator.hpp"
#include "core/RunInterrupter.hpp"

#include <algorithm>
#include <memory>
#include <vector>

using namespace qecloop;
using qecloop::testing::StubHardware;

namespace {

struct Harness {
    StubHardware hw;
    ErrorModelConfig model_cfg;
    SchedulerConfig sched_cfg;
    OrchestratorConfig orch_cfg;
    std::vector<Micros> sleeps;

    Harness() {
        sched_cfg.initial_delay = Micros(100);
        orch_cfg.verbose = false;
    }

    std::unique_ptr<CorrectionOrchestrator> make() {
        auto o = std::make_unique<CorrectionOrchestrator>(hw, model_cfg, sched_cfg, orch_cfg);
        o->set_sleep_fn([this](Micros d) { sleeps.push_back(d); });
        return o;
    }
};

} // namespace

TEST(CorrectionOrchestrator, TrivialSyndromesLengthenDelay) {
    Harness h;
    h.sched_cfg = SchedulerConfig{};
    auto orch = h.make();
    RunResult result = orch->run_all(10, 100);

    EXPECT_EQ(result.status, RunStatus::Completed);
    ASSERT_EQ(result.records.size(), 10u);
    for (size_t i = 0; i < result.records.size(); ++i) {
        const auto& r = result.records[i];
        EXPECT_EQ(r.cycle_index, (int64_t)i);
        ASSERT_TRUE(r.syndrome.has_value());
        EXPECT_TRUE(r.syndrome->trivial());
        EXPECT_EQ(r.correction, CorrectionOperator::Identity);
        EXPECT_TRUE(r.success);
        EXPECT_EQ(r.shot_counts[0], 100);
        EXPECT_LE(r.next_delay, *orch->coherence_ceiling());
        EXPECT_GT(r.next_delay, r.wait_before_cycle);
        if (i > 0) {
            EXPECT_GT(r.next_delay, result.records[i - 1].next_delay);
            EXPECT_EQ(r.wait_before_cycle, result.records[i - 1].next_delay);
        }
    }
    EXPECT_TRUE(h.hw.applied.empty());
    EXPECT_EQ(result.records.front().wait_before_cycle, SchedulerConfig{}.initial_delay);

    auto s = metrics::summarize(result.records);
    EXPECT_DOUBLE_EQ(s.logical_error_rate, 0.0);
    EXPECT_DOUBLE_EQ(s.correction_success_rate, 1.0);
    EXPECT_DOUBLE_EQ(s.syndrome_reliability, 1.0);
}

TEST(CorrectionOrchestrator, InjectedSyndromeIsCorrectedAndDecays) {
    Harness h;
    h.hw.scripted[5] = SyndromeOutcome(true, true);
    auto orch = h.make();
    RunResult result = orch->run_all(10, 100);
    ASSERT_EQ(result.records.size(), 10u);

    EXPECT_EQ(result.records[5].correction, CorrectionOperator::FlipQubit1);
    ASSERT_EQ(h.hw.applied.size(), 1u);
    EXPECT_EQ(h.hw.applied[0], CorrectionOperator::FlipQubit1);

    const double floor = h.model_cfg.floor;
    EXPECT_GT(result.records[5].qubit_error[1], result.records[4].qubit_error[1] + 0.1);
    for (size_t i = 6; i < 10; ++i) {
        EXPECT_LT(result.records[i].qubit_error[1], result.records[i - 1].qubit_error[1]);
        EXPECT_GE(result.records[i].qubit_error[1], floor);
    }
    // The spike shortens the next cycle.
    EXPECT_LT(result.records[5].next_delay, result.records[5].wait_before_cycle);
    EXPECT_DOUBLE_EQ(metrics::summarize(result.records).logical_error_rate, 0.0);
}

TEST(CorrectionOrchestrator, RetryLaw) {
    const int retry_cap = 3;
    for (int failures = 0; failures <= 5; ++failures) {
        Harness h;
        h.orch_cfg.retry_cap = retry_cap;
        h.hw.measure_failures = failures;
        auto orch = h.make();
        RunResult result = orch->run_all(1, 10);
        ASSERT_EQ(result.records.size(), 1u);
        const auto& r = result.records[0];

        const int expected_calls = std::min(failures + 1, retry_cap + 1);
        EXPECT_EQ(h.hw.measure_calls, expected_calls) << "failures=" << failures;
        EXPECT_EQ(r.measurement_attempts, expected_calls);
        EXPECT_EQ(r.success, failures <= retry_cap) << "failures=" << failures;
        EXPECT_EQ(r.syndrome.has_value(), failures <= retry_cap);
        // One pre-cycle wait plus one backoff per retried attempt.
        EXPECT_EQ(h.sleeps.size(), 1u + (size_t)std::min(failures, retry_cap));
        EXPECT_EQ(result.status, RunStatus::Completed);
    }
}

TEST(CorrectionOrchestrator, BackoffIsExponentialAndCapped) {
    Harness h;
    h.orch_cfg.retry_cap = 4;
    h.orch_cfg.backoff_base = Micros(100);
    h.orch_cfg.backoff_max = Micros(300);
    h.hw.measure_failures = 4;
    auto orch = h.make();
    orch->run_all(1, 10);
    ASSERT_EQ(h.sleeps.size(), 5u);
    EXPECT_EQ(h.sleeps[1], Micros(100));
    EXPECT_EQ(h.sleeps[2], Micros(200));
    EXPECT_EQ(h.sleeps[3], Micros(300));
    EXPECT_EQ(h.sleeps[4], Micros(300));
}

TEST(CorrectionOrchestrator, FailedMeasurementLeavesStateUntouched) {
    Harness h;
    h.orch_cfg.retry_cap = 0;
    h.hw.measure_failures = 1;
    auto orch = h.make();
    RunResult result = orch->run_all(2, 10);
    ASSERT_EQ(result.records.size(), 2u);

    const auto& failed = result.records[0];
    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(failed.syndrome.has_value());
    EXPECT_EQ(failed.next_delay, failed.wait_before_cycle);
    EXPECT_NEAR(failed.risk, 0.003, 1e-12);
    EXPECT_TRUE(result.records[1].success);
    EXPECT_EQ(result.records[1].cycle_index, 1);

    auto s = metrics::summarize(result.records);
    EXPECT_DOUBLE_EQ(s.correction_success_rate, 0.5);
    EXPECT_EQ(s.failed_cycles, 1);
}

TEST(CorrectionOrchestrator, TimeoutsAreRetried) {
    Harness h;
    h.hw.measure_failures = 1;
    h.hw.fail_with_timeout = true;
    auto orch = h.make();
    RunResult result = orch->run_all(1, 10);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.records[0].success);
    EXPECT_EQ(result.records[0].measurement_attempts, 2);
}

TEST(CorrectionOrchestrator, FailedCorrectionMarksCycleButStillLearns) {
    Harness h;
    h.hw.scripted[0] = SyndromeOutcome(true, false);
    h.hw.apply_failures = 100;
    auto orch = h.make();
    RunResult result = orch->run_all(1, 10);
    ASSERT_EQ(result.records.size(), 1u);
    const auto& r = result.records[0];
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.syndrome.has_value());
    EXPECT_EQ(r.correction, CorrectionOperator::FlipQubit0);
    EXPECT_EQ(h.hw.apply_calls, h.orch_cfg.retry_cap + 1);
    EXPECT_GT(orch->error_model().qubit_error(0), 0.1);
    EXPECT_GT(r.risk, 0.15);
}

TEST(CorrectionOrchestrator, StalledCorrectionIsRetriedAsTimeout) {
    Harness h;
    h.hw.coherence.t1_min = Micros(20000);
    h.hw.coherence.t2_min = Micros(20000);
    h.hw.scripted[0] = SyndromeOutcome(false, true);
    h.hw.slow_applies = 1;
    auto orch = h.make();
    RunResult result = orch->run_all(1, 10);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(*orch->coherence_ceiling(), Micros(2000));
    EXPECT_TRUE(result.records[0].success);
    EXPECT_EQ(h.hw.apply_calls, 2);
    ASSERT_EQ(h.hw.applied.size(), 1u);
    EXPECT_EQ(h.hw.applied[0], CorrectionOperator::FlipQubit2);
    // Pre-cycle wait plus one backoff before the second apply.
    EXPECT_EQ(h.sleeps.size(), 2u);
}

TEST(CorrectionOrchestrator, CorrectionThatAlwaysStallsFailsTheCycle) {
    Harness h;
    h.hw.coherence.t1_min = Micros(20000);
    h.hw.coherence.t2_min = Micros(20000);
    h.hw.scripted[0] = SyndromeOutcome(true, false);
    h.orch_cfg.retry_cap = 1;
    h.hw.slow_applies = 2;
    auto orch = h.make();
    RunResult result = orch->run_all(1, 10);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_FALSE(result.records[0].success);
    EXPECT_EQ(h.hw.apply_calls, 2);
    EXPECT_TRUE(h.hw.applied.empty());
    EXPECT_EQ(result.status, RunStatus::Completed);
}

TEST(CorrectionOrchestrator, StopBetweenCyclesAndRestart) {
    Harness h;
    auto orch = h.make();
    CorrectionOrchestrator* raw = orch.get();
    orch->set_cycle_observer([raw](const CycleRecord& r) {
        if (r.cycle_index == 2) raw->request_stop();
    });

    RunResult first = orch->run_all(10, 10);
    EXPECT_EQ(first.status, RunStatus::Stopped);
    ASSERT_EQ(first.records.size(), 3u);

    orch->set_cycle_observer(nullptr);
    RunResult second = orch->run_all(2, 10);
    EXPECT_EQ(second.status, RunStatus::Completed);
    ASSERT_EQ(second.records.size(), 2u);
    EXPECT_EQ(second.records[0].cycle_index, 3);
    EXPECT_EQ(second.records[1].cycle_index, 4);
    EXPECT_EQ(orch->history().size(), 5u);
    EXPECT_EQ(second.records[0].wait_before_cycle, first.records.back().next_delay);
}

TEST(CorrectionOrchestrator, StopRequestedBeforeRunStopsItBeforeTheFirstCycle) {
    Harness h;
    auto orch = h.make();
    orch->request_stop();
    RunResult stopped = orch->run_all(5, 10);
    EXPECT_EQ(stopped.status, RunStatus::Stopped);
    EXPECT_TRUE(stopped.records.empty());
    EXPECT_EQ(h.hw.measure_calls, 0);

    RunResult next = orch->run_all(2, 10);
    EXPECT_EQ(next.status, RunStatus::Completed);
    EXPECT_EQ(next.records.size(), 2u);
}

TEST(RunInterrupter, StopsTheAttachedRun) {
    Harness h;
    auto orch = h.make();
    RunInterrupter interrupter;
    orch->set_cycle_observer([&](const CycleRecord& r) {
        if (r.cycle_index == 1) interrupter.interrupt();
    });
    RunResult result;
    {
        RunInterrupter::Attachment attached(interrupter, *orch);
        EXPECT_TRUE(interrupter.attached());
        result = orch->run_all(10, 10);
    }
    EXPECT_EQ(result.status, RunStatus::Stopped);
    EXPECT_EQ(result.records.size(), 2u);
    EXPECT_TRUE(interrupter.interrupted());
    EXPECT_FALSE(interrupter.attached());
}

TEST(RunInterrupter, DetachesWhenTheRunThrows) {
    RunInterrupter interrupter;
    {
        Harness h;
        h.hw.coherence_failures = 100;
        auto orch = h.make();
        bool unwound = false;
        try {
            RunInterrupter::Attachment attached(interrupter, *orch);
            orch->run_all(1, 10);
        } catch (const HardwareUnavailable&) {
            unwound = true;
        }
        EXPECT_TRUE(unwound);
        EXPECT_FALSE(interrupter.attached());
    }
    // The orchestrator is gone; interrupting must not reach it.
    interrupter.interrupt();
    EXPECT_TRUE(interrupter.interrupted());
    EXPECT_FALSE(interrupter.attached());
}

TEST(RunInterrupter, EarlierInterruptStopsLaterAttachments) {
    Harness h;
    auto orch = h.make();
    RunInterrupter interrupter;
    interrupter.interrupt();
    RunInterrupter::Attachment attached(interrupter, *orch);
    RunResult result = orch->run_all(5, 10);
    EXPECT_EQ(result.status, RunStatus::Stopped);
    EXPECT_TRUE(result.records.empty());
}

TEST(CorrectionOrchestrator, StreamIsLazy) {
    Harness h;
    auto orch = h.make();
    {
        CycleStream stream = orch->run(5, 10);
        ASSERT_TRUE(stream.next().has_value());
        ASSERT_TRUE(stream.next().has_value());
        EXPECT_EQ(stream.status(), RunStatus::Running);
        EXPECT_EQ(stream.remaining(), 3);
    }
    EXPECT_EQ(h.hw.measure_calls, 2);

    RunResult rest = orch->run_all(3, 10);
    ASSERT_EQ(rest.records.size(), 3u);
    EXPECT_EQ(rest.records.front().cycle_index, 2);
}

TEST(CorrectionOrchestrator, InitialDelayAboveCeilingStopsBeforeAnyHardwareCall) {
    Harness h;
    h.hw.coherence.t1_min = Micros(10000);
    h.hw.coherence.t2_min = Micros(10000);
    h.sched_cfg.initial_delay = Micros(2000);
    auto orch = h.make();

    RunResult result = orch->run_all(5, 10);
    EXPECT_EQ(result.status, RunStatus::CoherenceBudgetExceeded);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(h.hw.measure_calls, 0);
    EXPECT_TRUE(h.sleeps.empty());
    ASSERT_TRUE(result.scheduler_state.has_value());
    EXPECT_EQ(result.scheduler_state->current_delay, Micros(2000));
    EXPECT_FALSE(result.message.empty());
    EXPECT_TRUE(orch->terminated());

    RunResult again = orch->run_all(5, 10);
    EXPECT_EQ(again.status, RunStatus::CoherenceBudgetExceeded);
    EXPECT_TRUE(again.records.empty());
    EXPECT_EQ(orch->history().size(), 0u);
}

TEST(CorrectionOrchestrator, MinimumCycleAboveCeilingStopsBeforeFirstCycle) {
    Harness h;
    h.hw.coherence.t1_min = Micros(10000);
    h.hw.coherence.t2_min = Micros(10000);
    h.sched_cfg.initial_delay = Micros(3000);
    h.sched_cfg.min_cycle_time = Micros(2000);
    auto orch = h.make();

    RunResult result = orch->run_all(5, 10);
    EXPECT_EQ(result.status, RunStatus::CoherenceBudgetExceeded);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(h.hw.measure_calls, 0);
}

TEST(CorrectionOrchestrator, UnavailableCoherenceTimesAreFatalAfterRetries) {
    Harness h;
    h.hw.coherence_failures = 100;
    auto orch = h.make();
    EXPECT_THROW(orch->run_all(1, 10), HardwareUnavailable);
    EXPECT_EQ(h.hw.coherence_calls, h.orch_cfg.retry_cap + 1);
}

TEST(CorrectionOrchestrator, ValidatesCapabilitiesAtConstruction) {
    {
        Harness h;
        h.hw.caps.dynamic_circuits = false;
        EXPECT_THROW(h.make(), ConfigError);
    }
    {
        Harness h;
        h.hw.caps.num_qubits = 2;
        EXPECT_THROW(h.make(), ConfigError);
    }
    {
        Harness h;
        h.hw.caps.coupling_map = {{0, 2}, {1, 2}};
        EXPECT_THROW(h.make(), ConfigError);
    }
    {
        Harness h;
        h.hw.caps.coupling_map.clear();  // all-to-all
        EXPECT_NO_THROW(h.make());
    }
    {
        Harness h;
        h.orch_cfg.physical_qubits = {0, 0, 1};
        EXPECT_THROW(h.make(), ConfigError);
    }
}

TEST(CorrectionOrchestrator, RejectsNonPositiveCyclesAndShots) {
    Harness h;
    auto orch = h.make();
    EXPECT_THROW(orch->run(0, 10), ConfigError);
    EXPECT_THROW(orch->run(10, 0), ConfigError);
    EXPECT_EQ(h.hw.coherence_calls, 0);
}

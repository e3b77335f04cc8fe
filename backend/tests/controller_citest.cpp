#include <iostream>
#include "core/CorrectionOrchestrator.hpp"
#include "core/MetricsAggregator.hpp"
#include "core/Recorder.hpp"
#include "core/Serialization.hpp"
#include "simulator/SimulatedRepetitionCode.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>

using namespace qecloop;

int main() {
    std::cout << "CI-less controller tests starting...\n";
    try {
        auto dir = std::filesystem::temp_directory_path() / "qecloop_citest";
        std::filesystem::remove_all(dir);
        setenv("QECLOOP_RECORDINGS_DIR", dir.c_str(), 1);

        SimulatorConfig sim_cfg;
        sim_cfg.flip_probability = {0.0, 0.0, 0.0};
        sim_cfg.correlated_flip_probability = 0.0;
        sim_cfg.readout_error = 0.0;
        sim_cfg.latency_mean = Micros(50);
        sim_cfg.seed = 42;
        SimulatedRepetitionCode hw(sim_cfg);
        hw.inject_error(5, 1);
        hw.inject_error(12, 0);

        SchedulerConfig sched;
        sched.initial_delay = Micros(200);
        OrchestratorConfig orch;
        orch.verbose = false;

        CorrectionOrchestrator controller(hw, ErrorModelConfig{}, sched, orch);
        CycleRecorder recorder("citest", nlohmann::json::object());
        controller.set_cycle_observer([&](const CycleRecord& r) { recorder.append(r); });

        RunResult result = controller.run_all(20, 50);
        if (result.status != RunStatus::Completed) { std::cerr << "run did not complete: " << to_string(result.status) << "\n"; return 2; }
        if (result.records.size() != 20) { std::cerr << "expected 20 records, got " << result.records.size() << "\n"; return 3; }
        if (result.records[5].correction != CorrectionOperator::FlipQubit1) { std::cerr << "cycle 5 not corrected on qubit 1\n"; return 4; }
        if (result.records[12].correction != CorrectionOperator::FlipQubit0) { std::cerr << "cycle 12 not corrected on qubit 0\n"; return 5; }
        if (hw.logical_value() != 0 || hw.data_state() != QubitState{0, 0, 0}) { std::cerr << "data qubits not restored\n"; return 6; }

        auto summary = metrics::summarize(result.records);
        if (summary.logical_error_rate != 0.0 || summary.correction_success_rate != 1.0) {
            std::cerr << "unexpected summary " << nlohmann::json(summary).dump() << "\n";
            return 7;
        }

        auto stopped = recorder.stop(result.status, summary);
        auto loaded = load_recording(stopped.path);
        if (loaded.cycles.size() != 20 || !loaded.footer) { std::cerr << "recording incomplete\n"; return 8; }
        auto replayed = metrics::summarize(loaded.cycles);
        if (replayed.syndrome_reliability != summary.syndrome_reliability) { std::cerr << "replayed summary differs\n"; return 9; }

        std::filesystem::remove_all(dir);
        std::cout << "CI-less tests passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << std::endl;
        return 1;
    }
}

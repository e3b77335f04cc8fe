#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qecloop {

using Micros = std::chrono::microseconds;

inline constexpr int kCodeQubits = 3;
inline constexpr int kStabilizers = 2;
inline constexpr int kSyndromeOutcomes = 4;

/**
 * @brief Outcome of the Z0Z1 (s0) and Z1Z2 (s1) stabilizer measurements of one cycle.
 */
class SyndromeOutcome {
public:
    constexpr SyndromeOutcome() = default;
    constexpr SyndromeOutcome(bool s0, bool s1) : s0_(s0), s1_(s1) {}

    constexpr bool s0() const { return s0_; }
    constexpr bool s1() const { return s1_; }
    /** @brief Number of stabilizers that fired (0, 1 or 2). */
    constexpr int weight() const { return int(s0_) + int(s1_); }
    constexpr bool trivial() const { return !s0_ && !s1_; }
    /** @brief Index into a 4-entry shot histogram: s0 + 2*s1. */
    constexpr int index() const { return int(s0_) + 2 * int(s1_); }

    static constexpr SyndromeOutcome from_index(int i) { return SyndromeOutcome((i & 1) != 0, (i & 2) != 0); }

    constexpr bool operator==(const SyndromeOutcome& o) const { return s0_ == o.s0_ && s1_ == o.s1_; }
    constexpr bool operator!=(const SyndromeOutcome& o) const { return !(*this == o); }

private:
    bool s0_ = false;
    bool s1_ = false;
};

enum class CorrectionOperator : uint8_t {
    Identity,
    FlipQubit0,
    FlipQubit1,
    FlipQubit2
};

std::string to_string(CorrectionOperator op);

/** @brief Classical picture of the three data qubits, one bit each. */
using QubitState = std::array<uint8_t, kCodeQubits>;

/** @brief Hardware indices of the three data qubits, in code order. */
using PhysicalQubits = std::array<int, kCodeQubits>;

using ShotHistogram = std::array<int, kSyndromeOutcomes>;

struct SyndromeReadout {
    SyndromeOutcome outcome;     // majority outcome over all shots
    ShotHistogram shot_counts{}; // indexed by SyndromeOutcome::index()
};

struct CoherenceTimes {
    Micros t1_min{0};
    Micros t2_min{0};
};

/**
 * @brief Static description of a backend, checked once when the controller is built.
 */
struct HardwareCapabilities {
    std::string backend_name;
    int num_qubits = 0;
    bool dynamic_circuits = false;
    // Undirected coupling edges; empty means all-to-all.
    std::vector<std::pair<int, int>> coupling_map;
};

struct ErrorEstimate {
    std::vector<double> qubit_error;   // per code qubit, in [floor, 1]
    std::vector<double> correlation;   // entry i couples qubits i and i+1
};

enum class AdjustDirection : int8_t {
    None = 0,
    Shorten = -1,
    Lengthen = 1
};

struct SchedulerState {
    Micros current_delay{0};
    double syndrome_weight_ema = 0.0;
    double adjustment_factor = 1.0;  // current_delay / initial_delay
    int calm_streak = 0;
    AdjustDirection last_direction = AdjustDirection::None;
    int cycles_since_direction_change = 0;
    int64_t cycles_observed = 0;
};

struct CycleRecord {
    int64_t cycle_index = 0;
    int64_t timestamp_ms = 0;
    std::optional<SyndromeOutcome> syndrome;
    CorrectionOperator correction = CorrectionOperator::Identity;
    Micros wait_before_cycle{0};
    Micros round_trip_latency{0};
    bool success = false;

    int shots = 0;
    ShotHistogram shot_counts{};
    int measurement_attempts = 0;
    double risk = 0.0;
    std::vector<double> qubit_error;
    Micros next_delay{0};
};

enum class RunStatus {
    Running,
    Completed,
    Stopped,
    CoherenceBudgetExceeded
};

std::string to_string(RunStatus status);

} // namespace qecloop

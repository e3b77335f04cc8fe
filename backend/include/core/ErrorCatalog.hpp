#pragma once

#include <string>
#include <string_view>

namespace qecloop::errors {

// 3100-3199: hardware interface faults (transient)
// 3200-3299: decoding
// 3300-3399: scheduling
// 3400-3499: configuration and recording
// 3500-3599: telemetry control channel

inline constexpr int E3100_HARDWARE_UNAVAILABLE = 3100;
inline constexpr int E3110_HARDWARE_TIMEOUT = 3110;
inline constexpr int E3200_INVALID_SYNDROME = 3200;
inline constexpr int E3300_COHERENCE_BUDGET_EXCEEDED = 3300;
inline constexpr int E3400_CONFIG_INVALID = 3400;
inline constexpr int E3410_RECORDING_FAILED = 3410;
inline constexpr int E3500_CONTROL_REJECTED = 3500;

inline constexpr const char* MSG_E3100_PREFIX = "Error 3100: Hardware unavailable: ";
inline constexpr const char* MSG_E3110_PREFIX = "Error 3110: Hardware call timed out: ";
inline constexpr const char* MSG_E3200_PREFIX = "Error 3200: Invalid syndrome: ";
inline constexpr const char* MSG_E3300_PREFIX = "Error 3300: Coherence budget exceeded: ";
inline constexpr const char* MSG_E3400_PREFIX = "Error 3400: Configuration rejected: ";
inline constexpr const char* MSG_E3410_PREFIX = "Error 3410: Recording failed: ";
inline constexpr const char* MSG_E3500_PREFIX = "Error 3500: Control message rejected: ";

// Catalogued details for E3200.
inline constexpr const char* D3200_WRONG_LENGTH = "expected 2 stabilizer bits";
inline constexpr const char* D3200_NOT_BINARY = "stabilizer bit is not 0 or 1";
inline constexpr const char* D3200_BAD_HISTOGRAM = "shot histogram must have 4 entries";

// Catalogued details for E3300.
inline constexpr const char* D3300_DELAY_ABOVE_CEILING = "required delay is above the coherence ceiling";
inline constexpr const char* D3300_MIN_CYCLE_ABOVE_CEILING = "hardware minimum cycle time is above the coherence ceiling";
inline constexpr const char* D3300_INITIAL_DELAY_ABOVE_CEILING = "initial delay is above the coherence ceiling";

// Catalogued details for E3400.
inline constexpr const char* D3400_WATERMARKS = "low water-mark must be below high water-mark";
inline constexpr const char* D3400_WATERMARK_RANGE = "water-marks must lie in [0, 1]";
inline constexpr const char* D3400_ZERO_CYCLES = "num_cycles must be > 0";
inline constexpr const char* D3400_ZERO_SHOTS = "shots_per_cycle must be > 0";
inline constexpr const char* D3400_LEARNING_RATE = "learning_rate must be in (0, 1]";
inline constexpr const char* D3400_FLOOR = "error floor must be in [0, 1)";
inline constexpr const char* D3400_INITIAL_ESTIMATE = "initial estimate must be in [floor, 1]";
inline constexpr const char* D3400_DECAY = "decay rates must be in [0, 1]";
inline constexpr const char* D3400_CORRELATION_STEP = "correlation_step must be in [0, 1]";
inline constexpr const char* D3400_WEIGHTS = "risk weights must be >= 0";
inline constexpr const char* D3400_INITIAL_DELAY = "initial_delay_us must be > 0";
inline constexpr const char* D3400_MIN_CYCLE = "min_cycle_time_us must be > 0 and <= initial_delay_us";
inline constexpr const char* D3400_INCREASE_FACTOR = "increase_factor must be > 1";
inline constexpr const char* D3400_CALM_CYCLES = "calm_cycles_required must be >= 1";
inline constexpr const char* D3400_EMA_ALPHA = "weight_ema_alpha must be in (0, 1]";
inline constexpr const char* D3400_RETRY_CAP = "retry_cap must be >= 0";
inline constexpr const char* D3400_BACKOFF = "backoff values must be >= 0 and backoff_max_us >= backoff_base_us";
inline constexpr const char* D3400_DEADLINE_FRACTION = "deadline_fraction must be in (0, 1]";
inline constexpr const char* D3400_PHYSICAL_QUBITS = "exactly 3 distinct physical qubits required";
inline constexpr const char* D3400_QUBIT_OUT_OF_RANGE = "physical qubit index out of range for backend";
inline constexpr const char* D3400_NO_DYNAMIC_CIRCUITS = "backend lacks dynamic-circuit support";
inline constexpr const char* D3400_NOT_COUPLED = "adjacent code qubits are not coupled on backend";
inline constexpr const char* D3400_COHERENCE_TIMES = "coherence times must be > 0";
inline constexpr const char* D3400_SIMULATOR = "simulator probabilities must be in [0, 1]";
inline constexpr const char* D3400_ENCODED_STATE = "encoded_state must be \"zero\" or \"one\" (bit-flip simulation has no superpositions)";
inline constexpr const char* D3400_SIMULATOR_LATENCY = "simulator latency mean and jitter must be >= 0";
inline constexpr const char* D3400_PARSE = "configuration file could not be parsed";
inline constexpr const char* D3400_OPEN = "configuration file could not be opened";
inline constexpr const char* D3400_SECTION_NOT_OBJECT = "configuration section must be an object";
inline constexpr const char* D3400_COUPLING_ENTRY = "coupling_map entries must be [a, b]";
inline constexpr const char* D3400_ZERO_RUNS = "runs must be > 0";
inline constexpr const char* D3400_BENCHMARK_ERROR_CYCLE = "benchmark error cycle must be within the run";

inline constexpr const char* D3410_OPEN_FILE_FAILED = "failed to open recording file";
inline constexpr const char* D3410_BAD_LINE = "malformed recording line";
inline constexpr const char* D3410_NOT_OBJECT = "line is not a JSON object";
inline constexpr const char* D3410_NO_TYPE = "line has no string \"type\" field";
inline constexpr const char* D3410_MISSING_HEADER = "missing header";
inline constexpr const char* D3410_EMPTY_FILE = "recording has no header";

// Catalogued details for E3500.
inline constexpr const char* D3500_INVALID_REQUEST = "expected {\"cmd\": ...}";
inline constexpr const char* D3500_UNKNOWN_CMD = "unknown cmd";
inline constexpr const char* D3500_PARSE_FAILED = "message is not valid JSON";

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string format(const char* prefix, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace qecloop::errors

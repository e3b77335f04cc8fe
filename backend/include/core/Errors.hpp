#pragma once

#include "core/ErrorCatalog.hpp"
#include "core/Types.hpp"

#include <stdexcept>
#include <string>

namespace qecloop {

/**
 * @brief Base of all errors raised by the controller; carries a catalogue code.
 */
class QecError : public std::runtime_error {
public:
    QecError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {}
    int code() const noexcept { return code_; }

private:
    int code_;
};

/** @brief Transient fault reported by the hardware interface. Retried by the orchestrator. */
class HardwareFault : public QecError {
public:
    using QecError::QecError;
};

class HardwareUnavailable : public HardwareFault {
public:
    explicit HardwareUnavailable(const std::string& detail)
    : HardwareFault(errors::E3100_HARDWARE_UNAVAILABLE, errors::format(errors::MSG_E3100_PREFIX, detail)) {}
};

class HardwareTimeout : public HardwareFault {
public:
    explicit HardwareTimeout(const std::string& detail)
    : HardwareFault(errors::E3110_HARDWARE_TIMEOUT, errors::format(errors::MSG_E3110_PREFIX, detail)) {}
};

class InvalidSyndrome : public QecError {
public:
    explicit InvalidSyndrome(const std::string& detail)
    : QecError(errors::E3200_INVALID_SYNDROME, errors::format(errors::MSG_E3200_PREFIX, detail)) {}
};

class ConfigError : public QecError {
public:
    explicit ConfigError(const std::string& detail)
    : QecError(errors::E3400_CONFIG_INVALID, errors::format(errors::MSG_E3400_PREFIX, detail)) {}
};

class RecordingError : public QecError {
public:
    explicit RecordingError(const std::string& detail)
    : QecError(errors::E3410_RECORDING_FAILED, errors::format(errors::MSG_E3410_PREFIX, detail)) {}
};

/**
 * @brief Fatal: the scheduler can no longer keep cycles inside the coherence window.
 *
 * Carries the last valid scheduler state for diagnosis.
 */
class CoherenceBudgetExceeded : public QecError {
public:
    CoherenceBudgetExceeded(const std::string& detail, const SchedulerState& last_state, Micros ceiling)
    : QecError(errors::E3300_COHERENCE_BUDGET_EXCEEDED, errors::format(errors::MSG_E3300_PREFIX, detail)),
      state_(last_state), ceiling_(ceiling) {}

    const SchedulerState& last_state() const noexcept { return state_; }
    Micros ceiling() const noexcept { return ceiling_; }

private:
    SchedulerState state_;
    Micros ceiling_;
};

} // namespace qecloop

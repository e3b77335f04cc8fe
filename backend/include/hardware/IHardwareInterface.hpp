#pragma once
#include "core/Types.hpp"

#include <string>

namespace qecloop {

/**
 * @brief Narrow boundary to the device that holds the physical qubits.
 *
 * Circuit construction, transpilation and job submission live behind it.
 * Implementations report transient problems by throwing HardwareUnavailable
 * or HardwareTimeout (see core/Errors.hpp); the orchestrator retries those.
 */
class IHardwareInterface {
public:
    virtual ~IHardwareInterface() = default;

    /** @brief Static backend description, checked once when a controller is built. */
    virtual HardwareCapabilities capabilities() const = 0;

    /** @brief Queried once at controller start to seed the scheduler ceiling. */
    virtual CoherenceTimes coherence_times() = 0;

    /**
     * @brief Run one round of stabilizer measurements over `shots` shots.
     *
     * May block. Must give up and throw HardwareTimeout once `deadline` has passed.
     */
    virtual SyndromeReadout measure_syndrome(const PhysicalQubits& qubits, int shots, Micros deadline) = 0;

    /**
     * @brief Apply a correction to the data qubits.
     *
     * Same deadline contract as measure_syndrome.
     */
    virtual void apply_correction(CorrectionOperator op, const PhysicalQubits& qubits, Micros deadline) = 0;
};

} // namespace qecloop

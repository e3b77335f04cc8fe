#pragma once

#include "core/Types.hpp"

#include <vector>

namespace qecloop {

/**
 * @brief Lookup-table decoder for the 3-qubit bit-flip repetition code.
 *
 *   s0 s1 | correction
 *   0  0  | Identity
 *   1  0  | FlipQubit0
 *   1  1  | FlipQubit1
 *   0  1  | FlipQubit2
 *
 * Limitation: the table is only correct when at most one data qubit flipped
 * since the previous cycle. Two flips produce the syndrome of the third qubit
 * and the "correction" completes a logical error. Keeping that assumption true
 * is the job of the cycle scheduler.
 */
namespace decoder {

/** @brief Total over the four outcomes; never fails. */
CorrectionOperator decode(const SyndromeOutcome& outcome) noexcept;

/**
 * @brief Build an outcome from raw stabilizer bits as reported by hardware.
 * @throws InvalidSyndrome when bits is not exactly two 0/1 values.
 */
SyndromeOutcome syndrome_from_bits(const std::vector<int>& bits);

/** @brief Parity syndrome of a data-qubit state. */
SyndromeOutcome syndrome_of(const QubitState& state) noexcept;

/** @brief Flip pattern applied by a correction (all zero for Identity). */
QubitState error_pattern(CorrectionOperator op) noexcept;

/** @brief XOR the correction's flip pattern onto state. Self-inverse. */
QubitState apply(CorrectionOperator op, const QubitState& state) noexcept;

/** @brief Qubit index a correction flips, or -1 for Identity. */
int target_qubit(CorrectionOperator op) noexcept;

/** @brief Logical value of a data state by majority vote. */
int majority(const QubitState& state) noexcept;

} // namespace decoder

} // namespace qecloop

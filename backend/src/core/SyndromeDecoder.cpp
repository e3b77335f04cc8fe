#include "core/SyndromeDecoder.hpp"
#include "core/Errors.hpp"

namespace qecloop::decoder {

CorrectionOperator decode(const SyndromeOutcome& outcome) noexcept {
    if (outcome.s0() && outcome.s1()) return CorrectionOperator::FlipQubit1;
    if (outcome.s0()) return CorrectionOperator::FlipQubit0;
    if (outcome.s1()) return CorrectionOperator::FlipQubit2;
    return CorrectionOperator::Identity;
}

SyndromeOutcome syndrome_from_bits(const std::vector<int>& bits) {
    if (bits.size() != static_cast<size_t>(kStabilizers)) throw InvalidSyndrome(errors::D3200_WRONG_LENGTH);
    for (int b : bits) {
        if (b != 0 && b != 1) throw InvalidSyndrome(errors::D3200_NOT_BINARY);
    }
    return SyndromeOutcome(bits[0] == 1, bits[1] == 1);
}

SyndromeOutcome syndrome_of(const QubitState& state) noexcept {
    return SyndromeOutcome((state[0] ^ state[1]) != 0, (state[1] ^ state[2]) != 0);
}

int target_qubit(CorrectionOperator op) noexcept {
    switch (op) {
    case CorrectionOperator::FlipQubit0: return 0;
    case CorrectionOperator::FlipQubit1: return 1;
    case CorrectionOperator::FlipQubit2: return 2;
    case CorrectionOperator::Identity: break;
    }
    return -1;
}

QubitState error_pattern(CorrectionOperator op) noexcept {
    QubitState pattern{0, 0, 0};
    int q = target_qubit(op);
    if (q >= 0) pattern[q] = 1;
    return pattern;
}

QubitState apply(CorrectionOperator op, const QubitState& state) noexcept {
    QubitState pattern = error_pattern(op);
    QubitState out = state;
    for (int i = 0; i < kCodeQubits; ++i) out[i] = static_cast<uint8_t>((out[i] ^ pattern[i]) & 1);
    return out;
}

int majority(const QubitState& state) noexcept {
    int ones = 0;
    for (auto b : state) ones += (b & 1);
    return ones * 2 > kCodeQubits ? 1 : 0;
}

} // namespace qecloop::decoder

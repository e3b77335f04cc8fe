#include "core/Types.hpp"

namespace qecloop {

std::string to_string(CorrectionOperator op) {
    switch (op) {
    case CorrectionOperator::Identity: return "Identity";
    case CorrectionOperator::FlipQubit0: return "FlipQubit0";
    case CorrectionOperator::FlipQubit1: return "FlipQubit1";
    case CorrectionOperator::FlipQubit2: return "FlipQubit2";
    }
    return "Identity";
}

std::string to_string(RunStatus status) {
    switch (status) {
    case RunStatus::Running: return "running";
    case RunStatus::Completed: return "completed";
    case RunStatus::Stopped: return "stopped";
    case RunStatus::CoherenceBudgetExceeded: return "coherence_budget_exceeded";
    }
    return "running";
}

} // namespace qecloop

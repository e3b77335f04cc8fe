/*
src/core/CycleHistory.cpp
Completed correction cycles, shared between the control loop (writer)
and whatever summarises or publishes them (readers).
*/
#include "core/CycleHistory.hpp"
#include <algorithm>
#include <mutex>

namespace qecloop {

void CycleHistory::append(CycleRecord record) {
    std::unique_lock lock(mu_);
    records_.push_back(std::move(record));
}

std::vector<CycleRecord> CycleHistory::snapshot() const {
    std::shared_lock lock(mu_);
    return records_;
}

std::vector<CycleRecord> CycleHistory::since(int64_t first_index) const {
    std::shared_lock lock(mu_);
    auto begin = std::find_if(records_.begin(), records_.end(),
                              [first_index](const CycleRecord& r) { return r.cycle_index >= first_index; });
    return std::vector<CycleRecord>(begin, records_.end());
}

std::optional<CycleRecord> CycleHistory::last() const {
    std::shared_lock lock(mu_);
    if (records_.empty()) return std::nullopt;
    return records_.back();
}

size_t CycleHistory::size() const {
    std::shared_lock lock(mu_);
    return records_.size();
}

} // namespace qecloop

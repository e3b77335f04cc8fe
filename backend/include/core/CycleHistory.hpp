#pragma once
#include "core/Types.hpp"

#include <optional>
#include <shared_mutex>
#include <vector>

namespace qecloop {

/**
 * @brief Append-only store of completed cycles.
 *
 * Only the orchestrator appends; readers get copies and may run on other threads.
 */
class CycleHistory {
public:
    void append(CycleRecord record);
    std::vector<CycleRecord> snapshot() const;
    /** @brief Records with cycle_index >= first_index. */
    std::vector<CycleRecord> since(int64_t first_index) const;
    std::optional<CycleRecord> last() const;
    size_t size() const;

private:
    mutable std::shared_mutex mu_;
    std::vector<CycleRecord> records_;
};

} // namespace qecloop

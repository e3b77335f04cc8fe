#pragma once
#include "core/Types.hpp"

#include <vector>

namespace qecloop::metrics {

struct Summary {
    double logical_error_rate = 0.0;
    double syndrome_reliability = 1.0;
    double correction_success_rate = 1.0;
    int64_t cycles = 0;
    int64_t failed_cycles = 0;
};

struct MetricStats {
    double mean = 0.0;
    double stddev = 0.0;  // population
    double min = 0.0;
    double max = 0.0;
};

struct RunStatistics {
    int runs = 0;
    MetricStats logical_error_rate;
    MetricStats syndrome_reliability;
    MetricStats correction_success_rate;
};

/**
 * @brief Rates derived purely from completed cycle records.
 *
 * logical_error_rate: a cycle counts as a logical error when more than half of
 * its shots, combined with the correction applied, leave a residual the
 * majority vote reads as a flipped logical value. Failed cycles count as
 * errors because their state was never verified.
 *
 * syndrome_reliability: over consecutive successful cycles, how often the
 * second syndrome matches the first one with its correction applied (what a
 * static error would produce).
 *
 * correction_success_rate: 1 - failed / total.
 */
Summary summarize(const std::vector<CycleRecord>& records);

/** @brief Mean / stddev / min / max of each rate across runs. */
RunStatistics summarize_runs(const std::vector<std::vector<CycleRecord>>& runs);

/** @brief Shots of one cycle whose post-correction state disagrees with the encoded value. */
int disagreeing_shots(const CycleRecord& record);

} // namespace qecloop::metrics

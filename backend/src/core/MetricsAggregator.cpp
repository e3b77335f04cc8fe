#include "core/MetricsAggregator.hpp"
#include "core/SyndromeDecoder.hpp"

#include <algorithm>
#include <cmath>

namespace qecloop::metrics {

int disagreeing_shots(const CycleRecord& record) {
    int disagree = 0;
    for (int i = 0; i < kSyndromeOutcomes; ++i) {
        int count = record.shot_counts[i];
        if (count == 0) continue;
        // Residual = single-error hypothesis of this shot's syndrome, then the correction.
        QubitState hypothesis = decoder::error_pattern(decoder::decode(SyndromeOutcome::from_index(i)));
        QubitState residual = decoder::apply(record.correction, hypothesis);
        if (decoder::majority(residual) != 0) disagree += count;
    }
    return disagree;
}

static bool logical_error(const CycleRecord& r) {
    if (!r.success) return true;
    int total = 0;
    for (int c : r.shot_counts) total += c;
    if (total == 0) return false;
    return 2 * disagreeing_shots(r) > total;
}

Summary summarize(const std::vector<CycleRecord>& records) {
    Summary s;
    s.cycles = (int64_t)records.size();
    if (records.empty()) return s;

    int64_t logical_errors = 0;
    int64_t pairs = 0;
    int64_t agreeing = 0;
    const CycleRecord* prev = nullptr;

    for (const auto& r : records) {
        if (!r.success) s.failed_cycles += 1;
        if (logical_error(r)) logical_errors += 1;

        if (r.success && r.syndrome) {
            if (prev) {
                // A static error leaves behind whatever the previous correction did not cancel.
                QubitState hypothesis = decoder::error_pattern(decoder::decode(*prev->syndrome));
                SyndromeOutcome predicted = decoder::syndrome_of(decoder::apply(prev->correction, hypothesis));
                pairs += 1;
                if (predicted == *r.syndrome) agreeing += 1;
            }
            prev = &r;
        } else {
            prev = nullptr;
        }
    }

    const double n = double(records.size());
    s.logical_error_rate = double(logical_errors) / n;
    s.correction_success_rate = 1.0 - double(s.failed_cycles) / n;
    s.syndrome_reliability = pairs > 0 ? double(agreeing) / double(pairs) : 1.0;
    return s;
}

static MetricStats stats_of(const std::vector<double>& xs) {
    MetricStats st;
    if (xs.empty()) return st;
    double sum = 0.0;
    for (double x : xs) sum += x;
    st.mean = sum / double(xs.size());
    double var = 0.0;
    for (double x : xs) var += (x - st.mean) * (x - st.mean);
    st.stddev = std::sqrt(var / double(xs.size()));
    auto [lo, hi] = std::minmax_element(xs.begin(), xs.end());
    st.min = *lo;
    st.max = *hi;
    return st;
}

RunStatistics summarize_runs(const std::vector<std::vector<CycleRecord>>& runs) {
    std::vector<double> ler, rel, csr;
    for (const auto& run : runs) {
        Summary s = summarize(run);
        ler.push_back(s.logical_error_rate);
        rel.push_back(s.syndrome_reliability);
        csr.push_back(s.correction_success_rate);
    }
    RunStatistics out;
    out.runs = (int)runs.size();
    out.logical_error_rate = stats_of(ler);
    out.syndrome_reliability = stats_of(rel);
    out.correction_success_rate = stats_of(csr);
    return out;
}

} // namespace qecloop::metrics

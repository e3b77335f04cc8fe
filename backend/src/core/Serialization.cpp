#include "core/Serialization.hpp"
#include "core/Errors.hpp"
#include "core/SyndromeDecoder.hpp"

using json = nlohmann::json;

namespace qecloop {

CorrectionOperator correction_from_string(const std::string& s) {
    if (s == "Identity") return CorrectionOperator::Identity;
    if (s == "FlipQubit0") return CorrectionOperator::FlipQubit0;
    if (s == "FlipQubit1") return CorrectionOperator::FlipQubit1;
    if (s == "FlipQubit2") return CorrectionOperator::FlipQubit2;
    throw RecordingError(std::string(errors::D3410_BAD_LINE) + ": unknown correction '" + s + "'");
}

void to_json(json& j, const SyndromeOutcome& s) {
    j = json::array({ int(s.s0()), int(s.s1()) });
}

void from_json(const json& j, SyndromeOutcome& s) {
    // Goes through the decoder's bit check so a malformed entry fails loudly.
    s = decoder::syndrome_from_bits(j.get<std::vector<int>>());
}

void to_json(json& j, const CorrectionOperator& op) {
    j = to_string(op);
}

void from_json(const json& j, CorrectionOperator& op) {
    op = correction_from_string(j.get<std::string>());
}

static const char* direction_name(AdjustDirection d) {
    switch (d) {
    case AdjustDirection::Shorten: return "shorten";
    case AdjustDirection::Lengthen: return "lengthen";
    case AdjustDirection::None: break;
    }
    return "none";
}

void to_json(json& j, const SchedulerState& st) {
    j = {
        {"current_delay_us", st.current_delay.count()},
        {"syndrome_weight_ema", st.syndrome_weight_ema},
        {"adjustment_factor", st.adjustment_factor},
        {"calm_streak", st.calm_streak},
        {"last_direction", direction_name(st.last_direction)},
        {"cycles_since_direction_change", st.cycles_since_direction_change},
        {"cycles_observed", st.cycles_observed}
    };
}

void to_json(json& j, const CycleRecord& r) {
    j = {
        {"cycle_index", r.cycle_index},
        {"ts_ms", r.timestamp_ms},
        {"syndrome", r.syndrome ? json(*r.syndrome) : json(nullptr)},
        {"correction", r.correction},
        {"wait_us", r.wait_before_cycle.count()},
        {"latency_us", r.round_trip_latency.count()},
        {"success", r.success},
        {"shots", r.shots},
        {"shot_counts", r.shot_counts},
        {"attempts", r.measurement_attempts},
        {"risk", r.risk},
        {"qubit_error", r.qubit_error},
        {"next_delay_us", r.next_delay.count()}
    };
}

void from_json(const json& j, CycleRecord& r) {
    r.cycle_index = j.at("cycle_index").get<int64_t>();
    r.timestamp_ms = j.value("ts_ms", (int64_t)0);
    const auto& syn = j.at("syndrome");
    if (syn.is_null()) {
        r.syndrome.reset();
    } else {
        r.syndrome = syn.get<SyndromeOutcome>();
    }
    r.correction = j.at("correction").get<CorrectionOperator>();
    r.wait_before_cycle = Micros(j.value("wait_us", (int64_t)0));
    r.round_trip_latency = Micros(j.value("latency_us", (int64_t)0));
    r.success = j.at("success").get<bool>();
    r.shots = j.value("shots", 0);
    auto counts = j.value("shot_counts", std::vector<int>{});
    r.shot_counts = ShotHistogram{};
    if (!counts.empty()) {
        if (counts.size() != r.shot_counts.size()) throw InvalidSyndrome(errors::D3200_BAD_HISTOGRAM);
        std::copy(counts.begin(), counts.end(), r.shot_counts.begin());
    }
    r.measurement_attempts = j.value("attempts", 0);
    r.risk = j.value("risk", 0.0);
    r.qubit_error = j.value("qubit_error", std::vector<double>{});
    r.next_delay = Micros(j.value("next_delay_us", (int64_t)0));
}

namespace metrics {

void to_json(json& j, const Summary& s) {
    j = {
        {"logical_error_rate", s.logical_error_rate},
        {"syndrome_reliability", s.syndrome_reliability},
        {"correction_success_rate", s.correction_success_rate},
        {"cycles", s.cycles},
        {"failed_cycles", s.failed_cycles}
    };
}

void to_json(json& j, const MetricStats& s) {
    j = { {"mean", s.mean}, {"std", s.stddev}, {"min", s.min}, {"max", s.max} };
}

void to_json(json& j, const RunStatistics& s) {
    j = {
        {"runs", s.runs},
        {"logical_error_rate", s.logical_error_rate},
        {"syndrome_reliability", s.syndrome_reliability},
        {"correction_success_rate", s.correction_success_rate}
    };
}

} // namespace metrics

} // namespace qecloop

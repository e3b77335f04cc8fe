#pragma once
#include "core/MetricsAggregator.hpp"
#include "core/Types.hpp"

#include <nlohmann/json.hpp>

// JSON shapes shared by the recorder, the telemetry server and the CLI.
namespace qecloop {

void to_json(nlohmann::json& j, const SyndromeOutcome& s);
void from_json(const nlohmann::json& j, SyndromeOutcome& s);

void to_json(nlohmann::json& j, const CorrectionOperator& op);
void from_json(const nlohmann::json& j, CorrectionOperator& op);

void to_json(nlohmann::json& j, const SchedulerState& st);

void to_json(nlohmann::json& j, const CycleRecord& r);
void from_json(const nlohmann::json& j, CycleRecord& r);

CorrectionOperator correction_from_string(const std::string& s);

namespace metrics {
void to_json(nlohmann::json& j, const Summary& s);
void to_json(nlohmann::json& j, const MetricStats& s);
void to_json(nlohmann::json& j, const RunStatistics& s);
} // namespace metrics

} // namespace qecloop

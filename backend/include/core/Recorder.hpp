#pragma once

#include "core/MetricsAggregator.hpp"
#include "core/Types.hpp"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace qecloop {

struct RecordingStopResult {
    std::string recording_id;
    std::string path;
    int64_t cycles_written = 0;
    int64_t started_ts_ms = 0;
    int64_t stopped_ts_ms = 0;
};

/** @brief Everything read back from a recording file. */
struct Recording {
    nlohmann::json header;
    std::vector<CycleRecord> cycles;
    std::optional<nlohmann::json> footer;  // absent when the run was cut short
};

/**
 * @brief Writes one JSON-lines file per controller run.
 *
 * Layout: a "qecloop_recording" header line (provenance and the effective
 * configuration), one "cycle" line per completed cycle, and a "stop" footer
 * with the final status and summary. Files go under
 * $QECLOOP_RECORDINGS_DIR (default ./recordings) in a YYYY-MM-DD directory.
 */
class CycleRecorder {
public:
    /** @throws RecordingError when the file cannot be created */
    CycleRecorder(const std::string& file_base, const nlohmann::json& config);
    ~CycleRecorder();

    CycleRecorder(const CycleRecorder&) = delete;
    CycleRecorder& operator=(const CycleRecorder&) = delete;

    /** @brief Safe to call from the cycle observer. */
    void append(const CycleRecord& record);
    /** @brief Writes the footer and closes the file. Later calls return the first result. */
    RecordingStopResult stop(RunStatus status, const metrics::Summary& summary);

    const std::string& path() const { return path_; }
    const std::string& id() const { return id_; }

    static std::string resolve_recordings_dir();

private:
    static std::string random_id();
    static int64_t now_ms();

    std::string id_;
    std::string path_;
    int64_t started_ts_ms_ = 0;

    std::mutex file_m_;
    std::ofstream file_;
    int64_t cycles_written_ = 0;
    bool stopped_ = false;
    RecordingStopResult stop_result_;
};

/** @throws RecordingError on a missing file, a missing header or a malformed line */
Recording load_recording(const std::string& path);

} // namespace qecloop

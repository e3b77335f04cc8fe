#include "core/Recorder.hpp"

#include "core/BuildInfo.hpp"
#include "core/Errors.hpp"
#include "core/Serialization.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

using json = nlohmann::json;

namespace qecloop {

int64_t CycleRecorder::now_ms() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string CycleRecorder::random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(16);
    for (int i = 0; i < 16; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

std::string CycleRecorder::resolve_recordings_dir() {
    const char* env = std::getenv("QECLOOP_RECORDINGS_DIR");
    if (env && *env) return std::string(env);
    return (std::filesystem::current_path() / "recordings").string();
}

CycleRecorder::CycleRecorder(const std::string& file_base, const json& config) {
    id_ = random_id();
    started_ts_ms_ = now_ms();

    std::error_code ec;
    std::filesystem::path dir(resolve_recordings_dir());

    // Place recordings under YYYY-MM-DD/
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream day;
    day << std::setfill('0') << std::setw(4) << (tm.tm_year + 1900) << "-" << std::setw(2) << (tm.tm_mon + 1) << "-" << std::setw(2) << tm.tm_mday;

    std::filesystem::path day_dir = dir / day.str();
    std::filesystem::create_directories(day_dir, ec);
    if (ec) throw RecordingError(std::string(errors::D3410_OPEN_FILE_FAILED) + ": " + day_dir.string() + ": " + ec.message());

    std::string base = file_base;
    for (char& c : base) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.')) c = '_';
    }
    if (base.empty()) base = "run";

    path_ = (day_dir / (base + "_" + id_ + ".jsonl")).string();
    file_.open(path_, std::ios::out | std::ios::trunc);
    if (!file_) throw RecordingError(std::string(errors::D3410_OPEN_FILE_FAILED) + ": " + path_);

    json header = {
        {"type", "qecloop_recording"},
        {"schema_version", 1},
        {"recording_id", id_},
        {"started_ts_ms", started_ts_ms_},
        {"meta", {
            {"git_commit", buildinfo::git_commit()},
            {"build_time", buildinfo::build_time_utc_approx()}
        }},
        {"config", config}
    };
    file_ << header.dump() << "\n";
    file_.flush();
}

CycleRecorder::~CycleRecorder() {
    std::lock_guard<std::mutex> lk(file_m_);
    // A recorder dropped without stop() leaves a footer-less file; load_recording accepts that.
    if (file_.is_open()) file_.close();
}

void CycleRecorder::append(const CycleRecord& record) {
    json line = record;
    line["type"] = "cycle";
    std::lock_guard<std::mutex> lk(file_m_);
    if (stopped_ || !file_) return;
    file_ << line.dump() << "\n";
    cycles_written_ += 1;
}

RecordingStopResult CycleRecorder::stop(RunStatus status, const metrics::Summary& summary) {
    std::lock_guard<std::mutex> lk(file_m_);
    if (stopped_) return stop_result_;
    stopped_ = true;

    stop_result_.recording_id = id_;
    stop_result_.path = path_;
    stop_result_.cycles_written = cycles_written_;
    stop_result_.started_ts_ms = started_ts_ms_;
    stop_result_.stopped_ts_ms = now_ms();

    if (file_) {
        json footer = {
            {"type", "stop"},
            {"recording_id", id_},
            {"stopped_ts_ms", stop_result_.stopped_ts_ms},
            {"cycles_written", cycles_written_},
            {"status", to_string(status)},
            {"summary", summary}
        };
        file_ << footer.dump() << "\n";
        file_.flush();
        file_.close();
    }
    std::cout << "[recorder] wrote " << cycles_written_ << " cycles to " << path_ << std::endl;
    return stop_result_;
}

static RecordingError bad_line(const std::string& where, const std::string& why) {
    return RecordingError(std::string(errors::D3410_BAD_LINE) + " at " + where + ": " + why);
}

Recording load_recording(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw RecordingError(std::string(errors::D3410_OPEN_FILE_FAILED) + ": " + path);

    Recording out;
    bool header_seen = false;
    std::string line;
    int64_t line_no = 0;
    while (std::getline(f, line)) {
        line_no += 1;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        const auto where = path + ":" + std::to_string(line_no);
        try {
            const json j = json::parse(line);
            if (!j.is_object()) throw bad_line(where, errors::D3410_NOT_OBJECT);
            const auto t = j.find("type");
            if (t == j.end() || !t->is_string()) throw bad_line(where, errors::D3410_NO_TYPE);
            const std::string type = t->get<std::string>();

            if (!header_seen) {
                if (type != "qecloop_recording") throw bad_line(where, errors::D3410_MISSING_HEADER);
                out.header = j;
                header_seen = true;
            } else if (type == "cycle") {
                out.cycles.push_back(j.get<CycleRecord>());
            } else if (type == "stop") {
                out.footer = j;
            } else {
                throw bad_line(where, "unknown type '" + type + "'");
            }
        } catch (const RecordingError&) {
            throw;
        } catch (const QecError& e) {
            throw bad_line(where, e.what());
        } catch (const json::exception& e) {
            throw bad_line(where, e.what());
        }
    }
    if (!header_seen) throw RecordingError(std::string(errors::D3410_EMPTY_FILE) + ": " + path);
    return out;
}

} // namespace qecloop

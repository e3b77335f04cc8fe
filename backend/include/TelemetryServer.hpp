#pragma once
#include "core/MetricsAggregator.hpp"
#include "core/Types.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace qecloop {

class CycleHistory;

/**
 * @brief WebSocket feed of a running controller.
 *
 * Every connected client receives {"type":"cycle", ...} for each completed
 * cycle and {"type":"summary", ...} when a run finishes. Clients may send
 * {"cmd":"summary"} or {"cmd":"history","since":N} and get a reply on the
 * same connection.
 */
class TelemetryServer {
public:
    TelemetryServer(int port, const CycleHistory& history);
    ~TelemetryServer();

    void start();
    void stop();

    void publish_cycle(const CycleRecord& record);
    void publish_summary(RunStatus status, const metrics::Summary& summary);

    /** @brief Reply to one control message; unknown commands yield an "error" reply. */
    nlohmann::json handle_control(const nlohmann::json& msg) const;

    size_t client_count() const;

private:
    struct Impl;

    void run_event_loop();
    void broadcast(std::string payload);

    int port_;
    std::atomic<bool> running_{false};
    std::thread event_thread_;
    const CycleHistory& history_;
    std::shared_ptr<Impl> impl_;
};

} // namespace qecloop

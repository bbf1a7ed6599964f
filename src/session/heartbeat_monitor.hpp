#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge::session {

class ConnectionRegistry;

struct HeartbeatReport {
    std::vector<std::string> evicted;       // failed the liveness check
    std::vector<std::string> probed;        // ping delivered
    std::vector<std::string> probe_failed;  // ping send failed, evicted by the send path
};

// Periodically evicts unresponsive connections and pings the rest.
class HeartbeatMonitor {
public:
    HeartbeatMonitor(ConnectionRegistry& registry, std::chrono::milliseconds interval);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void start();
    // Wakes the worker immediately and joins it.
    void stop();
    bool running() const;

    // One evict-then-probe pass. The worker thread calls this every interval.
    HeartbeatReport run_cycle();

    std::uint64_t timeouts_total() const { return timeouts_total_.load(); }
    std::uint64_t cycles_total() const { return cycles_total_.load(); }

private:
    void loop();

    ConnectionRegistry& registry_;
    const std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::thread worker_;

    std::atomic<std::uint64_t> timeouts_total_{0};
    std::atomic<std::uint64_t> cycles_total_{0};
};

}  // namespace toolbridge::session

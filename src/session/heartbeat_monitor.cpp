#include "session/heartbeat_monitor.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/connection_registry.hpp"

namespace toolbridge::session {

HeartbeatMonitor::HeartbeatMonitor(ConnectionRegistry& registry,
                                   const std::chrono::milliseconds interval)
    : registry_(registry), interval_(interval) {}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread(&HeartbeatMonitor::loop, this);
    LOG_INFO("HeartbeatMonitor: started with interval " + std::to_string(interval_.count()) +
             "ms");
}

void HeartbeatMonitor::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    wake_.notify_all();
    worker.join();
    LOG_INFO("HeartbeatMonitor: stopped");
}

bool HeartbeatMonitor::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !stop_requested_;
}

HeartbeatReport HeartbeatMonitor::run_cycle() {
    HeartbeatReport report;
    ++cycles_total_;

    for (const auto& id : registry_.dead_connection_ids()) {
        // disconnect() reports false when another path already removed it.
        if (registry_.disconnect(id, kReasonHeartbeatTimeout)) {
            ++timeouts_total_;
            report.evicted.push_back(id);
            LOG_WARN("HeartbeatMonitor: " + id + " timed out");
        }
    }

    for (const auto& id : registry_.connection_ids()) {
        if (registry_.probe(id)) {
            report.probed.push_back(id);
        } else if (!registry_.find(id)) {
            report.probe_failed.push_back(id);
        }
    }

    LOG_DEBUG("HeartbeatMonitor: cycle probed " + std::to_string(report.probed.size()) +
              ", evicted " + std::to_string(report.evicted.size()));
    return report;
}

void HeartbeatMonitor::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            run_cycle();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("HeartbeatMonitor: cycle failed: ") + e.what());
        }
        lock.lock();
    }
}

}  // namespace toolbridge::session

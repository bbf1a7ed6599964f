#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/gateway_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::session {

// Transport seam for one duplex peer. Implementations need not be thread-safe;
// Connection serializes every call.
class DuplexChannel {
public:
    virtual ~DuplexChannel() = default;

    // Returns the number of bytes written.
    virtual core::errors::Result<std::size_t> send_text(const std::string& text) = 0;
    virtual void close() = 0;
    virtual std::string peer_address() const = 0;
};

using SteadyTime = std::chrono::steady_clock::time_point;

// One live duplex session. Only ConnectionRegistry mutates it.
class Connection {
public:
    Connection(std::string id, std::shared_ptr<DuplexChannel> channel, SteadyTime created_at);
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& id() const { return id_; }
    std::string peer_address() const;
    SteadyTime created_at() const { return created_at_; }
    double created_unix() const { return created_unix_; }

    std::optional<SteadyTime> last_ping_sent() const;
    std::optional<SteadyTime> last_pong_received() const;
    std::uint64_t message_count() const { return message_count_.load(); }
    nlohmann::json metadata() const;

    bool is_alive(SteadyTime now, std::chrono::milliseconds timeout,
                  core::config::LivenessPolicy policy) const;

private:
    friend class ConnectionRegistry;

    core::errors::Result<std::size_t> deliver(const std::string& text);
    void close_channel();
    void mark_ping_sent(SteadyTime at);
    void mark_pong_received(SteadyTime at);
    void merge_metadata(const nlohmann::json& patch);

    const std::string id_;
    const std::shared_ptr<DuplexChannel> channel_;
    const SteadyTime created_at_;
    const double created_unix_;

    std::mutex send_mutex_;
    bool channel_closed_ = false;  // guarded by send_mutex_

    mutable std::mutex state_mutex_;
    std::optional<SteadyTime> last_ping_sent_;
    std::optional<SteadyTime> first_unanswered_ping_;
    std::optional<SteadyTime> last_pong_received_;
    nlohmann::json metadata_ = nlohmann::json::object();

    std::atomic<std::uint64_t> message_count_{0};
};

}  // namespace toolbridge::session

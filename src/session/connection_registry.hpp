#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/gateway_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "protocol/message_contract.hpp"
#include "session/connection.hpp"

namespace toolbridge::session {

inline constexpr const char* kReasonReplaced = "replaced by new connection";
inline constexpr const char* kReasonSendFailure = "send failure";
inline constexpr const char* kReasonHeartbeatTimeout = "heartbeat timeout";
inline constexpr const char* kReasonShutdown = "server shutdown";
inline constexpr const char* kReasonClientClosed = "client disconnected";

struct RegistryOptions {
    std::size_t max_connections = 100;
    std::chrono::milliseconds heartbeat_timeout{60000};
    core::config::LivenessPolicy liveness = core::config::LivenessPolicy::UnansweredPing;
    std::string server_name = "toolbridge";
    std::string server_version = "1.0.0";
};

struct RegistryStats {
    std::size_t total_connections = 0;
    std::size_t max_connections = 0;
    std::uint64_t total_messages = 0;
    std::size_t alive_connections = 0;
    std::size_t dead_connections = 0;
};

struct BroadcastReport {
    std::vector<std::string> delivered;
    std::vector<std::string> failed;
};

// Receives the instance that went away. After a duplicate-id accept its id
// already belongs to the replacement, so compare instances, not ids.
using DisconnectListener =
    std::function<void(const std::shared_ptr<Connection>& connection, const std::string& reason)>;
using SteadyClock = std::function<SteadyTime()>;

nlohmann::json to_json(const RegistryStats& stats);

class ConnectionRegistry {
public:
    explicit ConnectionRegistry(RegistryOptions options = {}, SteadyClock clock = nullptr);
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Registers the channel and sends the welcome message. A colliding
    // proposed id evicts the previous holder.
    core::errors::Result<std::shared_ptr<Connection>> accept(
        std::shared_ptr<DuplexChannel> channel,
        const std::optional<std::string>& proposed_id = std::nullopt);

    // Idempotent. Returns false when the id was not registered.
    bool disconnect(const std::string& id, const std::string& reason);

    // Disconnects only if `connection` is still the registered holder of its id.
    bool release(const std::shared_ptr<Connection>& connection, const std::string& reason);

    // Fail-fast: a transport failure disconnects the peer. Never retried.
    bool send(const std::string& id, const protocol::Envelope& envelope);
    BroadcastReport broadcast(const protocol::Envelope& envelope,
                              const std::vector<std::string>& exclude_ids = {});

    // Heartbeat entry points.
    bool probe(const std::string& id);
    bool record_pong(const std::string& id);
    std::vector<std::string> dead_connection_ids() const;

    bool update_metadata(const std::string& id, const nlohmann::json& patch);

    RegistryStats stats() const;
    nlohmann::json connections_info() const;
    std::vector<std::string> connection_ids() const;
    std::shared_ptr<Connection> find(const std::string& id) const;
    bool is_alive(const std::string& id) const;
    std::size_t size() const;

    void set_disconnect_listener(DisconnectListener listener);

    // Rejects further accepts and disconnects everyone.
    void shutdown();
    bool closed() const;

    const RegistryOptions& options() const { return options_; }

private:
    std::vector<std::shared_ptr<Connection>> snapshot() const;
    std::string next_generated_id(const std::string& peer);
    void finish_disconnect(const std::shared_ptr<Connection>& connection,
                           const std::string& reason);
    bool deliver(const std::shared_ptr<Connection>& connection,
                 const protocol::Envelope& envelope);
    nlohmann::json welcome_data(const std::string& id) const;

    const RegistryOptions options_;
    const SteadyClock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
    bool closed_ = false;
    long long last_generated_millis_ = 0;

    std::mutex listener_mutex_;
    DisconnectListener listener_;
};

}  // namespace toolbridge::session

#include "session/connection_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::MessageKind;
namespace codes = core::errors::codes;

namespace {

double to_unix(const Connection& connection, const SteadyTime at) {
    return connection.created_unix() +
           std::chrono::duration<double>(at - connection.created_at()).count();
}

json optional_unix(const Connection& connection, const std::optional<SteadyTime>& at) {
    return at.has_value() ? json(to_unix(connection, at.value())) : json(nullptr);
}

}  // namespace

json to_json(const RegistryStats& stats) {
    json payload;
    payload["total_connections"] = stats.total_connections;
    payload["alive_connections"] = stats.alive_connections;
    payload["dead_connections"] = stats.dead_connections;
    payload["max_connections"] = stats.max_connections;
    payload["total_messages"] = stats.total_messages;
    return payload;
}

ConnectionRegistry::ConnectionRegistry(RegistryOptions options, SteadyClock clock)
    : options_(std::move(options)),
      clock_(clock ? std::move(clock)
                   : SteadyClock([] { return std::chrono::steady_clock::now(); })) {}

std::string ConnectionRegistry::next_generated_id(const std::string& peer) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    // Two accepts in the same millisecond must not collide.
    last_generated_millis_ = std::max<long long>(now, last_generated_millis_ + 1);
    return (peer.empty() ? std::string("unknown") : peer) + "_" +
           std::to_string(last_generated_millis_);
}

json ConnectionRegistry::welcome_data(const std::string& id) const {
    json data;
    data["message"] = "Connected to " + options_.server_name +
                      ". Tools and chat are available on this connection.";
    data["client_id"] = id;
    data["server_info"] = json{{"name", options_.server_name},
                               {"version", options_.server_version},
                               {"capabilities", json::array({"tools", "chat", "websocket"})}};
    return data;
}

core::errors::Result<std::shared_ptr<Connection>> ConnectionRegistry::accept(
    std::shared_ptr<DuplexChannel> channel, const std::optional<std::string>& proposed_id) {
    if (!channel) {
        return BridgeError{ErrorCategory::Internal, "Cannot accept a connection without a channel",
                           codes::kTransportFailure};
    }
    const std::string peer = channel->peer_address();

    std::shared_ptr<Connection> connection;
    std::shared_ptr<Connection> replaced;
    std::size_t live_count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return BridgeError{ErrorCategory::Transport, "Connection registry is shut down",
                               codes::kRegistryClosed};
        }
        if (connections_.size() >= options_.max_connections) {
            LOG_WARN("ConnectionRegistry: rejecting " + peer + ", limit of " +
                     std::to_string(options_.max_connections) + " connections reached");
            return BridgeError{ErrorCategory::Transport,
                               "Connection limit exceeded: " +
                                   std::to_string(options_.max_connections),
                               codes::kCapacityExceeded,
                               "Retry after another client disconnects"};
        }

        const std::string id = proposed_id.has_value() && !proposed_id->empty()
                                   ? proposed_id.value()
                                   : next_generated_id(peer);
        connection = std::make_shared<Connection>(id, std::move(channel), clock_());
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            replaced = std::move(it->second);
            it->second = connection;
        } else {
            connections_.emplace(id, connection);
        }
        live_count = connections_.size();
    }

    const std::string& id = connection->id();
    LOG_INFO("ConnectionRegistry: accepted " + id + " from " + peer + ", live connections: " +
             std::to_string(live_count));
    if (replaced) {
        LOG_WARN("ConnectionRegistry: id " + id + " already in use, evicting previous holder");
        finish_disconnect(replaced, kReasonReplaced);
    }

    if (!deliver(connection, protocol::make_envelope(MessageKind::System, welcome_data(id)))) {
        return BridgeError{ErrorCategory::Transport, "Failed to send welcome message to " + id,
                           codes::kTransportFailure};
    }
    return connection;
}

bool ConnectionRegistry::disconnect(const std::string& id, const std::string& reason) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            connection = std::move(it->second);
            connections_.erase(it);
        }
    }
    if (!connection) {
        LOG_WARN("ConnectionRegistry: disconnect requested for unknown connection " + id);
        return false;
    }
    finish_disconnect(connection, reason);
    return true;
}

bool ConnectionRegistry::release(const std::shared_ptr<Connection>& connection,
                                 const std::string& reason) {
    if (!connection) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(connection->id());
        if (it == connections_.end() || it->second != connection) {
            return false;
        }
        connections_.erase(it);
    }
    finish_disconnect(connection, reason);
    return true;
}

void ConnectionRegistry::finish_disconnect(const std::shared_ptr<Connection>& connection,
                                           const std::string& reason) {
    json data;
    data["message"] = "Connection closing: " + reason;
    data["reason"] = reason;
    auto notice = connection->deliver(
        protocol::encode(protocol::make_envelope(MessageKind::System, std::move(data))));
    if (core::errors::is_error(notice)) {
        LOG_DEBUG("ConnectionRegistry: closing notice to " + connection->id() +
                  " not delivered: " + core::errors::get_error(notice).message);
    }
    connection->close_channel();
    LOG_INFO("ConnectionRegistry: disconnected " + connection->id() + " (" + reason +
             "), live connections: " + std::to_string(size()));

    DisconnectListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(connection, reason);
    }
}

bool ConnectionRegistry::deliver(const std::shared_ptr<Connection>& connection,
                                 const protocol::Envelope& envelope) {
    auto written = connection->deliver(protocol::encode(envelope));
    if (!core::errors::is_error(written)) {
        return true;
    }
    LOG_WARN("ConnectionRegistry: send of " + protocol::to_string(envelope.kind) + " to " +
             connection->id() + " failed: " + core::errors::get_error(written).message);
    release(connection, kReasonSendFailure);
    return false;
}

bool ConnectionRegistry::send(const std::string& id, const protocol::Envelope& envelope) {
    const auto connection = find(id);
    if (!connection) {
        LOG_WARN("ConnectionRegistry: cannot send " + protocol::to_string(envelope.kind) +
                 " to unknown connection " + id);
        return false;
    }
    return deliver(connection, envelope);
}

BroadcastReport ConnectionRegistry::broadcast(const protocol::Envelope& envelope,
                                              const std::vector<std::string>& exclude_ids) {
    BroadcastReport report;
    std::vector<std::shared_ptr<Connection>> failed;
    const std::string text = protocol::encode(envelope);

    for (const auto& connection : snapshot()) {
        if (std::find(exclude_ids.begin(), exclude_ids.end(), connection->id()) !=
            exclude_ids.end()) {
            continue;
        }
        auto written = connection->deliver(text);
        if (core::errors::is_error(written)) {
            LOG_WARN("ConnectionRegistry: broadcast to " + connection->id() + " failed: " +
                     core::errors::get_error(written).message);
            report.failed.push_back(connection->id());
            failed.push_back(connection);
        } else {
            report.delivered.push_back(connection->id());
        }
    }

    for (const auto& connection : failed) {
        release(connection, kReasonSendFailure);
    }
    return report;
}

bool ConnectionRegistry::probe(const std::string& id) {
    const auto connection = find(id);
    if (!connection) {
        return false;
    }
    // Marked before sending so a fast pong can never precede it.
    connection->mark_ping_sent(clock_());
    return deliver(connection, protocol::make_envelope(MessageKind::Ping));
}

bool ConnectionRegistry::record_pong(const std::string& id) {
    const auto connection = find(id);
    if (!connection) {
        return false;
    }
    connection->mark_pong_received(clock_());
    return true;
}

std::vector<std::string> ConnectionRegistry::dead_connection_ids() const {
    const SteadyTime now = clock_();
    std::vector<std::string> dead;
    for (const auto& connection : snapshot()) {
        if (!connection->is_alive(now, options_.heartbeat_timeout, options_.liveness)) {
            dead.push_back(connection->id());
        }
    }
    return dead;
}

bool ConnectionRegistry::update_metadata(const std::string& id, const json& patch) {
    const auto connection = find(id);
    if (!connection) {
        LOG_WARN("ConnectionRegistry: cannot update metadata of unknown connection " + id);
        return false;
    }
    connection->merge_metadata(patch);
    return true;
}

RegistryStats ConnectionRegistry::stats() const {
    const SteadyTime now = clock_();
    RegistryStats stats;
    stats.max_connections = options_.max_connections;
    for (const auto& connection : snapshot()) {
        ++stats.total_connections;
        stats.total_messages += connection->message_count();
        if (connection->is_alive(now, options_.heartbeat_timeout, options_.liveness)) {
            ++stats.alive_connections;
        } else {
            ++stats.dead_connections;
        }
    }
    return stats;
}

json ConnectionRegistry::connections_info() const {
    const SteadyTime now = clock_();
    json info = json::array();
    for (const auto& connection : snapshot()) {
        json entry;
        entry["client_id"] = connection->id();
        entry["peer_address"] = connection->peer_address();
        entry["connected_at"] = connection->created_unix();
        entry["uptime"] = std::chrono::duration<double>(now - connection->created_at()).count();
        entry["message_count"] = connection->message_count();
        entry["last_ping"] = optional_unix(*connection, connection->last_ping_sent());
        entry["last_pong"] = optional_unix(*connection, connection->last_pong_received());
        entry["is_alive"] =
            connection->is_alive(now, options_.heartbeat_timeout, options_.liveness);
        entry["metadata"] = connection->metadata();
        info.push_back(std::move(entry));
    }
    return info;
}

std::vector<std::string> ConnectionRegistry::connection_ids() const {
    std::vector<std::string> ids;
    for (const auto& connection : snapshot()) {
        ids.push_back(connection->id());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::shared_ptr<Connection> ConnectionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second;
}

bool ConnectionRegistry::is_alive(const std::string& id) const {
    const auto connection = find(id);
    return connection &&
           connection->is_alive(clock_(), options_.heartbeat_timeout, options_.liveness);
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::set_disconnect_listener(DisconnectListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ConnectionRegistry::shutdown() {
    std::vector<std::shared_ptr<Connection>> detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        for (auto& [id, connection] : connections_) {
            detached.push_back(std::move(connection));
        }
        connections_.clear();
    }
    LOG_INFO("ConnectionRegistry: shutting down, closing " + std::to_string(detached.size()) +
             " connection(s)");
    for (const auto& connection : detached) {
        finish_disconnect(connection, kReasonShutdown);
    }
}

bool ConnectionRegistry::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Connection>> connections;
    connections.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        connections.push_back(connection);
    }
    return connections;
}

}  // namespace toolbridge::session

#include "session/connection.hpp"

#include <utility>
#include "protocol/message_contract.hpp"

namespace toolbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using core::config::LivenessPolicy;
namespace codes = core::errors::codes;

Connection::Connection(std::string id, std::shared_ptr<DuplexChannel> channel,
                       const SteadyTime created_at)
    : id_(std::move(id)),
      channel_(std::move(channel)),
      created_at_(created_at),
      created_unix_(protocol::unix_timestamp_now()) {}

std::string Connection::peer_address() const {
    return channel_ ? channel_->peer_address() : "unknown";
}

std::optional<SteadyTime> Connection::last_ping_sent() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_ping_sent_;
}

std::optional<SteadyTime> Connection::last_pong_received() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_pong_received_;
}

nlohmann::json Connection::metadata() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return metadata_;
}

bool Connection::is_alive(const SteadyTime now, const std::chrono::milliseconds timeout,
                          const LivenessPolicy policy) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto& reference =
        policy == LivenessPolicy::LastPingWindow ? last_ping_sent_ : first_unanswered_ping_;
    if (!reference.has_value()) {
        return true;
    }
    return now - reference.value() < timeout;
}

core::errors::Result<std::size_t> Connection::deliver(const std::string& text) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (channel_closed_ || !channel_) {
        return BridgeError{ErrorCategory::Transport, "Connection " + id_ + " is closed",
                           codes::kTransportFailure};
    }
    auto written = channel_->send_text(text);
    if (!core::errors::is_error(written)) {
        ++message_count_;
    }
    return written;
}

void Connection::close_channel() {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (channel_closed_) {
        return;
    }
    channel_closed_ = true;
    if (channel_) {
        channel_->close();
    }
}

void Connection::mark_ping_sent(const SteadyTime at) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_ping_sent_ = at;
    if (!first_unanswered_ping_.has_value()) {
        first_unanswered_ping_ = at;
    }
}

void Connection::mark_pong_received(const SteadyTime at) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_pong_received_ = at;
    first_unanswered_ping_.reset();
}

void Connection::merge_metadata(const nlohmann::json& patch) {
    if (!patch.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& [key, value] : patch.items()) {
        metadata_[key] = value;
    }
}

}  // namespace toolbridge::session

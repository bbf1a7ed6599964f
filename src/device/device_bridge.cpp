#include "device/device_bridge.hpp"

#include <chrono>
#include <cstddef>
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "core/logging/logger.hpp"

namespace toolbridge::device {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

json build_command_payload(const std::string& command, const json& args,
                           const long long timestamp) {
    json payload;
    payload["command"] = command;
    payload["args"] = args.is_object() ? args : json::object();
    payload["timestamp"] = timestamp;
    return payload;
}

core::errors::Result<DeviceReply> parse_device_reply(const unsigned status,
                                                     const std::string& body) {
    if (status != 200) {
        return DeviceReply{false, "Device responded with HTTP " + std::to_string(status),
                           json::object()};
    }

    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return BridgeError{ErrorCategory::Transport, "Device returned a malformed reply",
                           codes::kDeviceUnreachable};
    }

    DeviceReply reply;
    reply.success = parsed.value("success", false);
    reply.message = parsed.value("message", std::string());
    const auto data_it = parsed.find("data");
    if (data_it != parsed.end() && !data_it->is_null()) {
        reply.data = *data_it;
    }
    return reply;
}

HttpDeviceBridge::HttpDeviceBridge(core::config::DeviceConfig config)
    : config_(std::move(config)) {}

std::string HttpDeviceBridge::endpoint() const {
    return "http://" + config_.host + ":" + std::to_string(config_.port) + kCommandPath;
}

core::errors::Result<DeviceReply> HttpDeviceBridge::forward(const std::string& command,
                                                            const json& args) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const json payload = build_command_payload(
        command, args, std::chrono::duration_cast<std::chrono::seconds>(now).count());
    LOG_INFO("Forwarding device command " + command + " to " + endpoint());

    http::request<http::string_body> request{http::verb::post, kCommandPath, 11};
    request.set(http::field::host, config_.host + ":" + std::to_string(config_.port));
    request.set(http::field::user_agent, "toolbridge");
    request.set(http::field::content_type, "application/json");
    request.body() = payload.dump();
    request.prepare_payload();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::error_code failure;

    // tcp_stream timeouts only apply to asynchronous operations.
    stream.expires_after(config_.timeout);
    resolver.async_resolve(
        config_.host, std::to_string(config_.port),
        [&](const beast::error_code& resolve_ec, const tcp::resolver::results_type& results) {
            if (resolve_ec) {
                failure = resolve_ec;
                return;
            }
            stream.async_connect(results, [&](const beast::error_code& connect_ec,
                                              const tcp::endpoint&) {
                if (connect_ec) {
                    failure = connect_ec;
                    return;
                }
                http::async_write(stream, request, [&](const beast::error_code& write_ec,
                                                       std::size_t) {
                    if (write_ec) {
                        failure = write_ec;
                        return;
                    }
                    http::async_read(stream, buffer, response,
                                     [&](const beast::error_code& read_ec, std::size_t) {
                                         failure = read_ec;
                                     });
                });
            });
        });
    ioc.run();

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (failure) {
        const std::string reason = failure == beast::error::timeout
                                       ? "no response within " +
                                             std::to_string(config_.timeout.count()) + "ms"
                                       : failure.message();
        LOG_ERROR("Device command " + command + " failed: " + reason);
        return BridgeError{ErrorCategory::Transport,
                           "Unable to reach device at " + endpoint() + ": " + reason,
                           codes::kDeviceUnreachable,
                           "Check that the device is on the network and its server is running"};
    }

    auto reply = parse_device_reply(response.result_int(), response.body());
    if (!core::errors::is_error(reply)) {
        const auto& value = core::errors::get_value(reply);
        if (value.success) {
            LOG_INFO("Device accepted " + command + ": " + value.message);
        } else {
            LOG_WARN("Device rejected " + command + ": " + value.message);
        }
    }
    return reply;
}

}  // namespace toolbridge::device

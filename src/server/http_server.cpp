#include "server/http_server.hpp"

#include <exception>
#include <memory>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/gateway.hpp"
#include "server/websocket_channel.hpp"

namespace toolbridge::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

constexpr const char* kWebSocketPath = "/ws";

std::string peer_of(const tcp::socket& socket) {
    beast::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    return ec ? std::string("unknown") : endpoint.address().to_string();
}

std::string target_of(const HttpRequest& request) {
    const auto target = request.target();
    return std::string(target.data(), target.size());
}

std::string path_of(const std::string& target) {
    return target.substr(0, target.find('?'));
}

HttpResponse json_response(const HttpRequest& request, const http::status status,
                           const json& body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, runtime::kServerName);
    response.set(http::field::content_type, "application/json");
    response.keep_alive(false);
    response.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    response.prepare_payload();
    return response;
}

json error_body(const std::string& message, const std::string& code) {
    return json{{"success", false}, {"error", message}, {"error_code", code}};
}

}  // namespace

std::optional<std::string> client_id_from_target(const std::string& target) {
    const auto query_start = target.find('?');
    if (query_start == std::string::npos) {
        return std::nullopt;
    }
    const std::string query = target.substr(query_start + 1);
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string pair = query.substr(pos, end - pos);
        const auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == "client_id") {
            const std::string value = pair.substr(eq + 1);
            if (!value.empty()) {
                return value;
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

HttpServer::HttpServer(runtime::Gateway& gateway, core::config::ListenConfig listen)
    : gateway_(gateway),
      listen_(std::move(listen)),
      work_(net::make_work_guard(ioc_)),
      acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

core::errors::Result<std::uint16_t> HttpServer::start() {
    beast::error_code ec;
    const auto address = net::ip::make_address(listen_.host, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Input, "Invalid listen address: " + listen_.host,
                           codes::kInvalidConfig};
    }
    const tcp::endpoint endpoint(address, listen_.port);
    const std::string where = listen_.host + ":" + std::to_string(listen_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return BridgeError{ErrorCategory::Transport,
                           "Failed to listen on " + where + ": " + ec.message(),
                           codes::kTransportFailure};
    }
    const std::uint16_t bound_port = acceptor_.local_endpoint(ec).port();

    running_ = true;
    do_accept();
    accept_thread_ = std::thread([this] { ioc_.run(); });
    LOG_INFO("HttpServer: listening on " + listen_.host + ":" + std::to_string(bound_port));
    return bound_port;
}

void HttpServer::stop() {
    if (running_.exchange(false)) {
        net::post(ioc_, [this] {
            beast::error_code ec;
            acceptor_.close(ec);
        });
    }

    {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        for (auto* socket : open_sockets_) {
            beast::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
        for (const auto& channel : open_channels_) {
            channel->close();
        }
        // WebSocket sessions finish through the io_context, so it keeps running until then.
        sessions_done_.wait(lock, [this] { return active_sessions_ == 0; });
    }

    work_.reset();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
        if (!running_.load()) {
            return;
        }
        if (ec) {
            LOG_WARN("HttpServer: accept failed: " + ec.message());
        } else {
            spawn_session(std::move(socket));
        }
        do_accept();
    });
}

void HttpServer::spawn_session(tcp::socket socket) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        ++active_sessions_;
    }
    auto holder = std::make_unique<tcp::socket>(std::move(socket));
    std::thread([this, holder = std::move(holder)]() mutable {
        try {
            run_session(std::move(*holder));
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("HttpServer: session failed: ") + e.what());
        }
        // The socket must be gone before stop() can observe zero sessions.
        holder.reset();
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        --active_sessions_;
        sessions_done_.notify_all();
    }).detach();
}

void HttpServer::track(tcp::socket* socket) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    open_sockets_.insert(socket);
    if (!running_.load()) {
        beast::error_code ec;
        socket->shutdown(tcp::socket::shutdown_both, ec);
    }
}

void HttpServer::untrack(tcp::socket* socket) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    open_sockets_.erase(socket);
}

void HttpServer::track(const std::shared_ptr<WebSocketChannel>& channel) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    open_channels_.insert(channel);
    if (!running_.load()) {
        channel->close();
    }
}

void HttpServer::untrack(const std::shared_ptr<WebSocketChannel>& channel) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    open_channels_.erase(channel);
}

void HttpServer::run_session(tcp::socket socket) {
    track(&socket);
    beast::flat_buffer buffer;
    HttpRequest request;
    beast::error_code ec;
    http::read(socket, buffer, request, ec);
    if (ec) {
        untrack(&socket);
        if (ec != http::error::end_of_stream) {
            LOG_DEBUG("HttpServer: read from " + peer_of(socket) + " failed: " + ec.message());
        }
        return;
    }

    if (websocket::is_upgrade(request) && path_of(target_of(request)) == kWebSocketPath) {
        untrack(&socket);
        run_websocket(std::move(socket), std::move(request));
        return;
    }

    const HttpResponse response = handle_request(request);
    http::write(socket, response, ec);
    if (ec) {
        LOG_DEBUG("HttpServer: write to " + peer_of(socket) + " failed: " + ec.message());
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
    untrack(&socket);
}

void HttpServer::run_websocket(tcp::socket socket, HttpRequest request) {
    const std::string peer = peer_of(socket);
    auto channel = std::make_shared<WebSocketChannel>(std::move(socket), peer, listen_.send_timeout);
    track(channel);

    auto upgraded = channel->handshake(request, runtime::kServerName);
    if (core::errors::is_error(upgraded)) {
        LOG_WARN("HttpServer: " + core::errors::get_error(upgraded).message);
        channel->close();
        untrack(channel);
        return;
    }

    auto& connections = gateway_.connections();
    auto accepted = connections.accept(channel, client_id_from_target(target_of(request)));
    if (core::errors::is_error(accepted)) {
        const auto& error = core::errors::get_error(accepted);
        LOG_WARN("HttpServer: refused WebSocket from " + peer + ": " + error.message);
        if (error.code != codes::kTransportFailure) {
            auto notified = channel->send_text(
                protocol::encode(protocol::make_error_envelope(error.message, error.code)));
            if (core::errors::is_error(notified)) {
                LOG_DEBUG("HttpServer: " + core::errors::get_error(notified).message);
            }
        }
        channel->close();
        untrack(channel);
        return;
    }

    const auto connection = core::errors::get_value(accepted);
    while (true) {
        auto frame = channel->read_text();
        if (core::errors::is_error(frame)) {
            LOG_INFO("HttpServer: " + connection->id() + ": " +
                     core::errors::get_error(frame).message);
            break;
        }
        gateway_.router().handle(connection->id(), core::errors::get_value(frame));
    }

    connections.release(connection, session::kReasonClientClosed);
    channel->close();
    untrack(channel);
}

HttpResponse HttpServer::handle_request(const HttpRequest& request) {
    const std::string path = path_of(target_of(request));
    const bool is_get = request.method() == http::verb::get;
    const bool is_post = request.method() == http::verb::post;

    if (path == "/" && is_get) {
        return json_response(request, http::status::ok, gateway_.server_info());
    }
    if (path == "/health" && is_get) {
        return json_response(request, http::status::ok, gateway_.health());
    }
    if (path == "/tools" && is_get) {
        json catalog = json::array();
        for (const auto& descriptor : gateway_.tools().list()) {
            catalog.push_back(protocol::to_json(descriptor));
        }
        const std::size_t count = catalog.size();
        return json_response(request, http::status::ok,
                             json{{"tools", std::move(catalog)}, {"count", count}});
    }
    if (path == "/tools/call" && is_post) {
        const json body = json::parse(request.body(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            return json_response(request, http::status::bad_request,
                                 error_body("Invalid JSON format", codes::kInvalidJson));
        }
        const auto name_it = body.find("name");
        if (name_it == body.end() || !name_it->is_string()) {
            return json_response(request, http::status::bad_request,
                                 error_body("Field 'name' is required", codes::kMissingArgument));
        }
        const auto args_it = body.find("arguments");
        const json arguments =
            args_it != body.end() && args_it->is_object() ? *args_it : json::object();
        const auto outcome = gateway_.tools().invoke(name_it->get<std::string>(), arguments);
        return json_response(request, http::status::ok, protocol::to_json(outcome));
    }
    if (path == "/tools/stats" && is_get) {
        json stats = json::object();
        for (const auto& [name, tool_stats] : gateway_.tools().all_stats()) {
            stats[name] = protocol::to_json(tool_stats);
        }
        return json_response(request, http::status::ok, json{{"tools", std::move(stats)}});
    }
    if (path == "/connections" && is_get) {
        auto& connections = gateway_.connections();
        json body;
        body["stats"] = session::to_json(connections.stats());
        body["connections"] = connections.connections_info();
        return json_response(request, http::status::ok, body);
    }

    if (path == "/" || path == "/health" || path == "/tools" || path == "/tools/call" ||
        path == "/tools/stats" || path == "/connections" || path == kWebSocketPath) {
        return json_response(request, http::status::method_not_allowed,
                             error_body("Method not allowed on " + path, "method_not_allowed"));
    }
    return json_response(request, http::status::not_found,
                         error_body("Not found: " + path, "not_found"));
}

}  // namespace toolbridge::server

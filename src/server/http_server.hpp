#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <memory>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include "core/config/gateway_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::runtime {
class Gateway;
}

namespace toolbridge::server {

class WebSocketChannel;

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// "?client_id=abc" on the upgrade target proposes the connection identity.
std::optional<std::string> client_id_from_target(const std::string& target);

// Request/response routes plus the /ws upgrade, one thread per accepted socket.
// WebSocket I/O itself runs on the io_context thread; session threads only
// wait on it and run the message handling.
class HttpServer {
public:
    HttpServer(runtime::Gateway& gateway, core::config::ListenConfig listen);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts accepting. Returns the bound port.
    core::errors::Result<std::uint16_t> start();

    // Stops accepting, unblocks every session and waits for them to finish.
    void stop();

    bool running() const { return running_.load(); }

    // Routing for plain HTTP requests, independent of any socket.
    HttpResponse handle_request(const HttpRequest& request);

private:
    void do_accept();
    void spawn_session(boost::asio::ip::tcp::socket socket);
    void run_session(boost::asio::ip::tcp::socket socket);
    void run_websocket(boost::asio::ip::tcp::socket socket, HttpRequest request);
    void track(boost::asio::ip::tcp::socket* socket);
    void untrack(boost::asio::ip::tcp::socket* socket);
    void track(const std::shared_ptr<WebSocketChannel>& channel);
    void untrack(const std::shared_ptr<WebSocketChannel>& channel);

    runtime::Gateway& gateway_;
    const core::config::ListenConfig listen_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};

    std::mutex sessions_mutex_;
    std::condition_variable sessions_done_;
    std::size_t active_sessions_ = 0;
    std::unordered_set<boost::asio::ip::tcp::socket*> open_sockets_;
    std::unordered_set<std::shared_ptr<WebSocketChannel>> open_channels_;
};

}  // namespace toolbridge::server

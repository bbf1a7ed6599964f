#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include "session/connection.hpp"

namespace toolbridge::server {

using WebSocketStream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

// Adapts an accepted Beast WebSocket to the registry's channel seam.
//
// Every operation on the stream runs on one strand of the server's
// io_context: the handshake, the single outstanding read, the write queue
// and close. Callers on other threads block on the outcome, so none of the
// blocking entry points may be called from the io_context thread itself.
// A queued write that has not completed within `send_timeout` closes the
// socket and fails with transport_failure.
class WebSocketChannel : public session::DuplexChannel,
                         public std::enable_shared_from_this<WebSocketChannel> {
public:
    WebSocketChannel(boost::asio::ip::tcp::socket socket, std::string peer,
                     std::chrono::milliseconds send_timeout);

    // Completes the upgrade for `request`, which must stay alive until this returns.
    core::errors::Result<bool> handshake(
        const boost::beast::http::request<boost::beast::http::string_body>& request,
        const std::string& server_name);

    // Blocks until the next text frame arrives. Fails once the peer closes,
    // the socket errors, or close() was called.
    core::errors::Result<std::string> read_text();

    core::errors::Result<std::size_t> send_text(const std::string& text) override;
    // Non-blocking. Cancels pending operations and closes the socket.
    void close() override;
    std::string peer_address() const override { return peer_; }

private:
    struct PendingWrite;

    void enqueue(std::shared_ptr<PendingWrite> write);
    void write_next();
    void on_write(const boost::beast::error_code& ec, std::size_t bytes);
    void close_on_strand();
    void arm_write_deadline();

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    WebSocketStream stream_;
    boost::asio::steady_timer write_timer_;
    boost::beast::flat_buffer read_buffer_;
    const std::string peer_;
    const std::chrono::milliseconds send_timeout_;

    // Strand-only state.
    std::deque<std::shared_ptr<PendingWrite>> write_queue_;
    bool closed_ = false;
    std::uint64_t write_generation_ = 0;
};

}  // namespace toolbridge::server

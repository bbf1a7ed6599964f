#include "server/websocket_channel.hpp"

#include <future>
#include <utility>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include "core/logging/logger.hpp"

namespace toolbridge::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using core::errors::BridgeError;
using core::errors::ErrorCategory;
namespace codes = core::errors::codes;

struct WebSocketChannel::PendingWrite {
    std::string text;
    std::promise<core::errors::Result<std::size_t>> done;
};

namespace {

BridgeError transport_error(const std::string& message) {
    return BridgeError{ErrorCategory::Transport, message, codes::kTransportFailure};
}

}  // namespace

WebSocketChannel::WebSocketChannel(tcp::socket socket, std::string peer,
                                   const std::chrono::milliseconds send_timeout)
    : strand_(net::make_strand(socket.get_executor())),
      stream_(std::move(socket)),
      write_timer_(strand_),
      peer_(std::move(peer)),
      send_timeout_(send_timeout) {}

core::errors::Result<bool> WebSocketChannel::handshake(
    const http::request<http::string_body>& request, const std::string& server_name) {
    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto outcome = done->get_future();
    auto self = shared_from_this();
    net::post(strand_, [self, done, &request, server_name] {
        if (self->closed_) {
            done->set_value(net::error::operation_aborted);
            return;
        }
        self->stream_.set_option(
            websocket::stream_base::decorator([server_name](websocket::response_type& response) {
                response.set(http::field::server, server_name);
            }));
        self->stream_.async_accept(
            request, net::bind_executor(self->strand_, [self, done](const beast::error_code& ec) {
                if (!ec) {
                    self->stream_.text(true);
                }
                done->set_value(ec);
            }));
    });

    const beast::error_code ec = outcome.get();
    if (ec) {
        return transport_error("WebSocket handshake with " + peer_ + " failed: " + ec.message());
    }
    return true;
}

core::errors::Result<std::string> WebSocketChannel::read_text() {
    auto done = std::make_shared<std::promise<core::errors::Result<std::string>>>();
    auto outcome = done->get_future();
    auto self = shared_from_this();
    net::post(strand_, [self, done] {
        if (self->closed_) {
            done->set_value(transport_error("WebSocket to " + self->peer_ + " is closed"));
            return;
        }
        self->stream_.async_read(
            self->read_buffer_,
            net::bind_executor(self->strand_, [self, done](const beast::error_code& ec,
                                                           std::size_t) {
                if (ec) {
                    const std::string reason =
                        ec == websocket::error::closed ? std::string("closed by peer")
                                                       : ec.message();
                    done->set_value(transport_error("WebSocket read from " + self->peer_ +
                                                    " ended: " + reason));
                    return;
                }
                std::string text = beast::buffers_to_string(self->read_buffer_.data());
                self->read_buffer_.consume(self->read_buffer_.size());
                done->set_value(std::move(text));
            }));
    });
    return outcome.get();
}

core::errors::Result<std::size_t> WebSocketChannel::send_text(const std::string& text) {
    auto write = std::make_shared<PendingWrite>();
    write->text = text;
    auto outcome = write->done.get_future();
    auto self = shared_from_this();
    net::post(strand_, [self, write] { self->enqueue(write); });

    // The strand answers within send_timeout_ while the io_context runs.
    if (outcome.wait_for(send_timeout_ * 2) != std::future_status::ready) {
        close();
        return transport_error("WebSocket write to " + peer_ + " did not complete");
    }
    return outcome.get();
}

void WebSocketChannel::close() {
    net::post(strand_, [self = shared_from_this()] { self->close_on_strand(); });
}

void WebSocketChannel::enqueue(std::shared_ptr<PendingWrite> write) {
    if (closed_) {
        write->done.set_value(transport_error("WebSocket to " + peer_ + " is closed"));
        return;
    }
    write_queue_.push_back(std::move(write));
    // The head of the queue is always the write in flight.
    if (write_queue_.size() == 1) {
        write_next();
    }
}

void WebSocketChannel::write_next() {
    arm_write_deadline();
    stream_.async_write(
        net::buffer(write_queue_.front()->text),
        net::bind_executor(strand_,
                           [self = shared_from_this()](const beast::error_code& ec,
                                                       const std::size_t bytes) {
                               self->on_write(ec, bytes);
                           }));
}

void WebSocketChannel::arm_write_deadline() {
    const std::uint64_t generation = ++write_generation_;
    write_timer_.expires_after(send_timeout_);
    write_timer_.async_wait(net::bind_executor(
        strand_, [self = shared_from_this(), generation](const beast::error_code& ec) {
            if (ec == net::error::operation_aborted || generation != self->write_generation_) {
                return;
            }
            LOG_WARN("WebSocketChannel: write to " + self->peer_ + " stalled for " +
                     std::to_string(self->send_timeout_.count()) + "ms, closing");
            self->close_on_strand();
        }));
}

void WebSocketChannel::on_write(const beast::error_code& ec, const std::size_t bytes) {
    ++write_generation_;
    write_timer_.cancel();

    auto head = std::move(write_queue_.front());
    write_queue_.pop_front();
    if (ec) {
        head->done.set_value(transport_error("WebSocket write to " + peer_ + " failed: " +
                                             ec.message()));
        close_on_strand();
        return;
    }
    head->done.set_value(bytes);
    if (!write_queue_.empty() && !closed_) {
        write_next();
    }
}

void WebSocketChannel::close_on_strand() {
    if (closed_) {
        return;
    }
    closed_ = true;
    ++write_generation_;
    write_timer_.cancel();

    // The in-flight head completes through on_write once the socket closes.
    while (write_queue_.size() > 1) {
        write_queue_.back()->done.set_value(
            transport_error("WebSocket to " + peer_ + " closed before the write started"));
        write_queue_.pop_back();
    }

    beast::error_code ec;
    stream_.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    stream_.next_layer().close(ec);
}

}  // namespace toolbridge::server

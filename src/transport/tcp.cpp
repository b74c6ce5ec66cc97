#include "dxfer/transport/tcp.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dxfer::transport {

// ──────────────────────────────────────────────────────────
// TcpStream
// ──────────────────────────────────────────────────────────

TcpStream::TcpStream(tcp::socket socket, std::string label)
    : socket_(std::move(socket)), label_(std::move(label)) {
}

void TcpStream::async_read_some(asio::mutable_buffer buffer, IoHandler handler) {
    if (closing_) {
        asio::post(socket_.get_executor(), [handler = std::move(handler)]() {
            handler(asio::error::operation_aborted, 0);
        });
        return;
    }
    auto self = shared_from_this();  // Keep stream alive during async operation
    socket_.async_read_some(buffer,
        [self, handler = std::move(handler)](boost::system::error_code ec, std::size_t n) {
            handler(ec, n);
        });
}

void TcpStream::async_write(std::shared_ptr<const protocol::Bytes> data, IoHandler handler) {
    if (closing_) {
        asio::post(socket_.get_executor(), [handler = std::move(handler)]() {
            handler(asio::error::shut_down, 0);
        });
        return;
    }
    queue_.push_back(QueuedWrite{std::move(data), std::move(handler)});
    if (queue_.size() == 1) {
        do_write();
    }
}

void TcpStream::do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(*queue_.front().data),
        [this, self](boost::system::error_code ec, std::size_t n) {
            auto done = std::move(queue_.front());
            queue_.pop_front();
            done.handler(ec, n);

            if (ec) {
                spdlog::debug("{}: write failed: {}", label_, ec.message());
                while (!queue_.empty()) {
                    auto dropped = std::move(queue_.front());
                    queue_.pop_front();
                    dropped.handler(ec, 0);
                }
            }

            if (!queue_.empty()) {
                do_write();
            } else if (closing_) {
                finish_close();
            }
        });
}

void TcpStream::close() {
    if (closing_) {
        return;
    }
    closing_ = true;
    if (queue_.empty()) {
        finish_close();
    }
}

void TcpStream::close_after_drain(std::function<void()> handler) {
    if (closed_) {
        asio::post(socket_.get_executor(), std::move(handler));
        return;
    }
    drained_.push_back(std::move(handler));
    close();
}

void TcpStream::finish_close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != asio::error::not_connected) {
        spdlog::debug("{}: shutdown: {}", label_, ec.message());
    }
    socket_.cancel(ec);

    auto callbacks = std::move(drained_);
    drained_.clear();
    for (auto& callback : callbacks) {
        asio::post(socket_.get_executor(), std::move(callback));
    }
}

// ──────────────────────────────────────────────────────────
// TcpEndpoints
// ──────────────────────────────────────────────────────────

TcpEndpoints::TcpEndpoints(asio::io_context& io) : io_(io) {
}

void TcpEndpoints::async_connect(asio::io_context& io,
                                 const std::string& host,
                                 std::uint16_t port,
                                 ReadyHandler handler) {
    using EndpointsPtr = std::shared_ptr<TcpEndpoints>;

    auto self = std::make_shared<TcpEndpoints>(io);
    self->dialer_ = true;
    auto resolver = std::make_shared<tcp::resolver>(io);
    const std::string where = host + ":" + std::to_string(port);

    resolver->async_resolve(host, std::to_string(port),
        [self, resolver, where, handler](boost::system::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                handler(Err<EndpointsPtr>(to_error(ec, "resolve " + where)));
                return;
            }
            auto socket = std::make_shared<tcp::socket>(self->io_);
            asio::async_connect(*socket, results,
                [self, socket, where, handler](boost::system::error_code ec, const tcp::endpoint& endpoint) {
                    if (ec) {
                        handler(Err<EndpointsPtr>(to_error(ec, "connect " + where)));
                        return;
                    }
                    spdlog::info("Connected to {}", where);
                    self->remote_ = endpoint;
                    self->control_ = self->adopt(std::move(*socket), "control");
                    auto tag = std::make_shared<const protocol::Bytes>(1, kControlTag);
                    self->control_->async_write(tag, [where](boost::system::error_code ec, std::size_t) {
                        if (ec) {
                            spdlog::warn("Failed to tag control stream to {}: {}", where, ec.message());
                        }
                    });
                    handler(Ok(self));
                });
        });
}

void TcpEndpoints::async_listen(asio::io_context& io,
                                std::uint16_t port,
                                std::function<void(std::uint16_t)> on_listening,
                                ReadyHandler handler) {
    using EndpointsPtr = std::shared_ptr<TcpEndpoints>;

    auto self = std::make_shared<TcpEndpoints>(io);
    self->acceptor_ = std::make_unique<tcp::acceptor>(io);

    boost::system::error_code ec;
    const tcp::endpoint local(tcp::v4(), port);
    self->acceptor_->open(local.protocol(), ec);
    if (!ec) {
        self->acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        self->acceptor_->bind(local, ec);
    }
    if (!ec) {
        self->acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        asio::post(io, [handler, ec, port]() {
            handler(Err<EndpointsPtr>(to_error(ec, "listen on port " + std::to_string(port))));
        });
        return;
    }

    const auto bound = self->acceptor_->local_endpoint(ec).port();
    spdlog::info("Listening for peer on port {}", bound);
    if (on_listening) {
        on_listening(bound);
    }
    self->ready_ = std::move(handler);
    self->do_accept();
}

void TcpEndpoints::do_accept() {
    auto self = shared_from_this();
    acceptor_->async_accept(
        [self](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::error("Accept error: {}", ec.message());
                    if (self->ready_) {
                        auto ready = std::move(self->ready_);
                        self->ready_ = nullptr;
                        ready(Err<std::shared_ptr<TcpEndpoints>>(to_error(ec, "accept")));
                    }
                }
                return;
            }
            self->read_tag(std::make_shared<tcp::socket>(std::move(socket)));

            // Accept next connection (keeps listener accepting)
            self->do_accept();
        });
}

void TcpEndpoints::read_tag(std::shared_ptr<tcp::socket> socket) {
    auto self = shared_from_this();
    auto tag = std::make_shared<std::array<std::uint8_t, 1>>();
    asio::async_read(*socket, asio::buffer(*tag),
        [self, socket, tag](boost::system::error_code ec, std::size_t) {
            if (ec) {
                spdlog::debug("Connection closed before tag: {}", ec.message());
                return;
            }
            self->on_tagged(socket, (*tag)[0]);
        });
}

void TcpEndpoints::on_tagged(std::shared_ptr<tcp::socket> socket, std::uint8_t tag) {
    if (closed_) {
        return;
    }

    if (tag == kControlTag) {
        if (control_) {
            spdlog::warn("Rejecting second control connection");
            return;
        }
        control_ = adopt(std::move(*socket), "control");
        if (ready_) {
            auto ready = std::move(ready_);
            ready_ = nullptr;
            ready(Ok(shared_from_this()));
        }
        return;
    }

    if (tag != kTransferTag) {
        spdlog::warn("Rejecting connection with unknown tag 0x{:02x}", tag);
        return;
    }

    StreamPtr stream = adopt(std::move(*socket), "transfer");
    if (accept_handler_) {
        accept_handler_(std::move(stream));
    } else {
        backlog_.push_back(std::move(stream));
    }
}

std::shared_ptr<TcpStream> TcpEndpoints::adopt(tcp::socket socket, const std::string& kind) {
    boost::system::error_code ec;
    const auto peer = socket.remote_endpoint(ec);
    std::string label = kind + "-" + std::to_string(++stream_counter_);
    if (!ec) {
        label += "@" + peer.address().to_string() + ":" + std::to_string(peer.port());
    }
    auto stream = std::make_shared<TcpStream>(std::move(socket), std::move(label));
    streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                       [](const std::weak_ptr<TcpStream>& w) { return w.expired(); }),
                   streams_.end());
    streams_.push_back(stream);
    return stream;
}

void TcpEndpoints::async_open_outbound(OpenHandler handler) {
    if (!dialer_ || closed_) {
        asio::post(io_, [handler = std::move(handler), dialer = dialer_]() {
            handler(Err<StreamPtr>(ErrorKind::Io, dialer
                ? "session is closed"
                : "the listening side cannot open outbound streams"));
        });
        return;
    }

    auto self = shared_from_this();
    auto socket = std::make_shared<tcp::socket>(io_);
    socket->async_connect(remote_,
        [self, socket, handler = std::move(handler)](boost::system::error_code ec) {
            if (ec) {
                handler(Err<StreamPtr>(to_error(ec, "open stream")));
                return;
            }
            auto stream = self->adopt(std::move(*socket), "transfer");
            auto tag = std::make_shared<const protocol::Bytes>(1, kTransferTag);
            // A failed tag write fails the first real write on the same queue too
            stream->async_write(tag, [](boost::system::error_code, std::size_t) {});
            handler(Ok(StreamPtr(stream)));
        });
}

void TcpEndpoints::listen(AcceptHandler acceptor) {
    accept_handler_ = std::move(acceptor);
    while (!backlog_.empty() && accept_handler_) {
        auto stream = backlog_.front();
        backlog_.pop_front();
        accept_handler_(stream);
    }
}

void TcpEndpoints::async_close(CloseHandler handler) {
    closed_ = true;
    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    accept_handler_ = nullptr;
    backlog_.clear();

    std::vector<std::shared_ptr<TcpStream>> live;
    for (auto& weak : streams_) {
        if (auto stream = weak.lock()) {
            live.push_back(stream);
        }
    }
    streams_.clear();

    if (live.empty()) {
        asio::post(io_, [handler = std::move(handler)]() { handler(Ok()); });
        return;
    }

    auto pending = std::make_shared<std::size_t>(live.size());
    auto shared_handler = std::make_shared<CloseHandler>(std::move(handler));
    for (auto& stream : live) {
        stream->close_after_drain([pending, shared_handler]() {
            if (--*pending == 0) {
                (*shared_handler)(Ok());
            }
        });
    }
}

} // namespace dxfer::transport

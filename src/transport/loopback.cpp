#include "dxfer/transport/loopback.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>

namespace dxfer::transport {

namespace asio = boost::asio;

// ──────────────────────────────────────────────────────────
// LoopbackStream
// ──────────────────────────────────────────────────────────

LoopbackStream::LoopbackStream(asio::io_context& io, std::string label)
    : io_(io), label_(std::move(label)) {
}

std::pair<std::shared_ptr<LoopbackStream>, std::shared_ptr<LoopbackStream>>
LoopbackStream::make_pair(asio::io_context& io, const std::string& label) {
    auto a = std::make_shared<LoopbackStream>(io, label + "/a");
    auto b = std::make_shared<LoopbackStream>(io, label + "/b");
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
}

void LoopbackStream::async_read_some(asio::mutable_buffer buffer, IoHandler handler) {
    if (closed_) {
        complete(std::move(handler), asio::error::operation_aborted, 0);
        return;
    }
    if (pending_read_) {
        complete(std::move(handler), asio::error::in_progress, 0);
        return;
    }
    pending_read_ = PendingRead{buffer, std::move(handler)};
    service_pending_read();
}

void LoopbackStream::async_write(std::shared_ptr<const protocol::Bytes> data, IoHandler handler) {
    if (closed_) {
        complete(std::move(handler), asio::error::shut_down, 0);
        return;
    }
    auto self = shared_from_this();
    asio::post(io_, [self, data = std::move(data), handler = std::move(handler)]() {
        if (auto peer = self->peer_.lock()) {
            peer->deliver(*data);
        }
        handler(boost::system::error_code{}, data->size());
    });
}

void LoopbackStream::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    if (pending_read_) {
        auto pending = std::move(*pending_read_);
        pending_read_.reset();
        complete(std::move(pending.handler), asio::error::operation_aborted, 0);
    }

    // Posted behind every write issued so far, so the peer drains those first
    auto self = shared_from_this();
    asio::post(io_, [self]() {
        if (auto peer = self->peer_.lock()) {
            peer->on_peer_closed();
        }
    });
}

void LoopbackStream::deliver(const protocol::Bytes& data) {
    if (closed_) {
        return;
    }
    inbound_.insert(inbound_.end(), data.begin(), data.end());
    service_pending_read();
}

void LoopbackStream::on_peer_closed() {
    peer_closed_ = true;
    service_pending_read();
}

void LoopbackStream::service_pending_read() {
    if (!pending_read_) {
        return;
    }

    if (!inbound_.empty()) {
        auto pending = std::move(*pending_read_);
        pending_read_.reset();
        const std::size_t n = std::min(pending.buffer.size(), inbound_.size());
        auto* out = static_cast<std::uint8_t*>(pending.buffer.data());
        std::copy(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(n), out);
        inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(n));
        complete(std::move(pending.handler), boost::system::error_code{}, n);
    } else if (peer_closed_) {
        auto pending = std::move(*pending_read_);
        pending_read_.reset();
        complete(std::move(pending.handler), asio::error::eof, 0);
    }
}

void LoopbackStream::complete(IoHandler handler, boost::system::error_code ec, std::size_t n) {
    asio::post(io_, [handler = std::move(handler), ec, n]() {
        handler(ec, n);
    });
}

// ──────────────────────────────────────────────────────────
// LoopbackEndpoints
// ──────────────────────────────────────────────────────────

LoopbackEndpoints::LoopbackEndpoints(asio::io_context& io, std::string side)
    : io_(io), side_(std::move(side)) {
}

std::pair<std::shared_ptr<LoopbackEndpoints>, std::shared_ptr<LoopbackEndpoints>>
LoopbackEndpoints::make_pair(asio::io_context& io) {
    auto a = std::make_shared<LoopbackEndpoints>(io, "a");
    auto b = std::make_shared<LoopbackEndpoints>(io, "b");
    a->peer_ = b;
    b->peer_ = a;

    auto control = LoopbackStream::make_pair(io, "control");
    a->control_ = control.first;
    b->control_ = control.second;
    a->track(a->control_);
    b->track(b->control_);
    return {a, b};
}

void LoopbackEndpoints::async_open_outbound(OpenHandler handler) {
    auto peer = peer_.lock();
    if (closed_ || !peer || peer->closed_) {
        asio::post(io_, [handler = std::move(handler)]() {
            handler(Err<StreamPtr>(ErrorKind::Io, "loopback session is closed"));
        });
        return;
    }

    ++opened_;
    auto pair = LoopbackStream::make_pair(io_, side_ + "-stream-" + std::to_string(opened_));
    track(pair.first);
    peer->track(pair.second);

    StreamPtr local = pair.first;
    StreamPtr remote = pair.second;
    asio::post(io_, [peer, remote]() { peer->incoming(remote); });
    asio::post(io_, [handler = std::move(handler), local]() { handler(Ok(local)); });
}

void LoopbackEndpoints::listen(AcceptHandler acceptor) {
    acceptor_ = std::move(acceptor);
    while (!backlog_.empty() && acceptor_) {
        auto stream = backlog_.front();
        backlog_.pop_front();
        acceptor_(stream);
    }
}

void LoopbackEndpoints::incoming(StreamPtr stream) {
    if (closed_) {
        stream->close();
        return;
    }
    if (acceptor_) {
        acceptor_(std::move(stream));
    } else {
        backlog_.push_back(std::move(stream));
    }
}

void LoopbackEndpoints::async_close(CloseHandler handler) {
    closed_ = true;
    acceptor_ = nullptr;
    for (auto& weak : streams_) {
        if (auto stream = weak.lock()) {
            stream->close();
        }
    }
    streams_.clear();
    for (auto& stream : backlog_) {
        stream->close();
    }
    backlog_.clear();

    // Every write was posted before the closes above, so it is delivered first
    asio::post(io_, [handler = std::move(handler)]() { handler(Ok()); });
}

void LoopbackEndpoints::track(const std::shared_ptr<LoopbackStream>& stream) {
    streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                       [](const std::weak_ptr<LoopbackStream>& w) { return w.expired(); }),
                   streams_.end());
    streams_.push_back(stream);
}

} // namespace dxfer::transport

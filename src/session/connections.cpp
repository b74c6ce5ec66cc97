#include "dxfer/session/connections.hpp"

#include "dxfer/events/events.hpp"

#include <boost/asio/error.hpp>

namespace dxfer::session {

namespace asio = boost::asio;

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // namespace

// ──────────────────────────────────────────────────────────
// ReceiveConnection
// ──────────────────────────────────────────────────────────

ReceiveConnection::ReceiveConnection(Context ctx,
                                     transport::StreamPtr stream,
                                     transfer::SinkProvider& sinks)
    : ctx_(std::move(ctx)),
      stream_(std::move(stream)),
      machine_(sinks),
      done_(std::make_shared<TransferCompletion>(ctx_.io)) {
}

void ReceiveConnection::start() {
    ctx_.logger->debug("{}: inbound stream accepted", stream_->describe());
    do_read();
}

void ReceiveConnection::do_read() {
    auto self = shared_from_this();  // Keep connection alive during async operation

    stream_->async_read_some(asio::buffer(buffer_),
        [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
            if (finished_) {
                return;
            }
            if (!ec) {
                on_read(bytes_transferred);
            } else if (ec == asio::error::eof) {
                handle_close();
            } else if (ec == asio::error::operation_aborted) {
                handle_abort();
            } else {
                handle_error(transport::to_error(ec, stream_->describe()));
            }
        });
}

void ReceiveConnection::on_read(std::size_t bytes_transferred) {
    auto result = machine_.on_data(buffer_.data(), bytes_transferred);
    if (result.is_error()) {
        handle_error(result.error());
        return;
    }

    const auto& info = machine_.info();
    if (!announced_ && machine_.state() != transfer::ReceiveState::AwaitingHeader) {
        announced_ = true;
        ctx_.emit(events::TransferStartedEvent{
            events::Direction::Receive, stream_->describe(), info.name, info.destination, info.size});
    }
    if (machine_.state() != transfer::ReceiveState::AwaitingHeader) {
        ctx_.emit(events::TransferProgressEvent{
            events::Direction::Receive, info.name, info.transferred, info.size});
    }

    if (result.value()) {
        do_write_ack(std::move(*result.value()));
    }

    // Keep reading after the ack: the peer's close, or any excess data, still has to be seen
    do_read();
}

void ReceiveConnection::do_write_ack(protocol::Bytes ack_frame) {
    auto self = shared_from_this();
    auto data = std::make_shared<const protocol::Bytes>(std::move(ack_frame));

    stream_->async_write(data,
        [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                handle_error(transport::to_error(ec, stream_->describe() + ": ack"));
                return;
            }
            const auto& info = machine_.info();
            if (done_->fire(Ok(info))) {
                ctx_.emit(events::TransferCompletedEvent{
                    events::Direction::Receive, info.name, info.destination, info.size,
                    info.sha256, elapsed_since(started_at_)});
            }
        });
}

void ReceiveConnection::handle_close() {
    auto closed = machine_.on_close();
    if (closed.is_error()) {
        handle_error(closed.error());
        return;
    }
    ctx_.logger->debug("{}: peer closed after ack", stream_->describe());
    finished_ = true;
    stream_->close();
}

void ReceiveConnection::handle_abort() {
    // Closed locally, usually by session teardown. Only an unfinished transfer is an error;
    // a pending ack write still reports a completed one.
    auto closed = machine_.on_close();
    if (closed.is_error()) {
        handle_error(closed.error());
    }
}

void ReceiveConnection::handle_error(Error error) {
    if (done_->fired()) {
        if (!finished_) {
            // Transfer already reported as complete; the peer misbehaved afterwards
            ctx_.logger->warn("{}: after completion: {}", stream_->describe(), error.describe());
        }
    } else {
        ctx_.emit(events::TransferFailedEvent{
            events::Direction::Receive, stream_->describe(), machine_.info().name, error});
        done_->fire(Err<transfer::TransferInfo>(std::move(error)));
    }
    finished_ = true;
    stream_->close();
}

// ──────────────────────────────────────────────────────────
// SendConnection
// ──────────────────────────────────────────────────────────

SendConnection::SendConnection(Context ctx,
                               transport::StreamPtr stream,
                               std::unique_ptr<transfer::SendStateMachine> machine)
    : ctx_(std::move(ctx)),
      stream_(std::move(stream)),
      machine_(std::move(machine)),
      done_(std::make_shared<TransferCompletion>(ctx_.io)) {
}

void SendConnection::start() {
    auto header = machine_->begin();
    if (header.is_error()) {
        handle_error(header.error());
        return;
    }

    const auto& info = machine_->info();
    ctx_.emit(events::TransferStartedEvent{
        events::Direction::Send, stream_->describe(), info.name, std::string{}, info.size});

    do_read();
    do_write(std::move(header.value()));
}

void SendConnection::do_write(protocol::Bytes data) {
    auto self = shared_from_this();
    auto payload = std::make_shared<const protocol::Bytes>(std::move(data));

    stream_->async_write(payload,
        [this, self](const boost::system::error_code& ec, std::size_t) {
            if (finished_) {
                return;
            }
            if (ec) {
                handle_error(transport::to_error(ec, stream_->describe()));
                return;
            }
            write_next_chunk();
        });
}

void SendConnection::write_next_chunk() {
    if (machine_->state() != transfer::SendState::Streaming) {
        return;
    }

    auto chunk = machine_->next_chunk();
    if (chunk.is_error()) {
        handle_error(chunk.error());
        return;
    }

    const auto& info = machine_->info();
    if (!chunk.value()) {
        ctx_.logger->debug("{}: {} bytes of '{}' sent, awaiting ack",
                           stream_->describe(), info.transferred, info.name);
        return;
    }

    ctx_.emit(events::TransferProgressEvent{
        events::Direction::Send, info.name, info.transferred, info.size});
    do_write(std::move(*chunk.value()));
}

void SendConnection::do_read() {
    auto self = shared_from_this();

    stream_->async_read_some(asio::buffer(buffer_),
        [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
            if (finished_) {
                return;
            }
            if (!ec) {
                on_read(bytes_transferred);
            } else if (ec == asio::error::eof) {
                handle_close();
            } else if (ec == asio::error::operation_aborted) {
                handle_error(Error{ErrorKind::PrematureClose,
                    stream_->describe() + ": closed locally before the ack arrived"});
            } else {
                handle_error(transport::to_error(ec, stream_->describe()));
            }
        });
}

void SendConnection::on_read(std::size_t bytes_transferred) {
    auto acked = machine_->on_data(buffer_.data(), bytes_transferred);
    if (acked.is_error()) {
        handle_error(acked.error());
        return;
    }
    if (!acked.value()) {
        do_read();
        return;
    }

    finished_ = true;
    stream_->close();

    const auto& info = machine_->info();
    ctx_.emit(events::TransferCompletedEvent{
        events::Direction::Send, info.name, std::string{}, info.size, info.sha256,
        elapsed_since(started_at_)});
    done_->fire(Ok(info));
}

void SendConnection::handle_close() {
    auto closed = machine_->on_close();
    if (closed.is_error()) {
        handle_error(closed.error());
    }
}

void SendConnection::handle_error(Error error) {
    if (finished_) {
        return;
    }
    finished_ = true;

    ctx_.emit(events::TransferFailedEvent{
        events::Direction::Send, stream_->describe(), machine_->info().name, error});
    done_->fire(Err<transfer::TransferInfo>(std::move(error)));
    stream_->close();
}

} // namespace dxfer::session

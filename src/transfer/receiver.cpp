#include "dxfer/transfer/receiver.hpp"

#include <string>

namespace dxfer::transfer {
namespace {

bool is_progressive(ReceiveState current, ReceiveState target) {
    if (target == ReceiveState::Failed) {
        return current != ReceiveState::Complete;
    }
    switch (current) {
        case ReceiveState::AwaitingHeader: return target == ReceiveState::Streaming;
        case ReceiveState::Streaming: return target == ReceiveState::Complete;
        default: return false;
    }
}

} // namespace

const char* to_string(ReceiveState state) {
    switch (state) {
        case ReceiveState::AwaitingHeader: return "awaiting-header";
        case ReceiveState::Streaming: return "streaming";
        case ReceiveState::Complete: return "complete";
        case ReceiveState::Failed: return "failed";
    }
    return "unknown";
}

ReceiveStateMachine::ReceiveStateMachine(SinkProvider& sinks, std::size_t max_header_size)
    : sinks_(sinks),
      decoder_(max_header_size) {
}

Result<std::optional<protocol::Bytes>> ReceiveStateMachine::on_data(const std::uint8_t* data,
                                                                    std::size_t len) {
    switch (state_) {
        case ReceiveState::AwaitingHeader: {
            decoder_.feed(data, len);
            auto frame = decoder_.next();
            if (frame.is_error()) {
                return fail(frame.error());
            }
            if (!frame.value()) {
                return Ok(std::optional<protocol::Bytes>{});
            }
            return accept_header(*frame.value());
        }

        case ReceiveState::Streaming:
            return consume(data, len);

        case ReceiveState::Complete:
            // The ack is out and the file is committed; the peer sent past the declared size
            return Err<std::optional<protocol::Bytes>>(ErrorKind::Overflow,
                std::to_string(len) + " bytes received after transfer of '" + info_.name + "' completed");

        case ReceiveState::Failed:
            break;
    }
    return Err<std::optional<protocol::Bytes>>(ErrorKind::ProtocolViolation,
        "data received on failed transfer: " + info_.last_error);
}

Result<void> ReceiveStateMachine::on_close() {
    switch (state_) {
        case ReceiveState::Complete:
            return Ok();
        case ReceiveState::Failed:
            return Err<void>(ErrorKind::PrematureClose, "stream closed after failure: " + info_.last_error);
        case ReceiveState::AwaitingHeader:
            mark_failed(Error{ErrorKind::PrematureClose, "stream closed before header arrived"});
            break;
        case ReceiveState::Streaming:
            mark_failed(Error{ErrorKind::PrematureClose,
                "unexpected close with " + std::to_string(remaining_) + " of " +
                std::to_string(info_.size) + " bytes outstanding"});
            break;
    }
    return Err<void>(*failure_);
}

Result<std::optional<protocol::Bytes>> ReceiveStateMachine::accept_header(const protocol::Bytes& payload) {
    auto header = protocol::decode_header(payload);
    if (header.is_error()) {
        return fail(header.error());
    }

    info_.name = header.value().name;
    info_.size = header.value().size;

    auto sink = sinks_.open_sink(header.value().name, header.value().size);
    if (sink.is_error()) {
        return fail(sink.error());
    }

    header_ = header.value();
    sink_ = std::move(sink.value());
    remaining_ = header_->size;
    info_.destination = sink_->describe();

    if (auto moved = transition_to(ReceiveState::Streaming); moved.is_error()) {
        return fail(moved.error());
    }

    // Bytes that arrived behind the header frame are the start of the payload
    const protocol::Bytes rest = decoder_.take_remainder();
    return consume(rest.data(), rest.size());
}

Result<std::optional<protocol::Bytes>> ReceiveStateMachine::consume(const std::uint8_t* data,
                                                                   std::size_t len) {
    if (len > remaining_) {
        return fail(Error{ErrorKind::Overflow,
            "receiver overflow: " + std::to_string(len) + " bytes arrived with only " +
            std::to_string(remaining_) + " of " + std::to_string(info_.size) + " expected"});
    }

    if (len > 0) {
        digest_.update(data, len);
        if (auto written = sink_->write(data, len); written.is_error()) {
            return fail(written.error());
        }
        remaining_ -= len;
        info_.transferred += len;
    }

    if (remaining_ == 0) {
        return finish();
    }
    return Ok(std::optional<protocol::Bytes>{});
}

Result<std::optional<protocol::Bytes>> ReceiveStateMachine::finish() {
    if (auto committed = sink_->commit(); committed.is_error()) {
        return fail(committed.error());
    }

    info_.sha256 = digest_.hexdigest();
    if (auto moved = transition_to(ReceiveState::Complete); moved.is_error()) {
        return fail(moved.error());
    }

    protocol::Ack ack;
    ack.sha256 = info_.sha256;
    return Ok(std::optional<protocol::Bytes>(protocol::encode_frame(protocol::encode_ack(ack))));
}

Result<std::optional<protocol::Bytes>> ReceiveStateMachine::fail(Error error) {
    mark_failed(error);
    return Err<std::optional<protocol::Bytes>>(std::move(error));
}

void ReceiveStateMachine::mark_failed(const Error& error) {
    if (sink_) {
        sink_->abandon();
    }
    failure_ = error;
    info_.last_error = error.describe();
    // Failed is reachable from every non-terminal state
    state_ = ReceiveState::Failed;
}

Result<void> ReceiveStateMachine::transition_to(ReceiveState next) {
    if (state_ == next) {
        return Ok();
    }
    if (!is_progressive(state_, next)) {
        return Err<void>(ErrorKind::ProtocolViolation,
            std::string("illegal receive transition ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    return Ok();
}

} // namespace dxfer::transfer

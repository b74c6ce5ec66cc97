#include "dxfer/transfer/sender.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace dxfer::transfer {
namespace {

bool is_progressive(SendState current, SendState target) {
    static const std::unordered_map<SendState, std::vector<SendState>> transitions {
        {SendState::SendingHeader, {SendState::Streaming}},
        {SendState::Streaming, {SendState::AwaitingAck}},
        {SendState::AwaitingAck, {SendState::Complete}},
    };

    if (target == SendState::Failed) {
        return current != SendState::Complete;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(SendState state) {
    switch (state) {
        case SendState::SendingHeader: return "sending-header";
        case SendState::Streaming: return "streaming";
        case SendState::AwaitingAck: return "awaiting-ack";
        case SendState::Complete: return "complete";
        case SendState::Failed: return "failed";
    }
    return "unknown";
}

SendStateMachine::SendStateMachine(std::unique_ptr<ByteSource> source, std::size_t chunk_size)
    : source_(std::move(source)),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {
    info_.name = source_->name();
    info_.size = source_->size();
}

Result<protocol::Bytes> SendStateMachine::begin() {
    if (state_ != SendState::SendingHeader) {
        return Err<protocol::Bytes>(ErrorKind::ProtocolViolation,
            std::string("header already sent, state is ") + to_string(state_));
    }

    const auto header = protocol::Header::for_file(info_.name, info_.size);
    auto frame = protocol::encode_frame(protocol::encode_header(header));

    if (auto moved = transition_to(SendState::Streaming); moved.is_error()) {
        return fail<protocol::Bytes>(moved.error());
    }
    return Ok(std::move(frame));
}

Result<std::optional<protocol::Bytes>> SendStateMachine::next_chunk() {
    using Chunk = std::optional<protocol::Bytes>;

    if (state_ != SendState::Streaming) {
        return Err<Chunk>(ErrorKind::ProtocolViolation,
            std::string("no payload to send in state ") + to_string(state_));
    }

    protocol::Bytes buffer(chunk_size_);
    auto count = source_->read(buffer.data(), buffer.size());
    if (count.is_error()) {
        return fail<Chunk>(count.error());
    }

    if (count.value() == 0) {
        if (info_.transferred != info_.size) {
            return fail<Chunk>(Error{ErrorKind::Io,
                "source '" + info_.name + "' ended after " + std::to_string(info_.transferred) +
                " of " + std::to_string(info_.size) + " bytes"});
        }
        expected_hash_ = digest_.hexdigest();
        info_.sha256 = *expected_hash_;
        if (auto moved = transition_to(SendState::AwaitingAck); moved.is_error()) {
            return fail<Chunk>(moved.error());
        }
        return Ok(Chunk{});
    }

    if (count.value() > info_.size - info_.transferred) {
        return fail<Chunk>(Error{ErrorKind::Io,
            "source '" + info_.name + "' grew beyond its declared " +
            std::to_string(info_.size) + " bytes"});
    }

    buffer.resize(count.value());
    digest_.update(buffer);
    info_.transferred += buffer.size();
    return Ok(Chunk(std::move(buffer)));
}

Result<bool> SendStateMachine::on_data(const std::uint8_t* data, std::size_t len) {
    if (state_ == SendState::Complete) {
        // Complete is terminal; the error still reaches whoever drives the stream
        return Err<bool>(ErrorKind::ProtocolViolation, "data after done");
    }
    if (state_ == SendState::Failed) {
        return Err<bool>(ErrorKind::ProtocolViolation, "data received on failed transfer");
    }

    ack_decoder_.feed(data, len);
    auto frame = ack_decoder_.next();
    if (frame.is_error()) {
        return fail<bool>(frame.error());
    }
    if (!frame.value()) {
        return Ok(false);
    }
    if (ack_decoder_.buffered() > 0) {
        return fail<bool>(Error{ErrorKind::ProtocolViolation,
            std::to_string(ack_decoder_.buffered()) + " unexpected bytes after ack"});
    }
    return process_ack(*frame.value());
}

Result<bool> SendStateMachine::process_ack(const protocol::Bytes& payload) {
    if (!expected_hash_) {
        return fail<bool>(Error{ErrorKind::ProtocolViolation, "premature ack"});
    }

    auto ack = protocol::decode_ack(payload);
    if (ack.is_error()) {
        return fail<bool>(ack.error());
    }
    if (ack.value().ack != protocol::kAckOk) {
        return fail<bool>(Error{ErrorKind::ProtocolViolation,
            "ack not ok: '" + ack.value().ack + "'"});
    }
    if (ack.value().sha256 != *expected_hash_) {
        return fail<bool>(Error{ErrorKind::IntegrityFailure,
            "ack bad hash: got " + ack.value().sha256 + ", expected " + *expected_hash_});
    }

    if (auto moved = transition_to(SendState::Complete); moved.is_error()) {
        return fail<bool>(moved.error());
    }
    return Ok(true);
}

Result<void> SendStateMachine::on_close() {
    if (state_ == SendState::Complete) {
        return Ok();
    }
    if (state_ != SendState::Failed) {
        mark_failed(Error{ErrorKind::PrematureClose,
            std::string("premature close while ") + to_string(state_)});
    }
    return Err<void>(*failure_);
}

void SendStateMachine::mark_failed(const Error& error) {
    failure_ = error;
    info_.last_error = error.describe();
    state_ = SendState::Failed;
}

Result<void> SendStateMachine::transition_to(SendState next) {
    if (state_ == next) {
        return Ok();
    }
    if (!is_progressive(state_, next)) {
        return Err<void>(ErrorKind::ProtocolViolation,
            std::string("illegal send transition ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    return Ok();
}

} // namespace dxfer::transfer

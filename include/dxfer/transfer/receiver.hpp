#pragma once

#include "dxfer/core/result.hpp"
#include "dxfer/protocol/frame.hpp"
#include "dxfer/protocol/messages.hpp"
#include "dxfer/transfer/digest.hpp"
#include "dxfer/transfer/file_io.hpp"
#include "dxfer/transfer/types.hpp"

#include <memory>
#include <optional>

namespace dxfer::transfer {

/**
 * @brief Receive side of one transfer stream, independent of any transport
 *
 * STATES:
 * AwaitingHeader -> Streaming -> Complete
 * any non-terminal state -> Failed
 *
 * The driver feeds every byte read from the stream into on_data(). When a
 * call completes the transfer it returns the encoded ack frame, which the
 * driver must write back. on_close() reports whether the stream was allowed
 * to end where it did.
 */
class ReceiveStateMachine {
public:
    explicit ReceiveStateMachine(SinkProvider& sinks,
                                 std::size_t max_header_size = protocol::kDefaultMaxFramePayload);

    ReceiveStateMachine(const ReceiveStateMachine&) = delete;
    ReceiveStateMachine& operator=(const ReceiveStateMachine&) = delete;

    /**
     * @brief Consume bytes read from the stream
     *
     * @return The ack frame to send when this call completed the transfer,
     *         nullopt when more bytes are expected, or the error that failed it
     */
    Result<std::optional<protocol::Bytes>> on_data(const std::uint8_t* data, std::size_t len);

    /**
     * @brief The stream ended; an error unless the transfer completed
     */
    Result<void> on_close();

    [[nodiscard]] ReceiveState state() const noexcept { return state_; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }
    [[nodiscard]] std::uint64_t remaining() const noexcept { return remaining_; }
    [[nodiscard]] const std::optional<protocol::Header>& header() const noexcept { return header_; }
    [[nodiscard]] const std::optional<Error>& failure() const noexcept { return failure_; }

private:
    Result<std::optional<protocol::Bytes>> accept_header(const protocol::Bytes& payload);
    Result<std::optional<protocol::Bytes>> consume(const std::uint8_t* data, std::size_t len);
    Result<std::optional<protocol::Bytes>> finish();
    Result<std::optional<protocol::Bytes>> fail(Error error);
    void mark_failed(const Error& error);

    Result<void> transition_to(ReceiveState next);

    SinkProvider& sinks_;
    ReceiveState state_ = ReceiveState::AwaitingHeader;
    protocol::FrameDecoder decoder_;
    std::optional<protocol::Header> header_;
    std::unique_ptr<ByteSink> sink_;
    Sha256Digest digest_;
    std::uint64_t remaining_ = 0;
    TransferInfo info_;
    std::optional<Error> failure_;
};

} // namespace dxfer::transfer

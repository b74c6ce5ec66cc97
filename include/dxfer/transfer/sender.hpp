#pragma once

#include "dxfer/core/result.hpp"
#include "dxfer/protocol/frame.hpp"
#include "dxfer/protocol/messages.hpp"
#include "dxfer/transfer/digest.hpp"
#include "dxfer/transfer/file_io.hpp"
#include "dxfer/transfer/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace dxfer::transfer {

/**
 * @brief Send side of one transfer stream, independent of any transport
 *
 * STATES:
 * SendingHeader -> Streaming -> AwaitingAck -> Complete
 * any non-terminal state -> Failed
 *
 * Driver sequence:
 * 1. begin() once; write the returned header frame
 * 2. next_chunk() until it yields nullopt; write each chunk in order
 * 3. feed everything read from the stream into on_data() until it
 *    returns true (ack verified)
 *
 * Reading the ack may overlap with step 2; an ack that completes before
 * the whole source was hashed is rejected as premature.
 */
class SendStateMachine {
public:
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;

    explicit SendStateMachine(std::unique_ptr<ByteSource> source,
                              std::size_t chunk_size = kDefaultChunkSize);

    SendStateMachine(const SendStateMachine&) = delete;
    SendStateMachine& operator=(const SendStateMachine&) = delete;

    /**
     * @brief Produce the header frame; must precede every payload byte
     */
    Result<protocol::Bytes> begin();

    /**
     * @brief Read and hash the next payload chunk
     *
     * @return The chunk to write, or nullopt once the source is exhausted
     *         (the expected digest is final from then on)
     */
    Result<std::optional<protocol::Bytes>> next_chunk();

    /**
     * @brief Consume bytes read from the stream
     *
     * @return true once a valid ack matching the expected digest arrived
     */
    Result<bool> on_data(const std::uint8_t* data, std::size_t len);

    /**
     * @brief The stream ended; an error unless the ack was already verified
     */
    Result<void> on_close();

    [[nodiscard]] SendState state() const noexcept { return state_; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }
    [[nodiscard]] const std::optional<std::string>& expected_hash() const noexcept { return expected_hash_; }
    [[nodiscard]] const std::optional<Error>& failure() const noexcept { return failure_; }

private:
    Result<bool> process_ack(const protocol::Bytes& payload);

    template<typename T>
    Result<T> fail(Error error) {
        mark_failed(error);
        return Err<T>(std::move(error));
    }
    void mark_failed(const Error& error);

    Result<void> transition_to(SendState next);

    std::unique_ptr<ByteSource> source_;
    std::size_t chunk_size_;
    SendState state_ = SendState::SendingHeader;
    protocol::FrameDecoder ack_decoder_;
    Sha256Digest digest_;
    std::optional<std::string> expected_hash_;
    TransferInfo info_;
    std::optional<Error> failure_;
};

} // namespace dxfer::transfer

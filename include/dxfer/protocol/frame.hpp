#pragma once

/**
 * @file frame.hpp
 * @brief Length-prefixed framing for header, ack and control messages
 *
 * WIRE FORMAT:
 * [length N: 8 bytes, big-endian unsigned] [payload: N bytes]
 *
 * Streams deliver bytes in arbitrary fragments, so decoding is incremental:
 * feed() whatever arrived, then call next() until it reports that no
 * complete frame is buffered. A frame is never handed out before all of
 * its 8+N bytes are present.
 */

#include "dxfer/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace dxfer::protocol {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t kLengthPrefixSize = 8;
inline constexpr std::size_t kDefaultMaxFramePayload = 1024 * 1024;

void write_be64(Bytes& out, std::uint64_t value);
std::uint64_t read_be64(const std::uint8_t* data);

/**
 * @brief Prepend the 8-byte big-endian length of payload
 */
Bytes encode_frame(const Bytes& payload);

/**
 * @brief Incremental frame decoder
 *
 * Usage:
 * ```cpp
 * FrameDecoder decoder;
 * decoder.feed(data, len);
 * auto frame = decoder.next();
 * if (frame.is_error()) { ... }           // declared length too large
 * if (frame.value()) { handle(*frame.value()); }
 * ```
 */
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_payload = kDefaultMaxFramePayload);

    void feed(const std::uint8_t* data, std::size_t len);
    void feed(const Bytes& data) { feed(data.data(), data.size()); }

    /**
     * @brief Extract the next complete frame payload, if any
     *
     * @return nullopt while more bytes are needed; an error once a length
     *         prefix larger than the configured maximum has been seen
     */
    Result<std::optional<Bytes>> next();

    /**
     * @brief Hand out every byte buffered after the last decoded frame
     *
     * Used when a stream switches from framed messages to raw payload
     * (the receiver after the header frame).
     */
    Bytes take_remainder();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - offset_; }
    [[nodiscard]] std::size_t max_payload() const noexcept { return max_payload_; }

private:
    void compact();

    Bytes buffer_;
    std::size_t offset_ = 0;
    std::size_t max_payload_;
};

} // namespace dxfer::protocol

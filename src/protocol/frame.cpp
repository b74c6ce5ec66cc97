#include "dxfer/protocol/frame.hpp"

#include <string>

namespace dxfer::protocol {

void write_be64(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

std::uint64_t read_be64(const std::uint8_t* data) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < kLengthPrefixSize; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(data[i]);
    }
    return value;
}

Bytes encode_frame(const Bytes& payload) {
    Bytes out;
    out.reserve(kLengthPrefixSize + payload.size());
    write_be64(out, static_cast<std::uint64_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

FrameDecoder::FrameDecoder(std::size_t max_payload)
    : max_payload_(max_payload) {
}

void FrameDecoder::feed(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    compact();
    buffer_.insert(buffer_.end(), data, data + len);
}

Result<std::optional<Bytes>> FrameDecoder::next() {
    const std::size_t have = buffered();
    if (have < kLengthPrefixSize) {
        return Ok(std::optional<Bytes>{});
    }

    const std::uint64_t declared = read_be64(buffer_.data() + offset_);
    if (declared > max_payload_) {
        return Err<std::optional<Bytes>>(ErrorKind::ProtocolViolation,
            "frame length " + std::to_string(declared) +
            " exceeds limit of " + std::to_string(max_payload_) + " bytes");
    }

    const auto payload_size = static_cast<std::size_t>(declared);
    if (have < kLengthPrefixSize + payload_size) {
        return Ok(std::optional<Bytes>{});
    }

    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset_ + kLengthPrefixSize);
    Bytes payload(begin, begin + static_cast<std::ptrdiff_t>(payload_size));
    offset_ += kLengthPrefixSize + payload_size;
    return Ok(std::optional<Bytes>(std::move(payload)));
}

Bytes FrameDecoder::take_remainder() {
    Bytes rest(buffer_.begin() + static_cast<std::ptrdiff_t>(offset_), buffer_.end());
    buffer_.clear();
    offset_ = 0;
    return rest;
}

void FrameDecoder::compact() {
    if (offset_ == 0) {
        return;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
}

} // namespace dxfer::protocol

#pragma once

/**
 * @file messages.hpp
 * @brief Typed payloads carried inside frames
 *
 * Each message is encoded as a compact JSON object. Decoding validates
 * the full shape: missing keys, wrongly typed values and unknown keys are
 * rejected as protocol violations, so callers never probe a loose map.
 *
 * HEADER  (sender -> receiver, first frame of a transfer stream)
 *   {"type":"file","name":"a.bin","size":3}
 * ACK     (receiver -> sender, last frame of a transfer stream)
 *   {"ack":"ok","sha256":"<64 lowercase hex chars>"}
 * CONTROL (sender -> receiver, once per session on the control stream)
 *   {"done":"done"}
 */

#include "dxfer/core/result.hpp"
#include "dxfer/protocol/frame.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dxfer::protocol {

inline constexpr const char* kFileType = "file";
inline constexpr const char* kAckOk = "ok";
inline constexpr const char* kDone = "done";

struct Header {
    std::string type = kFileType;
    std::string name;
    std::uint64_t size = 0;
    std::optional<std::string> compression;  ///< Always rejected by decode_header()

    static Header for_file(std::string file_name, std::uint64_t file_size) {
        Header header;
        header.name = std::move(file_name);
        header.size = file_size;
        return header;
    }
};

struct Ack {
    std::string ack = kAckOk;
    std::string sha256;
};

enum class ControlKind {
    Done
};

struct ControlMessage {
    ControlKind kind = ControlKind::Done;

    static ControlMessage done() { return ControlMessage{ControlKind::Done}; }
};

Bytes encode_header(const Header& header);
Bytes encode_ack(const Ack& ack);
Bytes encode_control(const ControlMessage& message);

/**
 * @brief Decode and validate a header payload
 *
 * Rejects: non-object payloads, unknown keys, a type other than "file",
 * any compression field, a size that is not a non-negative integer.
 */
Result<Header> decode_header(const Bytes& payload);

/**
 * @brief Decode an ack payload
 *
 * Only the shape is validated here. Whether ack == "ok" and whether the
 * digest matches is the sender's decision, in that order.
 */
Result<Ack> decode_ack(const Bytes& payload);

Result<ControlMessage> decode_control(const Bytes& payload);

} // namespace dxfer::protocol

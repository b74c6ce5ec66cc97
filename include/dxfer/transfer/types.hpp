#pragma once

#include <cstdint>
#include <string>

namespace dxfer::transfer {

enum class ReceiveState {
    AwaitingHeader,
    Streaming,
    Complete,
    Failed
};

enum class SendState {
    SendingHeader,
    Streaming,
    AwaitingAck,
    Complete,
    Failed
};

const char* to_string(ReceiveState state);
const char* to_string(SendState state);

/**
 * @brief Point-in-time view of one transfer, used for events and reports
 */
struct TransferInfo {
    std::string name;               ///< Name from the header
    std::string destination;        ///< Receive side: resolved target path
    std::uint64_t size = 0;         ///< Declared size
    std::uint64_t transferred = 0;  ///< Payload bytes hashed so far
    std::string sha256;             ///< Populated once the digest is final
    std::string last_error;         ///< Populated when the transfer failed
};

} // namespace dxfer::transfer

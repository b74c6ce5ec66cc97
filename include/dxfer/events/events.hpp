/**
 * @file events.hpp
 * @brief Event types emitted while transferring files
 *
 * NAMING CONVENTION:
 * Events are past-tense: TransferStartedEvent, TransferFailedEvent
 */

#pragma once

#include "dxfer/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace dxfer::events {

enum class Direction {
    Send,
    Receive
};

inline const char* to_string(Direction direction) {
    return direction == Direction::Send ? "send" : "receive";
}

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief A header was sent (send side) or accepted (receive side)
 */
struct TransferStartedEvent {
    Direction direction;
    std::string stream;
    std::string name;
    std::string destination;  ///< Receive side only
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferProgressEvent {
    Direction direction;
    std::string name;
    std::uint64_t transferred = 0;
    std::uint64_t size = 0;
};

/**
 * @brief Emitted once the ack was verified (send) or written (receive)
 */
struct TransferCompletedEvent {
    Direction direction;
    std::string name;
    std::string destination;
    std::uint64_t size = 0;
    std::string sha256;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    Direction direction;
    std::string stream;
    std::string name;   ///< Empty when the header never arrived
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

struct ControlMessageReceivedEvent {
    std::string message;
};

/**
 * @brief Emitted when a sending or receiving session reached its end
 */
struct SessionFinishedEvent {
    Direction direction;
    std::size_t files_completed = 0;
    std::uint64_t bytes = 0;
    bool ok = true;
    std::string error_message;  ///< Populated when ok == false
    std::chrono::milliseconds duration{0};
};

} // namespace dxfer::events

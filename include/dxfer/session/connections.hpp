#pragma once

#include "dxfer/core/completion.hpp"
#include "dxfer/core/context.hpp"
#include "dxfer/transfer/receiver.hpp"
#include "dxfer/transfer/sender.hpp"
#include "dxfer/transport/stream.hpp"

#include <array>
#include <chrono>
#include <memory>

namespace dxfer::session {

using TransferCompletion = Completion<transfer::TransferInfo>;

/**
 * @brief Drives a ReceiveStateMachine over one accepted stream
 *
 * Lifecycle:
 * 1. Created by the acceptor for each inbound stream
 * 2. start() begins the async read chain
 * 3. Read handlers feed the state machine; the ack is written once it
 *    reports completion
 * 4. Destroyed when the stream is closed and no handler holds it
 *
 * done() fires once: with the transfer info after the ack was written, or
 * with the error that failed the stream. A failed stream is closed
 * without an ack. A stream closed locally before the transfer completed
 * fails with PrematureClose, so done() always fires once the stream is
 * closed.
 */
class ReceiveConnection : public std::enable_shared_from_this<ReceiveConnection> {
public:
    ReceiveConnection(Context ctx, transport::StreamPtr stream, transfer::SinkProvider& sinks);

    void start();

    [[nodiscard]] std::shared_ptr<TransferCompletion> done() const { return done_; }
    [[nodiscard]] const transfer::ReceiveStateMachine& machine() const noexcept { return machine_; }

private:
    void do_read();
    void on_read(std::size_t bytes_transferred);
    void do_write_ack(protocol::Bytes ack_frame);
    void handle_close();
    void handle_abort();
    void handle_error(Error error);

    Context ctx_;
    transport::StreamPtr stream_;
    transfer::ReceiveStateMachine machine_;
    std::shared_ptr<TransferCompletion> done_;
    std::array<std::uint8_t, 64 * 1024> buffer_{};
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
    bool announced_ = false;
    bool finished_ = false;
};

/**
 * @brief Drives a SendStateMachine over one outbound stream
 *
 * The header is written first, then the payload one chunk at a time,
 * each write issued from the previous write's completion handler. The ack
 * is read concurrently. done() fires once the ack was verified and the
 * stream closed, or with the first error.
 */
class SendConnection : public std::enable_shared_from_this<SendConnection> {
public:
    SendConnection(Context ctx,
                   transport::StreamPtr stream,
                   std::unique_ptr<transfer::SendStateMachine> machine);

    void start();

    [[nodiscard]] std::shared_ptr<TransferCompletion> done() const { return done_; }
    [[nodiscard]] const transfer::SendStateMachine& machine() const noexcept { return *machine_; }

private:
    void do_write(protocol::Bytes data);
    void write_next_chunk();
    void do_read();
    void on_read(std::size_t bytes_transferred);
    void handle_close();
    void handle_error(Error error);

    Context ctx_;
    transport::StreamPtr stream_;
    std::unique_ptr<transfer::SendStateMachine> machine_;
    std::shared_ptr<TransferCompletion> done_;
    std::array<std::uint8_t, 4096> buffer_{};
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
    bool finished_ = false;
};

} // namespace dxfer::session

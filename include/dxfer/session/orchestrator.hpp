#pragma once

#include "dxfer/core/completion.hpp"
#include "dxfer/core/context.hpp"
#include "dxfer/session/connections.hpp"
#include "dxfer/session/control_channel.hpp"
#include "dxfer/transfer/file_io.hpp"
#include "dxfer/transfer/sender.hpp"
#include "dxfer/transport/stream.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace dxfer::session {

/**
 * @brief Outcome of a whole sending or receiving session
 */
struct SessionReport {
    std::vector<transfer::TransferInfo> completed;
    std::vector<transfer::TransferInfo> failed;   ///< Receive side: streams that failed on their own
    std::uint64_t bytes = 0;

    [[nodiscard]] std::size_t files_completed() const noexcept { return completed.size(); }
};

using SessionCompletion = Completion<SessionReport>;

/**
 * @brief Sends files one after another, then signals "done"
 *
 * For each file in order: open one outbound stream, run a SendConnection
 * on it, and wait for its outcome before touching the next file. The
 * first failure stops the session; files after it are never opened.
 * When every file completed, {"done":"done"} goes out on the control
 * stream, then the transport is torn down.
 *
 * done() fires after teardown finished, with the report or the first
 * error.
 */
class SendingSession : public std::enable_shared_from_this<SendingSession> {
public:
    SendingSession(Context ctx,
                   std::shared_ptr<transport::Endpoints> endpoints,
                   std::vector<std::filesystem::path> files,
                   std::size_t chunk_size = transfer::SendStateMachine::kDefaultChunkSize);

    void start();

    [[nodiscard]] std::shared_ptr<SessionCompletion> done() const { return done_; }

private:
    void send_next();
    void on_stream_opened(Result<transport::StreamPtr> stream);
    void on_file_done(const Result<transfer::TransferInfo>& outcome);
    void send_done_signal();
    void teardown(Result<SessionReport> outcome);

    Context ctx_;
    std::shared_ptr<transport::Endpoints> endpoints_;
    std::vector<std::filesystem::path> files_;
    std::size_t chunk_size_;
    std::size_t next_index_ = 0;
    std::shared_ptr<ControlChannel> control_;
    std::unique_ptr<transfer::SendStateMachine> pending_;
    std::shared_ptr<SendConnection> current_;
    SessionReport report_;
    std::shared_ptr<SessionCompletion> done_;
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

/**
 * @brief Accepts inbound transfer streams until the peer signals "done"
 *
 * Every accepted stream gets its own ReceiveConnection; streams may
 * overlap. A failing stream is recorded in the report and affects no
 * other stream. When the control message arrives the transport is torn
 * down; done() fires once teardown finished and every accepted stream
 * reported. A stream still running at teardown is recorded as failed.
 *
 * The sink provider must outlive the session.
 */
class ReceivingSession : public std::enable_shared_from_this<ReceivingSession> {
public:
    ReceivingSession(Context ctx,
                     std::shared_ptr<transport::Endpoints> endpoints,
                     transfer::SinkProvider& sinks);

    void start();

    [[nodiscard]] std::shared_ptr<SessionCompletion> done() const { return done_; }
    [[nodiscard]] std::size_t streams_accepted() const noexcept { return accepted_; }

private:
    void on_accept(transport::StreamPtr stream);
    void on_transfer_done(const ReceiveConnection& connection,
                          const Result<transfer::TransferInfo>& outcome);
    void on_control(const Result<protocol::ControlMessage>& message);
    void teardown(Result<SessionReport> outcome);
    void maybe_finish();

    Context ctx_;
    std::shared_ptr<transport::Endpoints> endpoints_;
    transfer::SinkProvider& sinks_;
    std::shared_ptr<ControlChannel> control_;
    SessionReport report_;
    std::size_t accepted_ = 0;
    std::size_t active_ = 0;
    bool finishing_ = false;
    std::optional<Result<SessionReport>> closed_outcome_;
    std::shared_ptr<SessionCompletion> done_;
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

} // namespace dxfer::session

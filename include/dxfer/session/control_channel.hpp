#pragma once

#include "dxfer/core/completion.hpp"
#include "dxfer/core/context.hpp"
#include "dxfer/protocol/frame.hpp"
#include "dxfer/protocol/messages.hpp"
#include "dxfer/transport/stream.hpp"

#include <array>
#include <functional>
#include <memory>

namespace dxfer::session {

/**
 * @brief Session-level signalling over the control stream
 *
 * The sending side calls send(ControlMessage::done()) once every file is
 * through. The receiving side waits on message(), which fires with the
 * first control message, or with an error if the stream closes first or
 * carries something that is not a control message.
 *
 * Owns its own framing buffer; nothing else reads the control stream.
 */
class ControlChannel : public std::enable_shared_from_this<ControlChannel> {
public:
    using SendHandler = std::function<void(const Result<void>&)>;

    ControlChannel(Context ctx, transport::StreamPtr stream);

    /// Begin reading; needed only on the side that waits for a message
    void start();

    void send(const protocol::ControlMessage& message, SendHandler handler);

    [[nodiscard]] std::shared_ptr<Completion<protocol::ControlMessage>> message() const { return message_; }

private:
    void do_read();
    void on_read(std::size_t bytes_transferred);

    Context ctx_;
    transport::StreamPtr stream_;
    protocol::FrameDecoder decoder_;
    std::shared_ptr<Completion<protocol::ControlMessage>> message_;
    std::array<std::uint8_t, 1024> buffer_{};
    bool reading_ = false;
};

} // namespace dxfer::session

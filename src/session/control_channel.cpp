#include "dxfer/session/control_channel.hpp"

#include "dxfer/events/events.hpp"

#include <boost/asio/error.hpp>

namespace dxfer::session {

namespace asio = boost::asio;

ControlChannel::ControlChannel(Context ctx, transport::StreamPtr stream)
    : ctx_(std::move(ctx)),
      stream_(std::move(stream)),
      message_(std::make_shared<Completion<protocol::ControlMessage>>(ctx_.io)) {
}

void ControlChannel::start() {
    if (reading_) {
        return;
    }
    reading_ = true;
    do_read();
}

void ControlChannel::send(const protocol::ControlMessage& message, SendHandler handler) {
    auto frame = std::make_shared<const protocol::Bytes>(
        protocol::encode_frame(protocol::encode_control(message)));
    auto self = shared_from_this();

    stream_->async_write(frame,
        [this, self, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                handler(Err<void>(transport::to_error(ec, "control stream")));
                return;
            }
            ctx_.logger->debug("Control message sent");
            handler(Ok());
        });
}

void ControlChannel::do_read() {
    auto self = shared_from_this();

    stream_->async_read_some(asio::buffer(buffer_),
        [this, self](const boost::system::error_code& ec, std::size_t bytes_transferred) {
            if (message_->fired()) {
                return;
            }
            if (!ec) {
                on_read(bytes_transferred);
                return;
            }
            if (ec == asio::error::operation_aborted) {
                message_->fire(Err<protocol::ControlMessage>(ErrorKind::PrematureClose,
                    "control stream closed locally before a message arrived"));
                return;
            }
            message_->fire(Err<protocol::ControlMessage>(transport::to_error(ec, "control stream")));
        });
}

void ControlChannel::on_read(std::size_t bytes_transferred) {
    decoder_.feed(buffer_.data(), bytes_transferred);
    auto frame = decoder_.next();
    if (frame.is_error()) {
        message_->fire(Err<protocol::ControlMessage>(frame.error()));
        return;
    }
    if (!frame.value()) {
        do_read();
        return;
    }

    auto message = protocol::decode_control(*frame.value());
    if (message.is_error()) {
        message_->fire(Err<protocol::ControlMessage>(message.error()));
        return;
    }

    ctx_.emit(events::ControlMessageReceivedEvent{"done"});
    message_->fire(Ok(message.value()));
}

} // namespace dxfer::session

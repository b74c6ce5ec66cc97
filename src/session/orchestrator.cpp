#include "dxfer/session/orchestrator.hpp"

#include "dxfer/events/events.hpp"

namespace dxfer::session {

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

events::SessionFinishedEvent make_finished_event(events::Direction direction,
                                                 const SessionReport& report,
                                                 std::chrono::steady_clock::time_point started_at) {
    events::SessionFinishedEvent event;
    event.direction = direction;
    event.files_completed = report.files_completed();
    event.bytes = report.bytes;
    event.duration = elapsed_since(started_at);
    return event;
}

} // namespace

// ──────────────────────────────────────────────────────────
// SendingSession
// ──────────────────────────────────────────────────────────

SendingSession::SendingSession(Context ctx,
                               std::shared_ptr<transport::Endpoints> endpoints,
                               std::vector<std::filesystem::path> files,
                               std::size_t chunk_size)
    : ctx_(std::move(ctx)),
      endpoints_(std::move(endpoints)),
      files_(std::move(files)),
      chunk_size_(chunk_size),
      done_(std::make_shared<SessionCompletion>(ctx_.io)) {
}

void SendingSession::start() {
    control_ = std::make_shared<ControlChannel>(ctx_, endpoints_->control_stream());
    ctx_.logger->info("Sending {} file(s)", files_.size());
    send_next();
}

void SendingSession::send_next() {
    if (next_index_ == files_.size()) {
        send_done_signal();
        return;
    }

    const auto& path = files_[next_index_];
    auto source = transfer::FileSource::open(path);
    if (source.is_error()) {
        teardown(Err<SessionReport>(source.error()));
        return;
    }

    ctx_.logger->info("Sending {} ({} of {})", path.filename().string(), next_index_ + 1, files_.size());
    pending_ = std::make_unique<transfer::SendStateMachine>(std::move(source.value()), chunk_size_);

    auto self = shared_from_this();
    endpoints_->async_open_outbound([self](Result<transport::StreamPtr> stream) {
        self->on_stream_opened(std::move(stream));
    });
}

void SendingSession::on_stream_opened(Result<transport::StreamPtr> stream) {
    if (stream.is_error()) {
        teardown(Err<SessionReport>(stream.error()));
        return;
    }

    current_ = std::make_shared<SendConnection>(ctx_, stream.value(), std::move(pending_));
    auto self = shared_from_this();
    current_->done()->on_complete([self](const Result<transfer::TransferInfo>& outcome) {
        self->on_file_done(outcome);
    });
    current_->start();
}

void SendingSession::on_file_done(const Result<transfer::TransferInfo>& outcome) {
    current_.reset();

    if (outcome.is_error()) {
        const auto skipped = files_.size() - next_index_ - 1;
        if (skipped > 0) {
            ctx_.logger->warn("Aborting session, {} remaining file(s) not sent", skipped);
        }
        teardown(Err<SessionReport>(outcome.error()));
        return;
    }

    ctx_.logger->info("Send of {} done", outcome.value().name);
    report_.bytes += outcome.value().size;
    report_.completed.push_back(outcome.value());
    ++next_index_;
    send_next();
}

void SendingSession::send_done_signal() {
    auto self = shared_from_this();
    control_->send(protocol::ControlMessage::done(), [self](const Result<void>& sent) {
        if (sent.is_error()) {
            self->teardown(Err<SessionReport>(sent.error()));
            return;
        }
        self->teardown(Ok(self->report_));
    });
}

void SendingSession::teardown(Result<SessionReport> outcome) {
    auto event = make_finished_event(events::Direction::Send, report_, started_at_);
    if (outcome.is_error()) {
        event.ok = false;
        event.error_message = outcome.error().describe();
    }

    auto self = shared_from_this();
    endpoints_->async_close([self, outcome, event](const Result<void>& closed) {
        self->ctx_.emit(event);
        if (outcome.is_ok() && closed.is_error()) {
            self->done_->fire(Err<SessionReport>(closed.error()));
            return;
        }
        self->done_->fire(outcome);
    });
}

// ──────────────────────────────────────────────────────────
// ReceivingSession
// ──────────────────────────────────────────────────────────

ReceivingSession::ReceivingSession(Context ctx,
                                   std::shared_ptr<transport::Endpoints> endpoints,
                                   transfer::SinkProvider& sinks)
    : ctx_(std::move(ctx)),
      endpoints_(std::move(endpoints)),
      sinks_(sinks),
      done_(std::make_shared<SessionCompletion>(ctx_.io)) {
}

void ReceivingSession::start() {
    auto self = shared_from_this();

    control_ = std::make_shared<ControlChannel>(ctx_, endpoints_->control_stream());
    control_->message()->on_complete([self](const Result<protocol::ControlMessage>& message) {
        self->on_control(message);
    });
    control_->start();

    endpoints_->listen([self](transport::StreamPtr stream) {
        self->on_accept(std::move(stream));
    });
    ctx_.logger->info("Waiting for files");
}

void ReceivingSession::on_accept(transport::StreamPtr stream) {
    if (finishing_) {
        stream->close();
        return;
    }
    ++accepted_;
    ++active_;

    auto connection = std::make_shared<ReceiveConnection>(ctx_, std::move(stream), sinks_);
    auto self = shared_from_this();
    // Held until done fires; the connection may be gone by the time the handler runs otherwise
    connection->done()->on_complete([self, connection](const Result<transfer::TransferInfo>& outcome) {
        self->on_transfer_done(*connection, outcome);
    });
    connection->start();
}

void ReceivingSession::on_transfer_done(const ReceiveConnection& connection,
                                        const Result<transfer::TransferInfo>& outcome) {
    --active_;
    if (outcome.is_ok()) {
        report_.bytes += outcome.value().size;
        report_.completed.push_back(outcome.value());
    } else {
        transfer::TransferInfo failed = connection.machine().info();
        failed.last_error = outcome.error().describe();
        report_.failed.push_back(std::move(failed));
    }
    maybe_finish();
}

void ReceivingSession::on_control(const Result<protocol::ControlMessage>& message) {
    if (message.is_error()) {
        teardown(Err<SessionReport>(message.error()));
        return;
    }
    ctx_.logger->info("Peer finished sending");
    teardown(Ok(report_));
}

void ReceivingSession::teardown(Result<SessionReport> outcome) {
    finishing_ = true;

    auto self = shared_from_this();
    endpoints_->async_close([self, outcome](const Result<void>& closed) {
        Result<SessionReport> final_outcome = outcome;
        if (final_outcome.is_ok() && closed.is_error()) {
            final_outcome = Err<SessionReport>(closed.error());
        }
        self->closed_outcome_.emplace(std::move(final_outcome));
        self->maybe_finish();
    });
}

void ReceivingSession::maybe_finish() {
    // Every stream closed by teardown still reports, as completed or failed
    if (!closed_outcome_ || active_ > 0 || done_->fired()) {
        return;
    }
    Result<SessionReport> final_outcome = *closed_outcome_;
    if (final_outcome.is_ok()) {
        final_outcome = Ok(report_);
    }

    auto event = make_finished_event(events::Direction::Receive, report_, started_at_);
    if (final_outcome.is_error()) {
        event.ok = false;
        event.error_message = final_outcome.error().describe();
    }
    ctx_.emit(event);
    done_->fire(final_outcome);
}

} // namespace dxfer::session

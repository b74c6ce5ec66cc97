/**
 * @file components.hpp
 * @brief Event-driven components attached to a transfer session
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus, spdlog::default_logger());
 * MetricsComponent metrics(bus);
 * // Components react to transfer events from here on
 */

#pragma once

#include "dxfer/events/event_bus.hpp"
#include "dxfer/events/events.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>

namespace dxfer::events {

/**
 * @brief Logs every transfer and session event through spdlog
 */
class LoggerComponent {
public:
    LoggerComponent(EventBus& bus, std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {
        bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        bus.subscribe<TransferProgressEvent>([this](const TransferProgressEvent& e) {
            on_transfer_progress(e);
        });

        bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });

        bus.subscribe<ControlMessageReceivedEvent>([this](const ControlMessageReceivedEvent& e) {
            logger_->info("[Control] received {}", e.message);
        });

        bus.subscribe<SessionFinishedEvent>([this](const SessionFinishedEvent& e) {
            on_session_finished(e);
        });
    }

private:
    void on_transfer_started(const TransferStartedEvent& e) {
        if (e.direction == Direction::Send) {
            logger_->info("[SendStarted] stream={} name={} bytes={}", e.stream, e.name, e.size);
        } else {
            logger_->info("[ReceiveStarted] stream={} name={} bytes={} into={}",
                          e.stream, e.name, e.size, e.destination);
        }
    }

    void on_transfer_progress(const TransferProgressEvent& e) {
        logger_->debug("[Progress] {} name={} {}/{} bytes",
                       to_string(e.direction), e.name, e.transferred, e.size);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        logger_->info("[{}Completed] name={} bytes={} sha256={} duration={}ms",
                      e.direction == Direction::Send ? "Send" : "Receive",
                      e.destination.empty() ? e.name : e.destination,
                      e.size, e.sha256, e.duration.count());
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        logger_->error("[{}Failed] stream={} name={} {}",
                       e.direction == Direction::Send ? "Send" : "Receive",
                       e.stream, e.name.empty() ? "<no header>" : e.name, e.error.describe());
    }

    void on_session_finished(const SessionFinishedEvent& e) {
        if (e.ok) {
            logger_->info("[SessionFinished] {} files={} bytes={} duration={}ms",
                          to_string(e.direction), e.files_completed, e.bytes, e.duration.count());
        } else {
            logger_->error("[SessionFailed] {} files={} bytes={} error={}",
                           to_string(e.direction), e.files_completed, e.bytes, e.error_message);
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Counts completed and failed transfers
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::uint64_t files_sent = 0;
        std::uint64_t bytes_sent = 0;
        std::uint64_t files_received = 0;
        std::uint64_t bytes_received = 0;
        std::uint64_t transfers_failed = 0;
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            if (e.direction == Direction::Send) {
                ++stats_.files_sent;
                stats_.bytes_sent += e.size;
            } else {
                ++stats_.files_received;
                stats_.bytes_received += e.size;
            }
        });

        bus.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            ++stats_.transfers_failed;
        });
    }

    const Stats& get_stats() const { return stats_; }

private:
    Stats stats_;
};

} // namespace dxfer::events

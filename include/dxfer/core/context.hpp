#pragma once

#include "dxfer/events/event_bus.hpp"

#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace dxfer {

/**
 * @brief Execution context handed to every session component
 *
 * Components never reach for a process-wide reactor or logger; they use
 * the ones carried here. The event bus is optional.
 */
struct Context {
    boost::asio::io_context& io;
    std::shared_ptr<spdlog::logger> logger;
    events::EventBus* bus = nullptr;

    explicit Context(boost::asio::io_context& io_context,
                     std::shared_ptr<spdlog::logger> log = spdlog::default_logger(),
                     events::EventBus* event_bus = nullptr)
        : io(io_context), logger(std::move(log)), bus(event_bus) {}

    template<typename EventType>
    void emit(const EventType& event) const {
        if (bus) {
            bus->emit(event);
        }
    }
};

} // namespace dxfer

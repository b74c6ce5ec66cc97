#pragma once

#include "dxfer/core/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace dxfer {

/**
 * @brief Single-assignment completion signal
 *
 * Carries exactly one terminal value (success or error) for a transfer or
 * a session. The first fire() wins; later calls are ignored and report
 * false. Waiters registered before or after the value arrived all receive
 * the same result.
 *
 * Handlers never run inside fire() or on_complete(): they are posted to the
 * io_context, so a state machine can fire while it is still unwinding its
 * own callback.
 *
 * Usage:
 * ```cpp
 * auto done = std::make_shared<Completion<void>>(io);
 * done->on_complete([](const Result<void>& r) { ... });
 * done->fire(Ok());
 * ```
 */
template<typename T>
class Completion {
public:
    using Handler = std::function<void(const Result<T>&)>;

    explicit Completion(boost::asio::io_context& io) : io_(io) {}

    Completion(const Completion&) = delete;
    Completion& operator=(const Completion&) = delete;

    bool fire(Result<T> result) {
        if (result_) {
            return false;
        }
        result_.emplace(std::move(result));
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto& waiter : waiters) {
            deliver(std::move(waiter));
        }
        return true;
    }

    void on_complete(Handler handler) {
        if (result_) {
            deliver(std::move(handler));
        } else {
            waiters_.push_back(std::move(handler));
        }
    }

    [[nodiscard]] bool fired() const noexcept { return result_.has_value(); }

    /// Only valid once fired() is true.
    [[nodiscard]] const Result<T>& result() const { return *result_; }

private:
    void deliver(Handler handler) {
        // Copy of the result is bound so the handler outlives this object safely
        boost::asio::post(io_, [handler = std::move(handler), result = *result_]() {
            handler(result);
        });
    }

    boost::asio::io_context& io_;
    std::optional<Result<T>> result_;
    std::vector<Handler> waiters_;
};

} // namespace dxfer

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "covertrax/error.hpp"

namespace covertrax {

    /**
     * @brief Cooperative cancellation handle with an optional deadline
     *
     * Copies share one cancel flag, so the caller can keep a copy and cancel a
     * run (e.g. on client disconnect) while stages poll their own copy. Each
     * copy may carry its own deadline; with_deadline() never extends an
     * existing one.
     */
    class CancelToken {
      public:
        using Clock = std::chrono::steady_clock;

        CancelToken() : state_(std::make_shared<State>()) {}

        static CancelToken with_timeout(std::chrono::milliseconds timeout) {
            CancelToken token;
            if (timeout.count() > 0) {
                token.deadline_ = Clock::now() + timeout;
            }
            return token;
        }

        /**
         * @brief Token sharing this cancel flag, expiring at the earlier deadline
         */
        CancelToken with_deadline(Clock::time_point deadline) const {
            CancelToken token = *this;
            if (!token.deadline_ || deadline < *token.deadline_) {
                token.deadline_ = deadline;
            }
            return token;
        }

        void cancel() { state_->cancelled.store(true, std::memory_order_release); }

        bool cancelled() const { return state_->cancelled.load(std::memory_order_acquire); }

        bool expired() const { return deadline_ && Clock::now() >= *deadline_; }

        bool stop_requested() const { return cancelled() || expired(); }

        const std::optional<Clock::time_point> &deadline() const { return deadline_; }

        /**
         * @brief Throw TimeoutError if the run must stop
         *
         * @param where Stage or operation name used in the error reason
         */
        void throw_if_stopped(const std::string &where) const {
            if (cancelled()) {
                throw TimeoutError(where + ": cancelled by caller");
            }
            if (expired()) {
                throw TimeoutError(where + ": deadline exceeded");
            }
        }

      private:
        struct State {
            std::atomic<bool> cancelled{false};
        };

        std::shared_ptr<State> state_;
        std::optional<Clock::time_point> deadline_;
    };

} // namespace covertrax

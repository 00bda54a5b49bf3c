#ifndef MONTECARLO_CANCELLATION_HPP
#define MONTECARLO_CANCELLATION_HPP

#include <montecarlo/errors.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace montecarlo {

/**
 * Shared stop flag with an optional deadline.
 *
 * Copies observe the same state, so a job can keep its own copy alive after
 * the engine has abandoned the step it belongs to.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : state_(std::make_shared<State>()) {}

    explicit CancellationToken(Clock::time_point deadline) : state_(std::make_shared<State>()) {
        state_->deadline = deadline;
    }

    void request_stop() const {
        state_->stop.store(true, std::memory_order_release);
    }

    bool stop_requested() const {
        if (state_->stop.load(std::memory_order_acquire)) return true;
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

    bool deadline_passed() const {
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

    void throw_if_cancelled() const {
        if (stop_requested()) throw AbortedException();
    }

    std::optional<Clock::time_point> deadline() const { return state_->deadline; }

private:
    struct State {
        std::atomic<bool> stop{false};
        std::optional<Clock::time_point> deadline;
    };

    std::shared_ptr<State> state_;
};

} // namespace montecarlo

#endif // MONTECARLO_CANCELLATION_HPP

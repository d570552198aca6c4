#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <algorithm>

namespace tsimport {
namespace utils {

// Deadline plus cancellation flag handed to every remote call.
// Copies share the same flag, so cancelling any copy cancels all of them.
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    static RequestContext background() { return RequestContext(); }

    static RequestContext with_timeout(std::chrono::milliseconds timeout) {
        RequestContext ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    // Child context sharing the cancellation flag, with its own deadline
    RequestContext with_deadline(Clock::time_point deadline) const {
        RequestContext child(*this);
        if (!child.deadline_ || deadline < *child.deadline_) {
            child.deadline_ = deadline;
        }
        return child;
    }

    void cancel() { cancelled_->store(true); }

    bool is_cancelled() const { return cancelled_->load(); }

    bool expired() const {
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    bool done() const { return is_cancelled() || expired(); }

    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    // Time left before the deadline, or fallback when there is none
    std::chrono::milliseconds remaining(std::chrono::milliseconds fallback) const {
        if (!deadline_) {
            return fallback;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        if (left.count() < 0) {
            return std::chrono::milliseconds(0);
        }
        return std::min(left, fallback);
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace utils
} // namespace tsimport

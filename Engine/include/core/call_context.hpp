/**
 * @file call_context.hpp
 * @brief Per-call timeout and cancellation propagated into native drivers
 */

#pragma once

#include <utils/time.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <utility>

namespace Omnidb {

/**
 * @brief Shared cancellation flag.
 *
 * Copies share the same flag, so the caller keeps one copy and hands another
 * to the call. Drivers poll it from their progress/interrupt hooks.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Timeout and cancellation for one call.
 *
 * A zero timeout means "no deadline". The deadline is fixed when the context
 * is armed at the start of the call.
 */
class CallContext {
public:
    using Clock = Timer::Clock;

    CallContext() = default;
    explicit CallContext(std::chrono::milliseconds timeout, CancellationToken token = {})
        : timeout_(timeout), token_(std::move(token)) {}

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    const CancellationToken& token() const noexcept { return token_; }

    /**
     * @brief Copy with the deadline computed from now.
     */
    CallContext armed() const {
        CallContext copy = *this;
        if (timeout_.count() > 0) copy.deadline_ = Clock::now() + timeout_;
        return copy;
    }

    std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

    bool cancelled() const noexcept { return token_.cancelled(); }
    bool expired() const noexcept { return deadline_ && Clock::now() >= *deadline_; }
    bool should_stop() const noexcept { return cancelled() || expired(); }

    /**
     * @brief Milliseconds left before the deadline, or the full timeout if
     * the context was never armed. Zero means unbounded.
     */
    long long remaining_ms() const noexcept {
        if (deadline_) return Timer::ms_until(*deadline_);
        return timeout_.count();
    }

private:
    std::chrono::milliseconds timeout_{0};
    CancellationToken token_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace Omnidb

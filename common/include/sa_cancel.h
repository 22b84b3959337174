#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <sa_defs.h>

namespace sa {

/**
 * Cancellation token shared between the caller of a long operation and the operation itself.
 * It may also carry a deadline which bounds every operation it is passed to.
 * Thread-safe.
 */
class cancel_context {
public:
    using clock = std::chrono::steady_clock;
    using subscription_id = size_t;

    cancel_context() = default;
    explicit cancel_context(clock::time_point deadline);
    ~cancel_context() = default;

    cancel_context(const cancel_context &) = delete;
    cancel_context &operator=(const cancel_context &) = delete;
    cancel_context(cancel_context &&) = delete;
    cancel_context &operator=(cancel_context &&) = delete;

    /**
     * Cancel the context. All the subscribers are notified once.
     * Calling it several times is harmless.
     */
    void cancel();

    /**
     * @return true if `cancel()` has been called
     */
    [[nodiscard]] bool is_cancelled() const;

    /**
     * @return true if the context is cancelled or its deadline has passed
     */
    [[nodiscard]] bool is_done() const;

    /**
     * @return the deadline, if any
     */
    [[nodiscard]] std::optional<clock::time_point> deadline() const;

    /**
     * Register a callback to be raised on cancellation.
     * If the context is already cancelled, the callback is raised immediately.
     * The callback is raised with the internal lock held, so it must not call back into the context.
     * @return subscription id to pass to `unsubscribe`
     */
    subscription_id subscribe(std::function<void()> cb);

    /**
     * Remove a callback. After this returns the callback is guaranteed not to be running.
     */
    void unsubscribe(subscription_id id);

private:
    struct subscriber {
        subscription_id id;
        std::function<void()> cb;
    };

    std::optional<clock::time_point> m_deadline;
    mutable std::mutex m_mtx;
    bool m_cancelled = false;
    subscription_id m_next_id = 0;
    std::list<subscriber> m_subscribers;
};

} // namespace sa

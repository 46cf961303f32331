#pragma once

/**
 * @file Context.hpp
 * @brief Cancellation and deadline propagation for driver calls.
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sqlbridge {

/**
 * @class Context
 * @brief Cancellation flag plus optional deadline, chained to a parent.
 *
 * A context is done when cancel() was called on it or any ancestor, or when
 * the earliest deadline in the chain has passed. Deadlines are observed by
 * polling isDone() (the SQLite progress handler) or pushed to the server
 * (PostgreSQL statement_timeout); explicit cancellation also fires the
 * registered callbacks so a blocked server call can be interrupted.
 *
 * Usage:
 * @code
 *   auto root = Context::background();
 *   auto attempt = Context::withTimeout(root, std::chrono::seconds(30));
 *   auto tx = driver.beginTransaction(attempt);
 * @endcode
 *
 * Thread Safety:
 * - All methods are thread-safe; callbacks run on the cancelling thread.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    static std::shared_ptr<Context> background();
    static std::shared_ptr<Context> withCancel(const std::shared_ptr<Context>& parent);
    static std::shared_ptr<Context> withTimeout(const std::shared_ptr<Context>& parent,
                                                std::chrono::milliseconds timeout);

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void cancel();

    bool isCancelled() const { return m_cancelled.load(); }
    bool isDone() const;

    // "context cancelled" or "context deadline exceeded"; empty while running
    std::string reason() const;

    // Earliest deadline of this context and its ancestors
    std::optional<Clock::time_point> deadline() const;

    // Time left before the deadline, clamped at zero
    std::optional<std::chrono::milliseconds> remaining() const;

    // Runs immediately if already cancelled. Returns an id for removeCallback.
    size_t onCancel(Callback callback);
    void removeCallback(size_t id);

private:
    Context(std::shared_ptr<Context> parent, std::optional<Clock::time_point> deadline);

    std::shared_ptr<Context> m_parent;
    std::optional<Clock::time_point> m_deadline;
    size_t m_parentCallbackId = 0;

    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    std::map<size_t, Callback> m_callbacks;
    size_t m_nextCallbackId = 1;
};

using ContextPtr = std::shared_ptr<Context>;

// Removes a callback registration when going out of scope
class CancelRegistration {
public:
    CancelRegistration(ContextPtr context, Context::Callback callback);
    ~CancelRegistration();

    CancelRegistration(const CancelRegistration&) = delete;
    CancelRegistration& operator=(const CancelRegistration&) = delete;

private:
    ContextPtr m_context;
    size_t m_id = 0;
};

}  // namespace sqlbridge

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>

namespace tether {

using TimerId = uint64_t;

/// Never returned by set_timeout()/set_interval(); safe to pass to cancel()
constexpr TimerId INVALID_TIMER = 0;

/**
 * @brief Single-threaded event loop port
 *
 * Every callback handed to a scheduler runs on the loop thread, one at a
 * time. Components of the connectivity core rely on that for mutual
 * exclusion and take no locks of their own.
 *
 * Implementations:
 * - HvEventScheduler: libhv hv::EventLoop (daemon)
 * - ManualScheduler: virtual clock advanced explicitly (unit tests)
 */
class EventScheduler {
  public:
    using Task = std::function<void()>;

    virtual ~EventScheduler() = default;

    /**
     * @brief Run @p task once after @p delay_ms
     * @return Id usable with cancel()
     */
    virtual TimerId set_timeout(uint32_t delay_ms, Task task) = 0;

    /**
     * @brief Run @p task every @p interval_ms until cancelled
     *
     * The first run happens one interval after registration.
     */
    virtual TimerId set_interval(uint32_t interval_ms, Task task) = 0;

    /**
     * @brief Cancel a pending timer; unknown or already-fired ids are ignored
     */
    virtual void cancel(TimerId id) = 0;

    /**
     * @brief Queue @p task to run on the loop thread as soon as possible
     *
     * Thread-safe: this is how worker threads hand results back to the loop.
     */
    virtual void post(Task task) = 0;

    /// Monotonic milliseconds, used for grace-period arithmetic
    virtual uint64_t now_ms() const = 0;
};

} // namespace tether

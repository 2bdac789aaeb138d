// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_scheduler.h"

#include "hv/EventLoop.h"

namespace tether {

/**
 * @brief EventScheduler on top of libhv's hv::EventLoop
 *
 * The loop is shared with the rest of the daemon (signal handling runs on the
 * same loop). Timer and post callbacks are wrapped so an escaping exception is
 * logged instead of unwinding through libhv.
 */
class HvEventScheduler : public EventScheduler {
  public:
    explicit HvEventScheduler(hv::EventLoopPtr loop);
    ~HvEventScheduler() override = default;

    TimerId set_timeout(uint32_t delay_ms, Task task) override;
    TimerId set_interval(uint32_t interval_ms, Task task) override;
    void cancel(TimerId id) override;
    void post(Task task) override;
    uint64_t now_ms() const override;

    const hv::EventLoopPtr& loop() const {
        return loop_;
    }

  private:
    hv::EventLoopPtr loop_;

    static void run_guarded(const Task& task, const char* origin);
};

} // namespace tether

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_scheduler_hv.h"

#include "spdlog/spdlog.h"

#include <chrono>

namespace tether {

HvEventScheduler::HvEventScheduler(hv::EventLoopPtr loop) : loop_(std::move(loop)) {
    spdlog::debug("[Scheduler] Using libhv event loop");
}

void HvEventScheduler::run_guarded(const Task& task, const char* origin) {
    if (!task) {
        return;
    }
    // Exceptions must never unwind into libhv's C event loop
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("[Scheduler] Exception in {} callback: {}", origin, e.what());
    }
}

TimerId HvEventScheduler::set_timeout(uint32_t delay_ms, Task task) {
    return loop_->setTimeout(static_cast<int>(delay_ms), [task = std::move(task)](hv::TimerID) {
        run_guarded(task, "timeout");
    });
}

TimerId HvEventScheduler::set_interval(uint32_t interval_ms, Task task) {
    return loop_->setInterval(static_cast<int>(interval_ms),
                              [task = std::move(task)](hv::TimerID) {
                                  run_guarded(task, "interval");
                              });
}

void HvEventScheduler::cancel(TimerId id) {
    if (id == INVALID_TIMER) {
        return;
    }
    loop_->killTimer(id);
}

void HvEventScheduler::post(Task task) {
    loop_->queueInLoop([task = std::move(task)]() { run_guarded(task, "posted"); });
}

uint64_t HvEventScheduler::now_ms() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

} // namespace tether

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nmcli_runner.h"

#include <atomic>
#include <memory>

class HThreadPool;

namespace tether {

class EventScheduler;

/**
 * @brief Runs the real nmcli binary
 *
 * Architecture:
 * - Each command is committed to a small HThreadPool (libhv)
 * - The worker fork/execs nmcli directly (no shell) with stdout/stderr piped
 * - The result is posted back to the event loop via EventScheduler::post()
 *
 * Commands are never killed once started: a caller that stops caring about a
 * result (timeout, abort) simply ignores the completion when it arrives.
 */
class NmcliRunnerProcess : public NmcliRunner {
  public:
    explicit NmcliRunnerProcess(EventScheduler& scheduler);
    ~NmcliRunnerProcess() override;

    void run(const std::vector<std::string>& args, Completion on_done) override;

    /// Blocking execution on the calling thread (worker threads only)
    static NmcliResult exec_blocking(const std::vector<std::string>& args);

  private:
    EventScheduler& scheduler_;
    std::unique_ptr<HThreadPool> thread_pool_;
    std::atomic<bool> shutdown_{false};
};

} // namespace tether

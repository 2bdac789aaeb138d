// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tether {

class EventScheduler;

/**
 * @brief Outcome of one nmcli invocation
 */
struct NmcliResult {
    bool spawned = false; ///< False if the process could not be started at all
    int exit_code = -1;   ///< Process exit status (-1 if killed or never ran)
    std::string out;      ///< Captured stdout
    std::string err;      ///< Captured stderr

    bool ok() const {
        return spawned && exit_code == 0;
    }

    /// Short description for logs and error causes
    std::string describe() const;
};

/**
 * @brief Driver port: asynchronous nmcli command execution
 *
 * run() returns immediately. The completion is always delivered on the event
 * loop thread (never synchronously from inside run()), so callers can treat
 * every driver call as a suspension point.
 *
 * Arguments are passed as an argv vector, never through a shell, so SSIDs and
 * passphrases need no quoting.
 *
 * Implementations:
 * - NmcliRunnerProcess: fork/exec of the real nmcli binary on a worker pool
 * - NmcliRunnerMock: in-memory NetworkManager simulation (--mock, unit tests)
 */
class NmcliRunner {
  public:
    using Completion = std::function<void(const NmcliResult&)>;

    virtual ~NmcliRunner() = default;

    /**
     * @brief Run `nmcli <args...>`
     * @param args Arguments after the program name
     * @param on_done Invoked once on the loop thread
     */
    virtual void run(const std::vector<std::string>& args, Completion on_done) = 0;

    /**
     * @brief Create the runner for this platform
     * @param scheduler Loop the completions are posted to
     * @param mock Use the simulated NetworkManager
     */
    static std::unique_ptr<NmcliRunner> create(EventScheduler& scheduler, bool mock);
};

/// Render an argv for logging ("nmcli -t -f SSID device wifi list"), passphrases masked
std::string format_nmcli_command(const std::vector<std::string>& args);

} // namespace tether

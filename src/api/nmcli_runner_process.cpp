// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file nmcli_runner_process.cpp
 * @brief fork/exec nmcli on a worker pool, deliver results on the event loop
 *
 * @threading run() is called on the loop thread; exec_blocking() runs on
 *            HThreadPool workers; completions are posted back to the loop
 * @gotchas Never touch the caller's state from a worker - only the posted
 *          completion may do that
 */

#include "nmcli_runner_process.h"

#include "event_scheduler.h"
#include "nmcli_runner_mock.h"

#include "spdlog/spdlog.h"

#include <hv/hthreadpool.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tether {

static constexpr int MIN_WORKER_THREADS = 1;
static constexpr int MAX_WORKER_THREADS = 4; // scan + status + long-running activation

/// Exit status the child uses when execvp() itself fails
static constexpr int EXEC_FAILED_EXIT = 127;

// ============================================================================
// Helpers
// ============================================================================

std::string NmcliResult::describe() const {
    if (!spawned) {
        return err.empty() ? "nmcli could not be started" : err;
    }
    std::string trimmed = err;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    if (trimmed.empty()) {
        return "nmcli exited with code " + std::to_string(exit_code);
    }
    return trimmed;
}

std::string format_nmcli_command(const std::vector<std::string>& args) {
    std::string cmd = "nmcli";
    bool mask_next = false;
    for (const auto& arg : args) {
        cmd += ' ';
        if (mask_next) {
            // Never log passphrases
            cmd += "********";
        } else if (arg.find(' ') != std::string::npos || arg.empty()) {
            cmd += '"' + arg + '"';
        } else {
            cmd += arg;
        }
        mask_next = (arg == "wifi-sec.psk");
    }
    return cmd;
}

std::unique_ptr<NmcliRunner> NmcliRunner::create(EventScheduler& scheduler, bool mock) {
    if (mock) {
        spdlog::info("[Nmcli] Using simulated NetworkManager (mock mode)");
        auto mock_runner = std::make_unique<NmcliRunnerMock>(scheduler);
        mock_runner->seed_demo_environment();
        return mock_runner;
    }
    spdlog::debug("[Nmcli] Using nmcli process runner");
    return std::make_unique<NmcliRunnerProcess>(scheduler);
}

// ============================================================================
// Lifecycle
// ============================================================================

NmcliRunnerProcess::NmcliRunnerProcess(EventScheduler& scheduler)
    : scheduler_(scheduler),
      thread_pool_(std::make_unique<HThreadPool>(MIN_WORKER_THREADS, MAX_WORKER_THREADS)) {
    thread_pool_->start(MIN_WORKER_THREADS);
    spdlog::debug("[Nmcli] Runner started with {}-{} worker threads", MIN_WORKER_THREADS,
                  MAX_WORKER_THREADS);
}

NmcliRunnerProcess::~NmcliRunnerProcess() {
    shutdown_ = true;
    if (thread_pool_) {
        // Waits for commands already executing; queued ones are dropped
        thread_pool_->stop();
        thread_pool_.reset();
    }
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[Nmcli] Runner destroyed\n");
}

// ============================================================================
// Execution
// ============================================================================

void NmcliRunnerProcess::run(const std::vector<std::string>& args, Completion on_done) {
    spdlog::trace("[Nmcli] queue: {}", format_nmcli_command(args));

    if (shutdown_) {
        NmcliResult result;
        result.err = "nmcli runner is shut down";
        scheduler_.post([on_done = std::move(on_done), result]() {
            if (on_done) {
                on_done(result);
            }
        });
        return;
    }

    // Capture by value: the worker must not reference caller-owned data
    thread_pool_->commit([this, args, on_done = std::move(on_done)]() {
        NmcliResult result = exec_blocking(args);
        if (shutdown_) {
            return;
        }
        scheduler_.post([on_done, result = std::move(result)]() {
            if (on_done) {
                on_done(result);
            }
        });
    });
}

NmcliResult NmcliRunnerProcess::exec_blocking(const std::vector<std::string>& args) {
    NmcliResult result;

    // O_CLOEXEC: a child forked by another worker must not inherit these
    // write ends, or this read would wait for that child to exit
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.err = std::string("pipe failed: ") + strerror(errno);
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.err = std::string("pipe failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    // SECURITY: argv is built here and handed to execvp - no shell involved
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>("nmcli"));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.err = std::string("fork failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: wire pipes to stdout/stderr and exec (dup2 clears O_CLOEXEC)
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        execvp("nmcli", argv.data());
        _exit(EXEC_FAILED_EXIT);
    }

    // Parent: drain both pipes until EOF so a chatty child can't block on a full pipe
    close(out_pipe[1]);
    close(err_pipe[1]);

    std::array<pollfd, 2> fds{};
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;
    std::array<char, 512> buffer;

    while (open_fds > 0) {
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[Nmcli] poll error: {}", strerror(errno));
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            close(fd.fd);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("[Nmcli] waitpid error: {}", strerror(errno));
            result.err = "waitpid failed";
            return result;
        }
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (result.exit_code == EXEC_FAILED_EXIT) {
        result.err = "nmcli not found in PATH";
        return result;
    }

    result.spawned = true;
    if (result.exit_code != 0) {
        spdlog::trace("[Nmcli] {} exited with code {}", format_nmcli_command(args),
                      result.exit_code);
    }
    return result;
}

} // namespace tether

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nmcli_runner.h"

#include <map>
#include <string>
#include <vector>

namespace tether {

class EventScheduler;

/**
 * @brief Access point visible to the simulated radio
 *
 * Extends the scan-visible fields with the passphrase the simulated AP
 * expects. Real NetworkManager never exposes it; the mock needs it to decide
 * whether an activation authenticates.
 */
struct MockAccessPoint {
    std::string ssid;
    int signal = 50;
    std::string security = "WPA2"; ///< nmcli SECURITY column ("WPA2", "WPA1 WPA2", "", ...)
    int frequency_mhz = 2437;
    std::string password; ///< Empty for open networks
};

/**
 * @brief Connection profile held by the simulated NetworkManager
 */
struct MockProfile {
    std::string name;
    std::string type = "802-11-wireless";
    std::string ssid;
    std::string psk;
    bool autoconnect = true;
    int priority = 0;
};

/**
 * @brief In-memory NetworkManager for --mock runs and unit tests
 *
 * Parses the same argv the real runner would hand to nmcli and answers with
 * nmcli-shaped terse output, exit codes and stderr messages. Every completion
 * is posted through the EventScheduler, so callers observe the same
 * asynchronous ordering as with real processes.
 *
 * Test controls:
 * - hold_matching(): park commands whose rendered form contains a substring
 *   until release_held() (used to keep an activation or a status query
 *   in flight)
 * - fail_matching(): answer matching commands with a fixed failure
 * - set_available(false): NetworkManager "not running"
 */
class NmcliRunnerMock : public NmcliRunner {
  public:
    explicit NmcliRunnerMock(EventScheduler& scheduler);
    ~NmcliRunnerMock() override = default;

    void run(const std::vector<std::string>& args, Completion on_done) override;

    /// Populate a small demo environment (home network active, hotspot in range)
    void seed_demo_environment();

    // ========================================================================
    // Radio / profile state
    // ========================================================================

    void add_access_point(const MockAccessPoint& ap);
    void remove_access_point(const std::string& ssid);
    void clear_access_points();

    void add_profile(const MockProfile& profile);
    bool has_profile(const std::string& name) const;
    const MockProfile* find_profile(const std::string& name) const;
    size_t profile_count() const {
        return profiles_.size();
    }

    /// Force the active connection (as if NetworkManager autoconnected)
    void set_active_connection(const std::string& profile_name);
    /// Drop the active connection (as if the AP went away)
    void drop_connection();
    const std::string& active_connection() const {
        return active_profile_;
    }

    void set_interface(const std::string& iface) {
        interface_ = iface;
    }
    void set_available(bool available) {
        available_ = available;
    }

    // ========================================================================
    // Test controls
    // ========================================================================

    void hold_matching(const std::string& pattern);
    void stop_holding();
    /// Execute every parked command and post its completion
    void release_held();
    size_t held_count() const {
        return held_.size();
    }

    void fail_matching(const std::string& pattern, int exit_code, const std::string& err);
    void clear_failures();

    /// Every command received, rendered ("nmcli -t -f SSID ...")
    const std::vector<std::string>& history() const {
        return history_;
    }
    size_t count_matching(const std::string& pattern) const;
    void clear_history() {
        history_.clear();
    }

  private:
    struct HeldCommand {
        std::vector<std::string> args;
        Completion on_done;
    };

    struct Failure {
        std::string pattern;
        int exit_code;
        std::string err;
    };

    EventScheduler& scheduler_;
    std::vector<MockAccessPoint> access_points_;
    std::vector<MockProfile> profiles_;
    std::string active_profile_;
    std::string active_ip_;
    std::string interface_ = "wlan0";
    std::string hwaddr_ = "DC:A6:32:12:34:56";
    bool available_ = true;
    int next_host_octet_ = 42;
    int next_active_path_ = 1;

    std::vector<std::string> hold_patterns_;
    std::vector<HeldCommand> held_;
    std::vector<Failure> failures_;
    std::vector<std::string> history_;

    NmcliResult execute(const std::vector<std::string>& args);
    void deliver(Completion on_done, NmcliResult result);

    NmcliResult general_status();
    NmcliResult wifi_list(const std::vector<std::string>& args);
    NmcliResult device_show(const std::string& iface);
    NmcliResult device_disconnect(const std::string& iface);
    NmcliResult connection_list();
    NmcliResult connection_show(const std::string& name);
    NmcliResult connection_add(const std::vector<std::string>& args, size_t first);
    NmcliResult connection_delete(const std::string& name);
    NmcliResult connection_up(const std::string& name);

    const MockAccessPoint* find_access_point(const std::string& ssid) const;
    std::vector<MockProfile>::iterator profile_iter(const std::string& name);
};

} // namespace tether

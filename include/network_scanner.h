// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_error.h"
#include "wifi_types.h"

#include <functional>
#include <string>
#include <vector>

namespace tether {

class NmcliRunner;

/**
 * @brief Network discovery and visibility checks
 *
 * Answers "what's visible" and "how strong is X" by asking NetworkManager for
 * its access point list. Never changes the current connection.
 */
class NetworkScanner {
  public:
    /**
     * @param runner Driver used for every query
     * @param is_initialized Service readiness check (before initialization
     *        scan_networks() refuses and is_network_visible() answers false)
     */
    NetworkScanner(NmcliRunner& runner, std::function<bool()> is_initialized);

    /**
     * @brief Trigger a rescan and list visible networks
     *
     * Hidden networks are omitted. Fails with SCAN_FAILED only when the driver
     * call itself fails.
     */
    void scan_networks(WiFiResultCallback<std::vector<WiFiNetwork>> callback);

    /**
     * @brief Rescan and check for an exact, case-sensitive SSID match
     *
     * Driver errors, and calls before initialization, are reported as success(false).
     */
    void is_network_visible(const std::string& ssid, WiFiResultCallback<bool> callback);

    /**
     * @brief Signal strength (0-100) of @p ssid from the last scan
     *
     * Absent networks and driver errors yield success(0).
     */
    void get_signal_strength(const std::string& ssid, WiFiResultCallback<int> callback);

  private:
    NmcliRunner& runner_;
    std::function<bool()> is_initialized_;
};

} // namespace tether

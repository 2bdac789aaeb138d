// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_scheduler.h"
#include "wifi_error.h"
#include "wifi_types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tether {

class NetworkScanner;
class NmcliRunner;

/**
 * @brief Connect, disconnect and saved-profile management
 *
 * Wraps NetworkManager's connection operations for one WiFi interface and
 * runs the 5-second connection monitor that reports connected/disconnected
 * flips to subscribers.
 *
 * Profiles are named after their SSID, so "profile" and "network" are used
 * interchangeably here.
 *
 * @threading Loop thread only. Precondition failures (not initialized,
 *            invalid parameters) complete synchronously; everything else
 *            completes from a later loop iteration.
 */
class ConnectionManager {
  public:
    using ConnectionChangeCallback = std::function<void(bool connected)>;
    using Unsubscribe = std::function<void()>;

    ConnectionManager(EventScheduler& scheduler, NmcliRunner& runner, NetworkScanner& scanner,
                      WifiSettings settings, std::function<bool()> is_initialized);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Snapshot of the active connection on the managed interface
     *
     * Yields nullopt when disconnected or when the status query fails. Only
     * a missing initialization is reported as an error.
     */
    void get_current_connection(WiFiResultCallback<std::optional<WiFiConnection>> callback);

    void is_connected(WiFiResultCallback<bool> callback);

    /**
     * @brief Create a fresh WPA-PSK profile for @p ssid and activate it
     *
     * Any existing profile of the same name is replaced. Activation races
     * the configured connection timeout.
     *
     * Errors: AUTH_FAILED (secrets rejected), TIMEOUT, CONNECTION_FAILED,
     * INVALID_PARAMETERS, NOT_INITIALIZED.
     */
    void connect(const std::string& ssid, const std::string& password, WiFiCallback callback);

    /// Device-level disconnect; NOT_CONNECTED when already offline
    void disconnect(WiFiCallback callback);

    /// Activate an existing profile without supplying secrets
    void activate_profile(const std::string& name, WiFiCallback callback);

    /// (Re)create a profile with autoconnect and priority, without activating it
    void save_network(const WiFiNetworkConfig& config, WiFiCallback callback);

    /// WiFi profiles only; passwords are never returned
    void get_saved_networks(WiFiResultCallback<std::vector<WiFiNetworkConfig>> callback);

    /// NETWORK_NOT_FOUND when no profile of that name exists
    void remove_network(const std::string& ssid, WiFiCallback callback);

    /// Whether NetworkManager holds a profile called @p name
    void connection_exists(const std::string& name, std::function<void(bool)> callback);

    void start_connection_monitoring();
    void stop_connection_monitoring();
    bool is_monitoring() const {
        return monitor_timer_ != INVALID_TIMER;
    }

    /**
     * @brief Subscribe to connected/disconnected flips
     * @return Closure that removes this subscription (must not outlive the manager)
     */
    Unsubscribe on_connection_change(ConnectionChangeCallback callback);

    void clear_callbacks();
    size_t callback_count() const {
        return callbacks_.size();
    }

    const WifiSettings& settings() const {
        return settings_;
    }

  private:
    EventScheduler& scheduler_;
    NmcliRunner& runner_;
    NetworkScanner& scanner_;
    WifiSettings settings_;
    std::function<bool()> is_initialized_;

    std::vector<std::pair<uint64_t, ConnectionChangeCallback>> callbacks_;
    uint64_t next_callback_id_ = 1;

    TimerId monitor_timer_ = INVALID_TIMER;
    uint64_t monitor_generation_ = 0;
    bool monitor_check_in_flight_ = false;
    bool last_connected_ = false;

    void check_connection_change();
    void notify_connection_change(bool connected);
    void activate_with_timeout(const std::string& ssid, WiFiCallback callback);
};

} // namespace tether

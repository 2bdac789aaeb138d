// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "connection_manager.h"
#include "hotspot_manager.h"
#include "network_scanner.h"
#include "wifi_error.h"
#include "wifi_state_machine.h"
#include "wifi_types.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tether {

class Config;
class EventScheduler;
class NmcliRunner;

/**
 * @brief WiFi connectivity service facade
 *
 * Owns the four components and wires them together:
 * - NetworkScanner: discovery and visibility checks
 * - ConnectionManager: connect/disconnect/profiles, 5s connection monitor
 * - HotspotManager: hotspot attempt protocol and fallback recovery
 * - WiFiStateMachine: state, mode and 10s hotspot poll
 *
 * Lifecycle: construct -> initialize() -> ... -> dispose(). All methods run
 * on the event loop thread; results are delivered through callbacks.
 *
 * The scheduler, runner and config must outlive the service.
 */
class WifiService {
  public:
    WifiService(EventScheduler& scheduler, NmcliRunner& runner, Config& config,
                WifiSettings settings);
    ~WifiService();

    WifiService(const WifiService&) = delete;
    WifiService& operator=(const WifiService&) = delete;

    /**
     * @brief Probe NetworkManager, start both timers and derive the initial state
     *
     * Initial state: CONNECTED if already on the hotspot, IDLE if on another
     * network, DISCONNECTED if offline. Fails with NMCLI_NOT_AVAILABLE when
     * `nmcli general status` cannot run.
     */
    void initialize(WiFiCallback callback);

    /// Stop timers, abort any attempt, drop all subscribers, reset to IDLE
    void dispose();

    bool is_initialized() const {
        return initialized_;
    }

    // NetworkScanner
    void scan_networks(WiFiResultCallback<std::vector<WiFiNetwork>> callback);
    void is_network_visible(const std::string& ssid, WiFiResultCallback<bool> callback);

    // ConnectionManager
    void get_current_connection(WiFiResultCallback<std::optional<WiFiConnection>> callback);
    void is_connected(WiFiResultCallback<bool> callback);
    void connect(const std::string& ssid, const std::string& password, WiFiCallback callback);
    void disconnect(WiFiCallback callback);
    void save_network(const WiFiNetworkConfig& config, WiFiCallback callback);
    void get_saved_networks(WiFiResultCallback<std::vector<WiFiNetworkConfig>> callback);
    void remove_network(const std::string& ssid, WiFiCallback callback);
    ConnectionManager::Unsubscribe
    on_connection_change(ConnectionManager::ConnectionChangeCallback callback);

    // WiFiStateMachine
    WiFiState get_state() const;
    WiFiStateMachine::Unsubscribe on_state_change(WiFiStateMachine::StateChangeCallback callback);
    void set_websocket_client_count(int count);
    WiFiMode get_mode() const;
    void notify_connected_screen_displayed();

    // HotspotManager
    void is_connected_to_mobile_hotspot(WiFiResultCallback<bool> callback);
    void attempt_mobile_hotspot_connection(WiFiCallback callback);
    std::string get_mobile_hotspot_ssid();
    HotspotConfig get_hotspot_config();
    void set_hotspot_config(const std::string& ssid, const std::string& password,
                            WiFiCallback callback);

    /// Component access for diagnostics and tests
    NetworkScanner& scanner() {
        return *scanner_;
    }
    ConnectionManager& connection_manager() {
        return *connection_;
    }
    HotspotManager& hotspot_manager() {
        return *hotspot_;
    }
    WiFiStateMachine& state_machine() {
        return *state_machine_;
    }

  private:
    EventScheduler& scheduler_;
    NmcliRunner& runner_;
    bool initialized_ = false;
    bool initializing_ = false;

    std::unique_ptr<NetworkScanner> scanner_;
    std::unique_ptr<ConnectionManager> connection_;
    std::unique_ptr<HotspotManager> hotspot_;
    std::unique_ptr<WiFiStateMachine> state_machine_;

    void derive_initial_state(WiFiCallback callback);
};

} // namespace tether

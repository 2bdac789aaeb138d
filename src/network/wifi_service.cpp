// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_service.h"

#include "config.h"
#include "event_scheduler.h"
#include "nmcli_runner.h"

#include "spdlog/spdlog.h"

#include <cstdio>

namespace tether {

WifiService::WifiService(EventScheduler& scheduler, NmcliRunner& runner, Config& config,
                         WifiSettings settings)
    : scheduler_(scheduler), runner_(runner) {
    spdlog::debug("[WifiService] Creating (interface={}, hotspot default='{}', timeout={}ms)",
                  settings.interface, settings.primary_ssid, settings.connection_timeout_ms);

    auto is_initialized = [this]() { return initialized_; };

    scanner_ = std::make_unique<NetworkScanner>(runner_, is_initialized);
    connection_ = std::make_unique<ConnectionManager>(scheduler_, runner_, *scanner_, settings,
                                                      is_initialized);

    // HotspotManager reaches the state machine only through this port
    HotspotStatePort port;
    port.set_state = [this](WiFiState state) { state_machine_->set_state(state); };
    port.reset_connected_screen_flag = [this]() {
        state_machine_->reset_connected_screen_displayed();
    };
    hotspot_ = std::make_unique<HotspotManager>(scheduler_, *scanner_, *connection_, config,
                                                settings, std::move(port));

    state_machine_ = std::make_unique<WiFiStateMachine>(scheduler_, config, *scanner_,
                                                        *connection_, *hotspot_);
}

WifiService::~WifiService() {
    if (initialized_) {
        dispose();
    }
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[WifiService] Destroyed\n");
}

// ============================================================================
// Lifecycle
// ============================================================================

void WifiService::initialize(WiFiCallback callback) {
    if (initialized_) {
        spdlog::debug("[WifiService] Already initialized");
        callback(WiFiErrorHelper::success());
        return;
    }
    if (initializing_) {
        callback(WiFiErrorHelper::already_in_progress());
        return;
    }
    initializing_ = true;

    spdlog::info("[WifiService] Initializing");
    runner_.run({"-t", "general", "status"}, [this, callback](const NmcliResult& result) {
        if (!initializing_) {
            // dispose() ran while probing
            callback(WiFiErrorHelper::not_initialized());
            return;
        }
        if (!result.ok()) {
            initializing_ = false;
            spdlog::error("[WifiService] NetworkManager not available: {}", result.describe());
            callback(WiFiErrorHelper::nmcli_not_available(result.describe()));
            return;
        }

        spdlog::debug("[WifiService] NetworkManager status: {}", result.out);
        initializing_ = false;
        initialized_ = true;

        connection_->start_connection_monitoring();
        state_machine_->start_hotspot_polling();
        derive_initial_state(callback);
    });
}

void WifiService::derive_initial_state(WiFiCallback callback) {
    hotspot_->is_connected_to_mobile_hotspot(
        [this, callback](const WiFiError& err, const bool& on_hotspot) {
            if (!initialized_) {
                callback(WiFiErrorHelper::not_initialized());
                return;
            }
            if (err.success() && on_hotspot) {
                spdlog::info("[WifiService] Already on the mobile hotspot");
                state_machine_->set_state(WiFiState::CONNECTED);
                spdlog::info("[WifiService] Initialized, state {}",
                             wifi_state_name(state_machine_->get_state()));
                callback(WiFiErrorHelper::success());
                return;
            }

            connection_->is_connected([this, callback](const WiFiError& conn_err,
                                                       const bool& connected) {
                if (!initialized_) {
                    callback(WiFiErrorHelper::not_initialized());
                    return;
                }
                if (conn_err.success() && connected) {
                    state_machine_->set_state(WiFiState::IDLE);
                } else {
                    spdlog::info("[WifiService] Not connected to any network");
                    state_machine_->set_state(WiFiState::DISCONNECTED);
                }
                spdlog::info("[WifiService] Initialized, state {}",
                             wifi_state_name(state_machine_->get_state()));
                callback(WiFiErrorHelper::success());
            });
        });
}

void WifiService::dispose() {
    spdlog::info("[WifiService] Disposing");

    connection_->stop_connection_monitoring();
    state_machine_->stop_hotspot_polling();
    hotspot_->abort_connection_attempt();
    hotspot_->discard_pending_operations();

    connection_->clear_callbacks();
    state_machine_->clear_callbacks();

    // Subscribers are gone, so nobody hears this one
    state_machine_->set_state(WiFiState::IDLE);

    initialized_ = false;
    initializing_ = false;
}

// ============================================================================
// Delegation
// ============================================================================

void WifiService::scan_networks(WiFiResultCallback<std::vector<WiFiNetwork>> callback) {
    scanner_->scan_networks(std::move(callback));
}

void WifiService::is_network_visible(const std::string& ssid, WiFiResultCallback<bool> callback) {
    scanner_->is_network_visible(ssid, std::move(callback));
}

void WifiService::get_current_connection(
    WiFiResultCallback<std::optional<WiFiConnection>> callback) {
    connection_->get_current_connection(std::move(callback));
}

void WifiService::is_connected(WiFiResultCallback<bool> callback) {
    connection_->is_connected(std::move(callback));
}

void WifiService::connect(const std::string& ssid, const std::string& password,
                          WiFiCallback callback) {
    connection_->connect(ssid, password, std::move(callback));
}

void WifiService::disconnect(WiFiCallback callback) {
    connection_->disconnect(std::move(callback));
}

void WifiService::save_network(const WiFiNetworkConfig& config, WiFiCallback callback) {
    connection_->save_network(config, std::move(callback));
}

void WifiService::get_saved_networks(WiFiResultCallback<std::vector<WiFiNetworkConfig>> callback) {
    connection_->get_saved_networks(std::move(callback));
}

void WifiService::remove_network(const std::string& ssid, WiFiCallback callback) {
    connection_->remove_network(ssid, std::move(callback));
}

ConnectionManager::Unsubscribe
WifiService::on_connection_change(ConnectionManager::ConnectionChangeCallback callback) {
    return connection_->on_connection_change(std::move(callback));
}

WiFiState WifiService::get_state() const {
    return state_machine_->get_state();
}

WiFiStateMachine::Unsubscribe
WifiService::on_state_change(WiFiStateMachine::StateChangeCallback callback) {
    return state_machine_->on_state_change(std::move(callback));
}

void WifiService::set_websocket_client_count(int count) {
    state_machine_->set_websocket_client_count(count);
}

WiFiMode WifiService::get_mode() const {
    return state_machine_->get_mode();
}

void WifiService::notify_connected_screen_displayed() {
    state_machine_->notify_connected_screen_displayed();
}

void WifiService::is_connected_to_mobile_hotspot(WiFiResultCallback<bool> callback) {
    hotspot_->is_connected_to_mobile_hotspot(std::move(callback));
}

void WifiService::attempt_mobile_hotspot_connection(WiFiCallback callback) {
    hotspot_->attempt_mobile_hotspot_connection(std::move(callback));
}

std::string WifiService::get_mobile_hotspot_ssid() {
    return hotspot_->get_mobile_hotspot_ssid();
}

HotspotConfig WifiService::get_hotspot_config() {
    return hotspot_->get_hotspot_config();
}

void WifiService::set_hotspot_config(const std::string& ssid, const std::string& password,
                                     WiFiCallback callback) {
    hotspot_->set_hotspot_config(ssid, password, std::move(callback));
}

} // namespace tether

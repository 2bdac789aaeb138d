// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_scheduler.h"
#include "wifi_error.h"
#include "wifi_types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tether {

class Config;
class ConnectionManager;
class NetworkScanner;

/**
 * @brief What HotspotManager may do to the state machine
 *
 * HotspotManager never holds a pointer to the state machine; these two
 * hooks are the whole of its influence on it.
 */
struct HotspotStatePort {
    std::function<void(WiFiState)> set_state;
    std::function<void()> reset_connected_screen_flag;
};

/**
 * @brief Mobile hotspot connection protocol and fallback bookkeeping
 *
 * One attempt at a time:
 * 1. Check the hotspot is visible (no disconnect if it isn't)
 * 2. CONNECTING: connect, raced against a fixed 60s budget
 * 3. Settle 2s, verify; once more after 3s
 * 4. Verified: CONNECTED, fallback record cleared
 * 5. Budget exceeded: RECONNECTING_FALLBACK, then DISCONNECTED or ERROR
 *
 * The fallback network is the one the device was on before it went looking
 * for the hotspot. Its secret stays in NetworkManager's profile, so it can
 * only be restored if it was connected at least once.
 */
class HotspotManager {
  public:
    HotspotManager(EventScheduler& scheduler, NetworkScanner& scanner,
                   ConnectionManager& connection, Config& config, WifiSettings defaults,
                   HotspotStatePort state_port);
    ~HotspotManager();

    HotspotManager(const HotspotManager&) = delete;
    HotspotManager& operator=(const HotspotManager&) = delete;

    /// Whether the active connection is the effective hotspot SSID
    void is_connected_to_mobile_hotspot(WiFiResultCallback<bool> callback);

    /**
     * @brief Run one hotspot connection attempt
     *
     * Completes with: success; ALREADY_IN_PROGRESS (a second caller, state
     * untouched); NETWORK_NOT_FOUND (not visible, state untouched);
     * HOTSPOT_CONNECTION_TIMEOUT; CONNECTION_FAILED; or UNKNOWN_ERROR
     * "aborted" after abort_connection_attempt().
     */
    void attempt_mobile_hotspot_connection(WiFiCallback callback);

    /// Cancel the in-flight attempt, if any; its outcome is discarded
    void abort_connection_attempt();

    /**
     * @brief Drop the outcome of set_hotspot_config() and fallback saves still in flight
     *
     * Their continuations complete with NOT_INITIALIZED and leave state and
     * config alone. Used on dispose.
     */
    void discard_pending_operations();

    bool is_connection_attempt_in_progress() const {
        return attempt_ != nullptr;
    }

    /// Record the current network as fallback, unless it is the hotspot itself
    void save_fallback_network(std::function<void()> done);
    void clear_fallback_network();

    /**
     * @brief Return to the recorded fallback network
     *
     * Success without doing anything when no fallback is recorded.
     */
    void reconnect_to_fallback(WiFiCallback callback);

    /// Persisted override, else the compiled default (with a fresh timestamp)
    HotspotConfig get_hotspot_config();

    /**
     * @brief Replace the hotspot identity and restart the hotspot flow
     *
     * Validates (non-empty trimmed SSID, password of 8+ characters), persists,
     * records the current network as fallback, disconnects and enters
     * WAITING_FOR_HOTSPOT.
     */
    void set_hotspot_config(const std::string& ssid, const std::string& password,
                            WiFiCallback callback);

    std::string get_mobile_hotspot_ssid();
    std::string get_effective_hotspot_ssid();
    std::string get_effective_hotspot_password();

  private:
    struct Attempt;

    EventScheduler& scheduler_;
    NetworkScanner& scanner_;
    ConnectionManager& connection_;
    Config& config_;
    WifiSettings defaults_;
    HotspotStatePort state_port_;

    std::shared_ptr<Attempt> attempt_;
    uint64_t operation_generation_ = 0;

    HotspotConfig default_hotspot_config() const;
    HotspotConfig resolve_hotspot_config();

    void start_connect(const std::shared_ptr<Attempt>& attempt);
    void verify_connection(const std::shared_ptr<Attempt>& attempt, int verify_round);
    void handle_timeout(const std::shared_ptr<Attempt>& attempt);
    void finish(const std::shared_ptr<Attempt>& attempt, const WiFiError& result);
    void set_state(WiFiState state);
};

} // namespace tether

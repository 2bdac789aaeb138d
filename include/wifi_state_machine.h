// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "event_scheduler.h"
#include "wifi_error.h"
#include "wifi_types.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace tether {

class Config;
class ConnectionManager;
class HotspotManager;
class NetworkScanner;

/**
 * @brief Authoritative WiFiState plus the 10-second hotspot poll loop
 *
 * Mode comes from the number of attached dashboard clients: any client means
 * STOPPED (someone is near the device, hotspot attempts allowed), none means
 * DRIVING (passive). While onboarding is incomplete DRIVING behaves like
 * STOPPED so a fresh device can find its hotspot unattended.
 *
 * Poll tick:
 * 1. On the hotspot: ensure CONNECTED (re-notify CONNECTED->CONNECTED while
 *    nobody has seen the connected screen yet)
 * 2. Lost the hotspot: ignored for 5s after entering CONNECTED, then
 *    WAITING_FOR_HOTSPOT
 * 3. STOPPED / onboarding: if the hotspot is visible, record fallback and
 *    schedule an attempt after a 5s debounce
 * 4. DRIVING: reflect generic connectivity as IDLE / DISCONNECTED
 *
 * Only one tick runs at a time; a tick that fires while the previous one is
 * still waiting on the driver is skipped.
 */
class WiFiStateMachine {
  public:
    using StateChangeCallback = std::function<void(WiFiState state, WiFiState previous)>;
    using Unsubscribe = std::function<void()>;

    WiFiStateMachine(EventScheduler& scheduler, Config& config, NetworkScanner& scanner,
                     ConnectionManager& connection, HotspotManager& hotspot);
    ~WiFiStateMachine();

    WiFiStateMachine(const WiFiStateMachine&) = delete;
    WiFiStateMachine& operator=(const WiFiStateMachine&) = delete;

    void start_hotspot_polling();

    /// Cancels the poll timer and any pending debounced attempt
    void stop_hotspot_polling();

    bool is_polling() const {
        return poll_timer_ != INVALID_TIMER;
    }

    WiFiState get_state() const {
        return state_;
    }

    /**
     * @brief Change state and notify subscribers
     *
     * No-op when @p new_state is the current state. Entering CONNECTED
     * records the time (grace period) and clears the connected-screen flag.
     */
    void set_state(WiFiState new_state);

    Unsubscribe on_state_change(StateChangeCallback callback);
    void clear_callbacks();
    size_t callback_count() const {
        return callbacks_.size();
    }

    void set_websocket_client_count(int count);
    int get_websocket_client_count() const {
        return client_count_;
    }
    WiFiMode get_mode() const;

    /// The dashboard showed the "connected" screen; stop re-notifying
    void notify_connected_screen_displayed();
    bool has_connected_screen_been_displayed() const {
        return connected_screen_displayed_;
    }
    void reset_connected_screen_displayed() {
        connected_screen_displayed_ = false;
    }

    /// One poll tick (timer-driven; also run on DRIVING -> STOPPED)
    void handle_hotspot_polling_tick();

    bool is_poll_tick_in_flight() const {
        return poll_in_flight_;
    }
    bool has_pending_attempt() const {
        return attempt_timer_ != INVALID_TIMER;
    }

  private:
    EventScheduler& scheduler_;
    Config& config_;
    NetworkScanner& scanner_;
    ConnectionManager& connection_;
    HotspotManager& hotspot_;

    WiFiState state_ = WiFiState::IDLE;
    int client_count_ = 0;
    bool connected_screen_displayed_ = false;
    std::optional<uint64_t> connected_entered_at_ms_;

    std::vector<std::pair<uint64_t, StateChangeCallback>> callbacks_;
    uint64_t next_callback_id_ = 1;

    TimerId poll_timer_ = INVALID_TIMER;
    TimerId attempt_timer_ = INVALID_TIMER;
    bool poll_in_flight_ = false;
    uint64_t poll_generation_ = 0;

    void on_hotspot_status(uint64_t generation, bool on_hotspot);
    void poll_seek_hotspot(uint64_t generation);
    void poll_driving(uint64_t generation);
    void finish_tick(uint64_t generation);
    void schedule_hotspot_attempt();
    bool hotspot_seeking_allowed();
    void notify_state_change(WiFiState state, WiFiState previous);
};

} // namespace tether

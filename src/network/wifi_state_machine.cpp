// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_state_machine.h"

#include "app_constants.h"
#include "config.h"
#include "connection_manager.h"
#include "hotspot_manager.h"
#include "network_scanner.h"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace tether {

WiFiStateMachine::WiFiStateMachine(EventScheduler& scheduler, Config& config,
                                   NetworkScanner& scanner, ConnectionManager& connection,
                                   HotspotManager& hotspot)
    : scheduler_(scheduler), config_(config), scanner_(scanner), connection_(connection),
      hotspot_(hotspot) {}

WiFiStateMachine::~WiFiStateMachine() {
    stop_hotspot_polling();
}

// ============================================================================
// Timers
// ============================================================================

void WiFiStateMachine::start_hotspot_polling() {
    if (poll_timer_ != INVALID_TIMER) {
        spdlog::debug("[WiFiStateMachine] Hotspot polling already running");
        return;
    }
    spdlog::info("[WiFiStateMachine] Starting hotspot polling ({}ms interval)",
                 AppConstants::Polling::HOTSPOT_POLL_INTERVAL_MS);
    poll_timer_ = scheduler_.set_interval(AppConstants::Polling::HOTSPOT_POLL_INTERVAL_MS,
                                          [this]() { handle_hotspot_polling_tick(); });
}

void WiFiStateMachine::stop_hotspot_polling() {
    if (poll_timer_ != INVALID_TIMER) {
        spdlog::info("[WiFiStateMachine] Stopping hotspot polling");
        scheduler_.cancel(poll_timer_);
        poll_timer_ = INVALID_TIMER;
    }
    if (attempt_timer_ != INVALID_TIMER) {
        scheduler_.cancel(attempt_timer_);
        attempt_timer_ = INVALID_TIMER;
    }
    // Continuations of a tick still waiting on the driver become no-ops
    ++poll_generation_;
    poll_in_flight_ = false;
}

// ============================================================================
// State
// ============================================================================

void WiFiStateMachine::set_state(WiFiState new_state) {
    if (new_state == state_) {
        return;
    }

    WiFiState previous = state_;
    state_ = new_state;

    if (new_state == WiFiState::CONNECTED) {
        connected_entered_at_ms_ = scheduler_.now_ms();
        connected_screen_displayed_ = false;
    } else {
        connected_entered_at_ms_.reset();
    }

    spdlog::info("[WiFiStateMachine] State: {} -> {}", wifi_state_name(previous),
                 wifi_state_name(new_state));
    notify_state_change(new_state, previous);
}

WiFiStateMachine::Unsubscribe WiFiStateMachine::on_state_change(StateChangeCallback callback) {
    uint64_t id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    spdlog::debug("[WiFiStateMachine] Registered state callback #{} (total: {})", id,
                  callbacks_.size());

    return [this, id]() {
        auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it != callbacks_.end()) {
            callbacks_.erase(it);
        }
    };
}

void WiFiStateMachine::clear_callbacks() {
    spdlog::debug("[WiFiStateMachine] Clearing {} state callbacks", callbacks_.size());
    callbacks_.clear();
}

void WiFiStateMachine::notify_state_change(WiFiState state, WiFiState previous) {
    auto callbacks = callbacks_;
    for (size_t i = 0; i < callbacks.size(); ++i) {
        try {
            callbacks[i].second(state, previous);
        } catch (const std::exception& e) {
            spdlog::error("[WiFiStateMachine] Error in state callback {}: {}", i + 1, e.what());
        }
    }
}

void WiFiStateMachine::notify_connected_screen_displayed() {
    spdlog::debug("[WiFiStateMachine] Connected screen displayed");
    connected_screen_displayed_ = true;
}

// ============================================================================
// Mode
// ============================================================================

WiFiMode WiFiStateMachine::get_mode() const {
    return client_count_ > 0 ? WiFiMode::STOPPED : WiFiMode::DRIVING;
}

void WiFiStateMachine::set_websocket_client_count(int count) {
    if (count < 0) {
        spdlog::warn("[WiFiStateMachine] Ignoring negative client count {}", count);
        count = 0;
    }

    int previous = client_count_;
    client_count_ = count;
    spdlog::debug("[WiFiStateMachine] Client count {} -> {}", previous, count);

    if (previous == 0 && count > 0) {
        spdlog::info("[WiFiStateMachine] Mode: driving -> stopped");
        handle_hotspot_polling_tick();
    } else if (previous > 0 && count == 0) {
        spdlog::info("[WiFiStateMachine] Mode: stopped -> driving");
        if (state_ == WiFiState::WAITING_FOR_HOTSPOT || state_ == WiFiState::CONNECTING) {
            hotspot_.abort_connection_attempt();
            if (attempt_timer_ != INVALID_TIMER) {
                scheduler_.cancel(attempt_timer_);
                attempt_timer_ = INVALID_TIMER;
            }
            set_state(WiFiState::IDLE);
        }
    }
}

bool WiFiStateMachine::hotspot_seeking_allowed() {
    return client_count_ > 0 || !config_.is_onboarding_completed();
}

// ============================================================================
// Poll tick
// ============================================================================

void WiFiStateMachine::handle_hotspot_polling_tick() {
    if (poll_in_flight_) {
        spdlog::debug("[WiFiStateMachine] Previous poll tick still running - skipping");
        return;
    }
    poll_in_flight_ = true;
    uint64_t generation = poll_generation_;

    spdlog::trace("[WiFiStateMachine] Poll tick (state {}, {} clients)", wifi_state_name(state_),
                  client_count_);

    hotspot_.is_connected_to_mobile_hotspot(
        [this, generation](const WiFiError& err, const bool& on_hotspot) {
            if (generation != poll_generation_) {
                return;
            }
            // A failed status query counts as "not on the hotspot"
            on_hotspot_status(generation, err.success() && on_hotspot);
        });
}

void WiFiStateMachine::finish_tick(uint64_t generation) {
    if (generation == poll_generation_) {
        poll_in_flight_ = false;
    }
}

void WiFiStateMachine::on_hotspot_status(uint64_t generation, bool on_hotspot) {
    if (on_hotspot) {
        if (state_ != WiFiState::CONNECTED) {
            set_state(WiFiState::CONNECTED);
        } else if (client_count_ == 0 && !connected_screen_displayed_) {
            // Nobody has seen the connected screen yet - let the display retry
            spdlog::debug("[WiFiStateMachine] Re-notifying CONNECTED for display retry");
            notify_state_change(WiFiState::CONNECTED, WiFiState::CONNECTED);
        }
        finish_tick(generation);
        return;
    }

    if (state_ == WiFiState::CONNECTED) {
        uint64_t now = scheduler_.now_ms();
        if (connected_entered_at_ms_ &&
            now - *connected_entered_at_ms_ < AppConstants::Hotspot::CONNECTED_GRACE_PERIOD_MS) {
            spdlog::debug("[WiFiStateMachine] In CONNECTED for {}ms (grace {}ms) - ignoring loss",
                          now - *connected_entered_at_ms_,
                          AppConstants::Hotspot::CONNECTED_GRACE_PERIOD_MS);
            finish_tick(generation);
            return;
        }
        spdlog::info("[WiFiStateMachine] Lost hotspot connection");
        set_state(WiFiState::WAITING_FOR_HOTSPOT);
        // Fall through: decide whether to go looking for it again
    }

    if (hotspot_seeking_allowed()) {
        poll_seek_hotspot(generation);
    } else {
        poll_driving(generation);
    }
}

void WiFiStateMachine::poll_seek_hotspot(uint64_t generation) {
    if (state_ == WiFiState::ERROR) {
        spdlog::info("[WiFiStateMachine] Resetting from ERROR to allow retry");
        set_state(WiFiState::IDLE);
    }

    if (state_ == WiFiState::CONNECTING || state_ == WiFiState::RECONNECTING_FALLBACK) {
        spdlog::debug("[WiFiStateMachine] In {} - not starting another attempt",
                      wifi_state_name(state_));
        finish_tick(generation);
        return;
    }

    std::string hotspot_ssid = hotspot_.get_effective_hotspot_ssid();
    scanner_.is_network_visible(hotspot_ssid, [this, generation, hotspot_ssid](
                                                  const WiFiError& err, const bool& visible) {
        if (generation != poll_generation_) {
            return;
        }

        if (!err.success() || !visible) {
            spdlog::debug("[WiFiStateMachine] Hotspot '{}' not visible", hotspot_ssid);
            if (state_ != WiFiState::WAITING_FOR_HOTSPOT) {
                set_state(WiFiState::WAITING_FOR_HOTSPOT);
            }
            finish_tick(generation);
            return;
        }

        spdlog::info("[WiFiStateMachine] Hotspot '{}' visible - preparing attempt", hotspot_ssid);
        hotspot_.save_fallback_network([this, generation]() {
            if (generation != poll_generation_) {
                return;
            }
            if (state_ != WiFiState::WAITING_FOR_HOTSPOT) {
                set_state(WiFiState::WAITING_FOR_HOTSPOT);
            }
            schedule_hotspot_attempt();
            finish_tick(generation);
        });
    });
}

void WiFiStateMachine::schedule_hotspot_attempt() {
    if (attempt_timer_ != INVALID_TIMER) {
        scheduler_.cancel(attempt_timer_);
    }

    spdlog::debug("[WiFiStateMachine] Hotspot attempt in {}ms",
                  AppConstants::Hotspot::ATTEMPT_DEBOUNCE_MS);
    attempt_timer_ = scheduler_.set_timeout(AppConstants::Hotspot::ATTEMPT_DEBOUNCE_MS, [this]() {
        attempt_timer_ = INVALID_TIMER;

        if (!hotspot_seeking_allowed() || state_ != WiFiState::WAITING_FOR_HOTSPOT) {
            spdlog::info("[WiFiStateMachine] Conditions changed (clients: {}, state: {}) - "
                         "skipping attempt",
                         client_count_, wifi_state_name(state_));
            return;
        }

        hotspot_.attempt_mobile_hotspot_connection([](const WiFiError& result) {
            if (result.success()) {
                spdlog::info("[WiFiStateMachine] Hotspot attempt succeeded");
            } else {
                spdlog::info("[WiFiStateMachine] Hotspot attempt ended: {} ({})",
                             wifi_result_name(result.result), result.technical_msg);
            }
        });
    });
}

void WiFiStateMachine::poll_driving(uint64_t generation) {
    connection_.is_connected([this, generation](const WiFiError& err, const bool& connected) {
        if (generation != poll_generation_) {
            return;
        }

        if (!err.success()) {
            spdlog::debug("[WiFiStateMachine] Connection check failed in driving mode: {}",
                          err.technical_msg);
        } else if (state_ == WiFiState::CONNECTED) {
            set_state(WiFiState::DISCONNECTED);
        } else if (state_ != WiFiState::IDLE && state_ != WiFiState::DISCONNECTED) {
            set_state(connected ? WiFiState::IDLE : WiFiState::DISCONNECTED);
        }
        finish_tick(generation);
    });
}

} // namespace tether

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_manager.h"

#include "app_constants.h"
#include "config.h"
#include "connection_manager.h"
#include "network_scanner.h"

#include "spdlog/spdlog.h"

#include <optional>

namespace tether {

/**
 * @brief Book-keeping for one in-flight attempt
 *
 * Every asynchronous step captures the shared_ptr and checks `finished`
 * before acting, so a step that completes after the attempt ended (aborted,
 * timed out) does nothing.
 */
struct HotspotManager::Attempt {
    std::string ssid;
    std::string password;
    WiFiCallback callback;
    bool connect_settled = false; ///< connect() or the budget timer won the race
    bool finished = false;
    TimerId budget_timer = INVALID_TIMER;
    TimerId step_timer = INVALID_TIMER; ///< settle / verify-retry delay
};

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

HotspotManager::HotspotManager(EventScheduler& scheduler, NetworkScanner& scanner,
                               ConnectionManager& connection, Config& config,
                               WifiSettings defaults, HotspotStatePort state_port)
    : scheduler_(scheduler), scanner_(scanner), connection_(connection), config_(config),
      defaults_(std::move(defaults)), state_port_(std::move(state_port)) {}

HotspotManager::~HotspotManager() {
    if (attempt_) {
        scheduler_.cancel(attempt_->budget_timer);
        scheduler_.cancel(attempt_->step_timer);
        attempt_->finished = true;
        attempt_.reset();
    }
}

void HotspotManager::set_state(WiFiState state) {
    if (state_port_.set_state) {
        state_port_.set_state(state);
    }
}

// ============================================================================
// Hotspot identity
// ============================================================================

HotspotConfig HotspotManager::default_hotspot_config() const {
    HotspotConfig hotspot;
    hotspot.ssid = defaults_.primary_ssid;
    hotspot.password = defaults_.primary_password;
    hotspot.updated_at = iso8601_now();
    return hotspot;
}

HotspotConfig HotspotManager::resolve_hotspot_config() {
    std::optional<HotspotConfig> saved = config_.get_hotspot_config();
    return saved.value_or(default_hotspot_config());
}

HotspotConfig HotspotManager::get_hotspot_config() {
    HotspotConfig hotspot = resolve_hotspot_config();
    spdlog::debug("[HotspotManager] get_hotspot_config(): SSID='{}'", hotspot.ssid);
    return hotspot;
}

std::string HotspotManager::get_effective_hotspot_ssid() {
    return resolve_hotspot_config().ssid;
}

std::string HotspotManager::get_effective_hotspot_password() {
    return resolve_hotspot_config().password;
}

std::string HotspotManager::get_mobile_hotspot_ssid() {
    return get_effective_hotspot_ssid();
}

void HotspotManager::is_connected_to_mobile_hotspot(WiFiResultCallback<bool> callback) {
    connection_.get_current_connection(
        [this, callback](const WiFiError& err, const std::optional<WiFiConnection>& connection) {
            if (!err.success()) {
                callback(err, false);
                return;
            }
            if (!connection) {
                spdlog::trace("[HotspotManager] Not connected to any network");
                callback(WiFiErrorHelper::success(), false);
                return;
            }
            std::string hotspot_ssid = get_effective_hotspot_ssid();
            bool on_hotspot = connection->ssid == hotspot_ssid;
            spdlog::debug("[HotspotManager] Connected to '{}', is hotspot: {}", connection->ssid,
                          on_hotspot);
            callback(WiFiErrorHelper::success(), on_hotspot);
        });
}

// ============================================================================
// Attempt protocol
// ============================================================================

void HotspotManager::attempt_mobile_hotspot_connection(WiFiCallback callback) {
    if (attempt_) {
        spdlog::warn("[HotspotManager] Attempt already in progress - rejecting duplicate");
        callback(WiFiErrorHelper::already_in_progress());
        return;
    }

    auto attempt = std::make_shared<Attempt>();
    HotspotConfig hotspot = resolve_hotspot_config();
    attempt->ssid = hotspot.ssid;
    attempt->password = hotspot.password;
    attempt->callback = std::move(callback);
    attempt_ = attempt;

    spdlog::info("[HotspotManager] Starting hotspot attempt for '{}'", attempt->ssid);

    // Look before leaving the current network
    scanner_.is_network_visible(attempt->ssid,
                                [this, attempt](const WiFiError& err, const bool& visible) {
                                    if (attempt->finished) {
                                        return;
                                    }
                                    if (!err.success() || !visible) {
                                        spdlog::info("[HotspotManager] Hotspot '{}' not visible "
                                                     "- skipping attempt",
                                                     attempt->ssid);
                                        finish(attempt,
                                               WiFiErrorHelper::network_not_found(attempt->ssid));
                                        return;
                                    }
                                    start_connect(attempt);
                                });
}

void HotspotManager::start_connect(const std::shared_ptr<Attempt>& attempt) {
    spdlog::info("[HotspotManager] Hotspot '{}' visible - connecting ({}ms budget)",
                 attempt->ssid, AppConstants::Hotspot::CONNECTION_TIMEOUT_MS);
    set_state(WiFiState::CONNECTING);

    attempt->budget_timer = scheduler_.set_timeout(AppConstants::Hotspot::CONNECTION_TIMEOUT_MS,
                                                   [this, attempt]() {
                                                       attempt->budget_timer = INVALID_TIMER;
                                                       handle_timeout(attempt);
                                                   });

    connection_.connect(attempt->ssid, attempt->password, [this, attempt](const WiFiError& err) {
        if (attempt->finished || attempt->connect_settled) {
            return;
        }
        attempt->connect_settled = true;
        scheduler_.cancel(attempt->budget_timer);
        attempt->budget_timer = INVALID_TIMER;

        if (!err.success()) {
            spdlog::error("[HotspotManager] Failed to connect to hotspot '{}': {}",
                          attempt->ssid, err.technical_msg);
            set_state(WiFiState::ERROR);
            finish(attempt, WiFiErrorHelper::connection_failed(attempt->ssid, err.technical_msg));
            return;
        }

        spdlog::info("[HotspotManager] Driver reports connection to '{}', settling {}ms",
                     attempt->ssid, AppConstants::Hotspot::SETTLE_DELAY_MS);
        attempt->step_timer =
            scheduler_.set_timeout(AppConstants::Hotspot::SETTLE_DELAY_MS, [this, attempt]() {
                attempt->step_timer = INVALID_TIMER;
                verify_connection(attempt, 1);
            });
    });
}

void HotspotManager::verify_connection(const std::shared_ptr<Attempt>& attempt,
                                       int verify_round) {
    if (attempt->finished) {
        return;
    }

    is_connected_to_mobile_hotspot([this, attempt, verify_round](const WiFiError& err,
                                                                 const bool& on_hotspot) {
        if (attempt->finished) {
            return;
        }

        if (err.success() && on_hotspot) {
            spdlog::info("[HotspotManager] Verified connection to hotspot '{}'", attempt->ssid);
            set_state(WiFiState::CONNECTED);
            clear_fallback_network();
            finish(attempt, WiFiErrorHelper::success());
            return;
        }

        if (verify_round == 1) {
            spdlog::warn("[HotspotManager] Not on '{}' yet, verifying again in {}ms",
                         attempt->ssid, AppConstants::Hotspot::VERIFY_RETRY_DELAY_MS);
            attempt->step_timer = scheduler_.set_timeout(
                AppConstants::Hotspot::VERIFY_RETRY_DELAY_MS, [this, attempt]() {
                    attempt->step_timer = INVALID_TIMER;
                    verify_connection(attempt, 2);
                });
            return;
        }

        spdlog::error("[HotspotManager] Verification failed after retry - will retry on next poll");
        set_state(WiFiState::WAITING_FOR_HOTSPOT);
        finish(attempt,
               WiFiErrorHelper::connection_failed(attempt->ssid, "connection not verified"));
    });
}

void HotspotManager::handle_timeout(const std::shared_ptr<Attempt>& attempt) {
    if (attempt->finished || attempt->connect_settled) {
        return;
    }
    attempt->connect_settled = true;

    spdlog::warn("[HotspotManager] Hotspot '{}' connection timed out after {}ms", attempt->ssid,
                 AppConstants::Hotspot::CONNECTION_TIMEOUT_MS);
    set_state(WiFiState::RECONNECTING_FALLBACK);

    reconnect_to_fallback([this, attempt](const WiFiError& err) {
        if (attempt->finished) {
            return;
        }
        if (err.success()) {
            spdlog::info("[HotspotManager] Back on fallback network");
            set_state(WiFiState::DISCONNECTED);
        } else {
            spdlog::error("[HotspotManager] Fallback recovery failed: {}", err.technical_msg);
            set_state(WiFiState::ERROR);
        }
        finish(attempt,
               WiFiErrorHelper::hotspot_connection_timeout(
                   attempt->ssid, static_cast<int>(AppConstants::Hotspot::CONNECTION_TIMEOUT_MS)));
    });
}

void HotspotManager::finish(const std::shared_ptr<Attempt>& attempt, const WiFiError& result) {
    if (attempt->finished) {
        return;
    }
    attempt->finished = true;
    scheduler_.cancel(attempt->budget_timer);
    scheduler_.cancel(attempt->step_timer);
    attempt->budget_timer = INVALID_TIMER;
    attempt->step_timer = INVALID_TIMER;

    if (attempt_ == attempt) {
        attempt_.reset();
    }

    spdlog::debug("[HotspotManager] Attempt finished: {}", wifi_result_name(result.result));
    if (attempt->callback) {
        attempt->callback(result);
    }
}

void HotspotManager::discard_pending_operations() {
    ++operation_generation_;
}

void HotspotManager::abort_connection_attempt() {
    if (!attempt_) {
        return;
    }
    spdlog::info("[HotspotManager] Aborting in-progress connection attempt");
    finish(attempt_, WiFiErrorHelper::unknown("Connection attempt aborted"));
}

// ============================================================================
// Fallback network
// ============================================================================

void HotspotManager::save_fallback_network(std::function<void()> done) {
    const uint64_t generation = operation_generation_;
    connection_.get_current_connection(
        [this, generation, done](const WiFiError& err,
                                 const std::optional<WiFiConnection>& connection) {
            std::string hotspot_ssid = get_effective_hotspot_ssid();

            if (generation != operation_generation_) {
                spdlog::debug("[HotspotManager] Discarded fallback save");
            } else if (!err.success()) {
                spdlog::debug("[HotspotManager] Could not read current connection for fallback");
            } else if (!connection) {
                spdlog::debug("[HotspotManager] No current connection to save as fallback");
            } else if (connection->ssid == hotspot_ssid) {
                spdlog::debug("[HotspotManager] Current connection is the hotspot - not saved");
            } else {
                spdlog::info("[HotspotManager] Saving fallback network '{}'", connection->ssid);
                config_.set_fallback_network(FallbackNetwork{connection->ssid, iso8601_now()});
                if (!config_.save()) {
                    spdlog::error("[HotspotManager] Failed to persist fallback network");
                }
            }

            if (done) {
                done();
            }
        });
}

void HotspotManager::clear_fallback_network() {
    if (!config_.get_fallback_network()) {
        return;
    }
    spdlog::info("[HotspotManager] Clearing fallback network");
    config_.set_fallback_network(std::nullopt);
    if (!config_.save()) {
        spdlog::error("[HotspotManager] Failed to persist fallback network removal");
    }
}

void HotspotManager::reconnect_to_fallback(WiFiCallback callback) {
    std::optional<FallbackNetwork> fallback = config_.get_fallback_network();
    if (!fallback) {
        spdlog::info("[HotspotManager] No fallback network saved - nothing to reconnect to");
        callback(WiFiErrorHelper::success());
        return;
    }

    std::string ssid = fallback->ssid;
    spdlog::info("[HotspotManager] Reconnecting to fallback network '{}' (saved {})", ssid,
                 fallback->saved_at);

    connection_.disconnect([this, ssid, callback](const WiFiError& disconnect_err) {
        if (!disconnect_err.success()) {
            // Usually NOT_CONNECTED after a failed hotspot join
            spdlog::debug("[HotspotManager] Disconnect before fallback: {}",
                          disconnect_err.technical_msg);
        }

        // The secret lives in the profile; no password needed
        connection_.activate_profile(ssid, [ssid, callback](const WiFiError& err) {
            if (!err.success()) {
                callback(WiFiErrorHelper::fallback_reconnect_failed(ssid, err.technical_msg));
                return;
            }
            spdlog::info("[HotspotManager] Reconnected to fallback network '{}'", ssid);
            callback(WiFiErrorHelper::success());
        });
    });
}

// ============================================================================
// Configuration
// ============================================================================

void HotspotManager::set_hotspot_config(const std::string& ssid, const std::string& password,
                                        WiFiCallback callback) {
    std::string clean_ssid = trim(ssid);
    spdlog::info("[HotspotManager] set_hotspot_config(SSID='{}')", clean_ssid);

    if (clean_ssid.empty()) {
        callback(WiFiErrorHelper::invalid_parameters("Hotspot SSID is empty",
                                                     "SSID cannot be empty"));
        return;
    }
    if (password.length() < AppConstants::Hotspot::MIN_PASSWORD_LENGTH) {
        callback(WiFiErrorHelper::invalid_parameters(
            "Hotspot password shorter than " +
                std::to_string(AppConstants::Hotspot::MIN_PASSWORD_LENGTH) + " characters",
            "Password must be at least 8 characters for WPA2"));
        return;
    }

    config_.set_hotspot_config(HotspotConfig{clean_ssid, password, iso8601_now()});
    if (!config_.save()) {
        callback(WiFiErrorHelper::unknown("Failed to save hotspot configuration"));
        return;
    }

    // Remember where we were, then drop off so the poll loop goes looking
    const uint64_t generation = operation_generation_;
    save_fallback_network([this, generation, callback]() {
        if (generation != operation_generation_) {
            spdlog::debug("[HotspotManager] Hotspot change discarded before disconnect");
            callback(WiFiErrorHelper::not_initialized());
            return;
        }
        connection_.disconnect([this, generation, callback](const WiFiError& err) {
            if (generation != operation_generation_) {
                spdlog::debug("[HotspotManager] Hotspot change discarded after disconnect");
                callback(WiFiErrorHelper::not_initialized());
                return;
            }
            if (!err.success() && err.result != WiFiResult::NOT_CONNECTED) {
                spdlog::warn("[HotspotManager] Disconnect after hotspot change failed: {}",
                             err.technical_msg);
            }
            set_state(WiFiState::WAITING_FOR_HOTSPOT);
            if (state_port_.reset_connected_screen_flag) {
                state_port_.reset_connected_screen_flag();
            }
            callback(WiFiErrorHelper::success());
        });
    });
}

} // namespace tether

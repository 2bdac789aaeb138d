// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_manager.h"

#include "app_constants.h"
#include "network_scanner.h"
#include "nmcli_output.h"
#include "nmcli_runner.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <memory>

namespace tether {

namespace {

constexpr const char* WIFI_CONNECTION_TYPE = "802-11-wireless";

/// nmcli stderr markers for rejected or missing secrets
bool is_auth_failure(const std::string& err) {
    return err.find("Secrets were required") != std::string::npos ||
           err.find("802-11-wireless-security") != std::string::npos;
}

/// Shared between the activation completion and its timeout; first one wins
struct ActivationRace {
    bool settled = false;
    TimerId timer = INVALID_TIMER;
};

} // namespace

ConnectionManager::ConnectionManager(EventScheduler& scheduler, NmcliRunner& runner,
                                     NetworkScanner& scanner, WifiSettings settings,
                                     std::function<bool()> is_initialized)
    : scheduler_(scheduler), runner_(runner), scanner_(scanner), settings_(std::move(settings)),
      is_initialized_(std::move(is_initialized)) {}

ConnectionManager::~ConnectionManager() {
    stop_connection_monitoring();
}

// ============================================================================
// Status
// ============================================================================

void ConnectionManager::get_current_connection(
    WiFiResultCallback<std::optional<WiFiConnection>> callback) {
    if (!is_initialized_()) {
        callback(WiFiErrorHelper::not_initialized(), std::nullopt);
        return;
    }

    runner_.run({"-t", "-f", "GENERAL.CONNECTION,IP4.ADDRESS,GENERAL.HWADDR", "device", "show",
                 settings_.interface},
                [this, callback](const NmcliResult& result) {
                    if (!result.ok()) {
                        // Not being able to ask is treated as not connected
                        spdlog::warn("[ConnectionManager] Status query failed: {}",
                                     result.describe());
                        callback(WiFiErrorHelper::success(), std::nullopt);
                        return;
                    }

                    std::string connection_name;
                    std::string ip_address;
                    std::string mac_address;
                    bool have_ip = false;

                    for (const auto& line : nmcli::split_lines(result.out)) {
                        std::string key, value;
                        if (!nmcli::split_key_value(line, key, value)) {
                            continue;
                        }
                        if (key == "GENERAL.CONNECTION") {
                            connection_name = nmcli::unescape(value);
                        } else if (key == "GENERAL.HWADDR") {
                            // MAC is printed unescaped; the first-colon split keeps it whole
                            mac_address = value;
                        } else if (!have_ip && key.rfind("IP4.ADDRESS", 0) == 0) {
                            // "192.168.1.100/24"
                            ip_address = value.substr(0, value.find('/'));
                            have_ip = true;
                        }
                    }

                    if (connection_name.empty() || connection_name == "--") {
                        spdlog::trace("[ConnectionManager] Not connected");
                        callback(WiFiErrorHelper::success(), std::nullopt);
                        return;
                    }

                    WiFiConnection connection;
                    connection.ssid = connection_name;
                    connection.ip_address = ip_address;
                    connection.mac_address = mac_address;
                    // NetworkManager doesn't expose activation time
                    connection.connected_at = std::chrono::system_clock::now();

                    scanner_.get_signal_strength(
                        connection_name,
                        [callback, connection](const WiFiError& err, const int& signal) mutable {
                            connection.signal_strength = err.success() ? signal : 0;
                            spdlog::trace("[ConnectionManager] Connected to '{}' ip={} signal={}%",
                                          connection.ssid, connection.ip_address,
                                          connection.signal_strength);
                            callback(WiFiErrorHelper::success(), connection);
                        });
                });
}

void ConnectionManager::is_connected(WiFiResultCallback<bool> callback) {
    get_current_connection(
        [callback](const WiFiError& err, const std::optional<WiFiConnection>& connection) {
            if (!err.success()) {
                callback(err, false);
                return;
            }
            callback(WiFiErrorHelper::success(), connection.has_value());
        });
}

void ConnectionManager::connection_exists(const std::string& name,
                                          std::function<void(bool)> callback) {
    runner_.run({"connection", "show", name},
                [callback](const NmcliResult& result) { callback(result.ok()); });
}

// ============================================================================
// Connect / disconnect
// ============================================================================

void ConnectionManager::connect(const std::string& ssid, const std::string& password,
                                WiFiCallback callback) {
    spdlog::info("[ConnectionManager] connect('{}')", ssid);

    if (!is_initialized_()) {
        callback(WiFiErrorHelper::not_initialized());
        return;
    }

    if (!nmcli::validate_input(ssid, "SSID")) {
        callback(WiFiErrorHelper::invalid_parameters(
            "SSID contains invalid characters or is empty", "Invalid network name"));
        return;
    }
    if (!password.empty() && !nmcli::validate_input(password, "password")) {
        callback(WiFiErrorHelper::invalid_parameters("Password contains invalid characters",
                                                     "Invalid password"));
        return;
    }

    std::vector<std::string> add_args = {"connection", "add", "type",   "wifi",
                                         "con-name",   ssid,  "ifname", settings_.interface,
                                         "ssid",       ssid};
    if (!password.empty()) {
        add_args.insert(add_args.end(),
                        {"wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", password});
    }

    auto create_and_activate = [this, ssid, add_args, callback]() {
        runner_.run(add_args, [this, ssid, callback](const NmcliResult& result) {
            if (!result.ok()) {
                spdlog::error("[ConnectionManager] Failed to create profile '{}': {}", ssid,
                              result.describe());
                callback(WiFiErrorHelper::connection_failed(ssid, result.describe()));
                return;
            }
            spdlog::debug("[ConnectionManager] Profile '{}' created, activating", ssid);
            activate_with_timeout(ssid, callback);
        });
    };

    // Replace any stale profile so the new secret takes effect
    connection_exists(ssid, [this, ssid, create_and_activate](bool exists) {
        if (!exists) {
            create_and_activate();
            return;
        }
        spdlog::debug("[ConnectionManager] Deleting existing profile '{}'", ssid);
        runner_.run({"connection", "delete", ssid},
                    [ssid, create_and_activate](const NmcliResult& result) {
                        if (!result.ok()) {
                            spdlog::warn("[ConnectionManager] Could not delete '{}': {}", ssid,
                                         result.describe());
                        }
                        create_and_activate();
                    });
    });
}

void ConnectionManager::activate_with_timeout(const std::string& ssid, WiFiCallback callback) {
    const int timeout_ms = settings_.connection_timeout_ms;
    auto race = std::make_shared<ActivationRace>();

    race->timer = scheduler_.set_timeout(
        static_cast<uint32_t>(timeout_ms), [race, ssid, timeout_ms, callback]() {
            race->timer = INVALID_TIMER;
            if (race->settled) {
                return;
            }
            race->settled = true;
            spdlog::error("[ConnectionManager] Activation of '{}' timed out after {}ms", ssid,
                          timeout_ms);
            callback(WiFiErrorHelper::timeout("connect", timeout_ms));
        });

    runner_.run({"connection", "up", ssid}, [this, race, ssid, callback](const NmcliResult& result) {
        if (race->settled) {
            // Timed out already; the late outcome is dropped
            spdlog::debug("[ConnectionManager] Ignoring late activation result for '{}'", ssid);
            return;
        }
        race->settled = true;
        scheduler_.cancel(race->timer);
        race->timer = INVALID_TIMER;

        if (!result.ok()) {
            if (is_auth_failure(result.err)) {
                spdlog::error("[ConnectionManager] Authentication failed for '{}'", ssid);
                callback(WiFiErrorHelper::authentication_failed(ssid));
                return;
            }
            spdlog::error("[ConnectionManager] Activation of '{}' failed: {}", ssid,
                          result.describe());
            callback(WiFiErrorHelper::connection_failed(ssid, result.describe()));
            return;
        }

        spdlog::info("[ConnectionManager] Connected to '{}'", ssid);
        callback(WiFiErrorHelper::success());
    });
}

void ConnectionManager::disconnect(WiFiCallback callback) {
    if (!is_initialized_()) {
        callback(WiFiErrorHelper::not_initialized());
        return;
    }

    get_current_connection([this, callback](const WiFiError& err,
                                            const std::optional<WiFiConnection>& connection) {
        if (!err.success()) {
            callback(err);
            return;
        }
        if (!connection) {
            spdlog::info("[ConnectionManager] disconnect(): not connected to any network");
            callback(WiFiErrorHelper::not_connected());
            return;
        }

        std::string ssid = connection->ssid;
        spdlog::info("[ConnectionManager] Disconnecting from '{}'", ssid);
        runner_.run({"device", "disconnect", settings_.interface},
                    [ssid, callback](const NmcliResult& result) {
                        if (!result.ok()) {
                            spdlog::error("[ConnectionManager] Failed to disconnect from '{}': {}",
                                          ssid, result.describe());
                            callback(WiFiErrorHelper::unknown(result.describe()));
                            return;
                        }
                        callback(WiFiErrorHelper::success());
                    });
    });
}

void ConnectionManager::activate_profile(const std::string& name, WiFiCallback callback) {
    spdlog::info("[ConnectionManager] Activating saved profile '{}'", name);
    runner_.run({"connection", "up", name}, [name, callback](const NmcliResult& result) {
        if (!result.ok()) {
            spdlog::error("[ConnectionManager] Could not activate '{}': {}", name,
                          result.describe());
            callback(WiFiErrorHelper::connection_failed(name, result.describe()));
            return;
        }
        spdlog::debug("[ConnectionManager] nmcli: {}", result.out);
        callback(WiFiErrorHelper::success());
    });
}

// ============================================================================
// Saved profiles
// ============================================================================

void ConnectionManager::save_network(const WiFiNetworkConfig& config, WiFiCallback callback) {
    spdlog::info("[ConnectionManager] save_network('{}', priority={}, autoconnect={})",
                 config.ssid, config.priority, config.auto_connect);

    if (!is_initialized_()) {
        callback(WiFiErrorHelper::not_initialized());
        return;
    }
    if (!nmcli::validate_input(config.ssid, "SSID")) {
        callback(WiFiErrorHelper::invalid_parameters(
            "SSID contains invalid characters or is empty", "Invalid network name"));
        return;
    }
    if (!config.password.empty() && !nmcli::validate_input(config.password, "password")) {
        callback(WiFiErrorHelper::invalid_parameters("Password contains invalid characters",
                                                     "Invalid password"));
        return;
    }

    std::vector<std::string> add_args = {"connection", "add",       "type",   "wifi",
                                         "con-name",   config.ssid, "ifname", settings_.interface,
                                         "ssid",       config.ssid};
    if (!config.password.empty()) {
        add_args.insert(add_args.end(),
                        {"wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", config.password});
    }
    add_args.insert(add_args.end(),
                    {"connection.autoconnect", config.auto_connect ? "yes" : "no",
                     "connection.autoconnect-priority", std::to_string(config.priority)});

    std::string ssid = config.ssid;
    auto create = [this, ssid, add_args, callback]() {
        runner_.run(add_args, [ssid, callback](const NmcliResult& result) {
            if (!result.ok()) {
                spdlog::error("[ConnectionManager] Failed to save '{}': {}", ssid,
                              result.describe());
                callback(WiFiErrorHelper::unknown(result.describe()));
                return;
            }
            spdlog::info("[ConnectionManager] Saved network '{}'", ssid);
            callback(WiFiErrorHelper::success());
        });
    };

    connection_exists(ssid, [this, ssid, create, callback](bool exists) {
        if (!exists) {
            create();
            return;
        }
        runner_.run({"connection", "delete", ssid},
                    [ssid, create, callback](const NmcliResult& result) {
                        if (!result.ok()) {
                            spdlog::error("[ConnectionManager] Could not replace '{}': {}", ssid,
                                          result.describe());
                            callback(WiFiErrorHelper::unknown(result.describe()));
                            return;
                        }
                        create();
                    });
    });
}

void ConnectionManager::get_saved_networks(
    WiFiResultCallback<std::vector<WiFiNetworkConfig>> callback) {
    if (!is_initialized_()) {
        callback(WiFiErrorHelper::not_initialized(), {});
        return;
    }

    runner_.run({"-t", "-f", "NAME,TYPE,AUTOCONNECT,AUTOCONNECT-PRIORITY", "connection", "show"},
                [callback](const NmcliResult& result) {
                    if (!result.ok()) {
                        spdlog::error("[ConnectionManager] Failed to list profiles: {}",
                                      result.describe());
                        callback(WiFiErrorHelper::unknown(result.describe()), {});
                        return;
                    }

                    std::vector<WiFiNetworkConfig> networks;
                    for (const auto& line : nmcli::split_lines(result.out)) {
                        if (line.empty()) {
                            continue;
                        }
                        auto fields = nmcli::split_fields(line);
                        if (fields.size() < 4 || fields[1] != WIFI_CONNECTION_TYPE) {
                            continue;
                        }
                        WiFiNetworkConfig config;
                        config.ssid = fields[0];
                        config.auto_connect = nmcli::parse_yes_no(fields[2]);
                        config.priority = nmcli::parse_leading_int(fields[3]);
                        networks.push_back(config);
                    }
                    spdlog::debug("[ConnectionManager] {} saved WiFi networks", networks.size());
                    callback(WiFiErrorHelper::success(), networks);
                });
}

void ConnectionManager::remove_network(const std::string& ssid, WiFiCallback callback) {
    spdlog::info("[ConnectionManager] remove_network('{}')", ssid);

    if (!is_initialized_()) {
        callback(WiFiErrorHelper::not_initialized());
        return;
    }

    connection_exists(ssid, [this, ssid, callback](bool exists) {
        if (!exists) {
            callback(WiFiErrorHelper::network_not_found(ssid));
            return;
        }
        runner_.run({"connection", "delete", ssid}, [ssid, callback](const NmcliResult& result) {
            if (!result.ok()) {
                spdlog::error("[ConnectionManager] Failed to remove '{}': {}", ssid,
                              result.describe());
                callback(WiFiErrorHelper::unknown(result.describe()));
                return;
            }
            callback(WiFiErrorHelper::success());
        });
    });
}

// ============================================================================
// Monitoring
// ============================================================================

void ConnectionManager::start_connection_monitoring() {
    if (monitor_timer_ != INVALID_TIMER) {
        spdlog::debug("[ConnectionManager] Monitoring already running");
        return;
    }

    spdlog::info("[ConnectionManager] Starting connection monitoring ({}ms interval)",
                 AppConstants::Polling::CONNECTION_MONITOR_INTERVAL_MS);
    last_connected_ = false;
    monitor_check_in_flight_ = false;
    monitor_timer_ = scheduler_.set_interval(AppConstants::Polling::CONNECTION_MONITOR_INTERVAL_MS,
                                             [this]() { check_connection_change(); });
}

void ConnectionManager::stop_connection_monitoring() {
    if (monitor_timer_ == INVALID_TIMER) {
        return;
    }
    spdlog::info("[ConnectionManager] Stopping connection monitoring");
    scheduler_.cancel(monitor_timer_);
    monitor_timer_ = INVALID_TIMER;
    // Results of a check still in flight belong to the old generation
    ++monitor_generation_;
    monitor_check_in_flight_ = false;
}

void ConnectionManager::check_connection_change() {
    if (monitor_check_in_flight_) {
        spdlog::trace("[ConnectionManager] Previous check still running, skipping tick");
        return;
    }
    monitor_check_in_flight_ = true;

    uint64_t generation = monitor_generation_;
    is_connected([this, generation](const WiFiError& err, const bool& connected) {
        if (generation != monitor_generation_) {
            return;
        }
        monitor_check_in_flight_ = false;

        if (!err.success()) {
            spdlog::debug("[ConnectionManager] Monitor check failed: {}", err.technical_msg);
            return;
        }
        if (connected != last_connected_) {
            spdlog::info("[ConnectionManager] Connection state changed: {} -> {}",
                         last_connected_ ? "connected" : "disconnected",
                         connected ? "connected" : "disconnected");
            last_connected_ = connected;
            notify_connection_change(connected);
        }
    });
}

ConnectionManager::Unsubscribe
ConnectionManager::on_connection_change(ConnectionChangeCallback callback) {
    uint64_t id = next_callback_id_++;
    callbacks_.emplace_back(id, std::move(callback));
    spdlog::debug("[ConnectionManager] Registered connection callback #{} (total: {})", id,
                  callbacks_.size());

    return [this, id]() {
        auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it != callbacks_.end()) {
            callbacks_.erase(it);
            spdlog::debug("[ConnectionManager] Unsubscribed connection callback #{}", id);
        }
    };
}

void ConnectionManager::clear_callbacks() {
    spdlog::debug("[ConnectionManager] Clearing {} connection callbacks", callbacks_.size());
    callbacks_.clear();
}

void ConnectionManager::notify_connection_change(bool connected) {
    // Copy: a callback may unsubscribe itself
    auto callbacks = callbacks_;
    for (size_t i = 0; i < callbacks.size(); ++i) {
        try {
            callbacks[i].second(connected);
        } catch (const std::exception& e) {
            spdlog::error("[ConnectionManager] Error in connection callback {}: {}", i + 1,
                          e.what());
        }
    }
}

} // namespace tether

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <string>

namespace tether {

/**
 * @brief WiFi operation result with detailed error information
 */
enum class WiFiResult {
    SUCCESS = 0,                ///< Operation succeeded
    NOT_INITIALIZED,            ///< Service not started/initialized
    NMCLI_NOT_AVAILABLE,        ///< nmcli missing or NetworkManager not running
    SCAN_FAILED,                ///< Driver scan invocation failed
    NETWORK_NOT_FOUND,          ///< Network not in range / profile not present
    AUTH_FAILED,                ///< Wrong password or secrets rejected
    CONNECTION_FAILED,          ///< Connection could not be established
    TIMEOUT,                    ///< Operation timed out
    NOT_CONNECTED,              ///< Operation requires an active connection
    ALREADY_IN_PROGRESS,        ///< A hotspot attempt is already in flight
    HOTSPOT_CONNECTION_TIMEOUT, ///< Hotspot attempt exceeded its time budget
    FALLBACK_RECONNECT_FAILED,  ///< Could not return to the fallback network
    INVALID_PARAMETERS,         ///< Invalid SSID, password, or other parameters
    UNKNOWN_ERROR               ///< Unexpected error condition
};

/**
 * @brief Detailed error information for WiFi operations
 */
struct WiFiError {
    WiFiResult result;         ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< User-friendly message for dashboard display
    std::string suggestion;    ///< Suggested action for user (optional)

    WiFiError(WiFiResult r = WiFiResult::SUCCESS, const std::string& tech = "",
              const std::string& user = "", const std::string& suggest = "")
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    bool success() const {
        return result == WiFiResult::SUCCESS;
    }
    operator bool() const {
        return success();
    }
};

/// Completion of an operation that yields only an outcome
using WiFiCallback = std::function<void(const WiFiError&)>;

/**
 * @brief Completion of an operation that yields a value
 *
 * The value is meaningful only when the error is a success.
 */
template <typename T> using WiFiResultCallback = std::function<void(const WiFiError&, const T&)>;

/// Stable name for a result code ("AUTH_FAILED", ...), used in logs
const char* wifi_result_name(WiFiResult result);

/**
 * @brief Factory helpers for the WiFi error taxonomy
 */
class WiFiErrorHelper {
  public:
    static WiFiError success() {
        return WiFiError(WiFiResult::SUCCESS);
    }

    static WiFiError not_initialized() {
        return WiFiError(WiFiResult::NOT_INITIALIZED, "WiFi service not initialized",
                         "WiFi system not ready");
    }

    /**
     * @brief NetworkManager is not usable on this device
     */
    static WiFiError nmcli_not_available(const std::string& technical_detail) {
        return WiFiError(WiFiResult::NMCLI_NOT_AVAILABLE, technical_detail,
                         "NetworkManager not found",
                         "WiFi management requires NetworkManager (nmcli)");
    }

    static WiFiError scan_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::SCAN_FAILED,
                         "Failed to scan networks: " + technical_detail,
                         "WiFi scan failed", "Try again in a few seconds");
    }

    static WiFiError network_not_found(const std::string& ssid) {
        return WiFiError(WiFiResult::NETWORK_NOT_FOUND, "Network not found: " + ssid,
                         "Network '" + ssid + "' is not in range",
                         "Move closer to the network or check the network name");
    }

    static WiFiError authentication_failed(const std::string& ssid) {
        return WiFiError(WiFiResult::AUTH_FAILED, "Authentication failed for network: " + ssid,
                         "Incorrect password or network authentication failed",
                         "Verify the password and try again");
    }

    static WiFiError connection_failed(const std::string& ssid, const std::string& cause) {
        return WiFiError(WiFiResult::CONNECTION_FAILED,
                         "Failed to connect to '" + ssid + "': " + cause,
                         "Could not connect to '" + ssid + "'",
                         "Check that the network is available and try again");
    }

    static WiFiError timeout(const std::string& operation, int timeout_ms) {
        return WiFiError(WiFiResult::TIMEOUT,
                         "WiFi operation timed out after " + std::to_string(timeout_ms) +
                             "ms: " + operation,
                         "WiFi operation timed out");
    }

    static WiFiError not_connected() {
        return WiFiError(WiFiResult::NOT_CONNECTED, "Not connected to any WiFi network",
                         "Not connected");
    }

    static WiFiError already_in_progress() {
        return WiFiError(WiFiResult::ALREADY_IN_PROGRESS,
                         "Hotspot connection attempt already in progress",
                         "Already connecting to hotspot");
    }

    static WiFiError hotspot_connection_timeout(const std::string& ssid, int timeout_ms) {
        return WiFiError(WiFiResult::HOTSPOT_CONNECTION_TIMEOUT,
                         "Hotspot '" + ssid + "' connection timed out after " +
                             std::to_string(timeout_ms) + "ms",
                         "Could not join the hotspot in time",
                         "Check that the phone hotspot is switched on and nearby");
    }

    static WiFiError fallback_reconnect_failed(const std::string& ssid,
                                               const std::string& cause) {
        return WiFiError(WiFiResult::FALLBACK_RECONNECT_FAILED,
                         "Failed to reconnect to fallback network '" + ssid + "': " + cause,
                         "Could not return to the previous network");
    }

    static WiFiError invalid_parameters(const std::string& technical_detail,
                                        const std::string& user_detail) {
        return WiFiError(WiFiResult::INVALID_PARAMETERS, technical_detail, user_detail);
    }

    static WiFiError unknown(const std::string& message) {
        return WiFiError(WiFiResult::UNKNOWN_ERROR, message, "Unexpected WiFi error");
    }
};

} // namespace tether

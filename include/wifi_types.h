// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <string>

namespace tether {

/**
 * @brief Hotspot connectivity state, owned by WiFiStateMachine
 */
enum class WiFiState {
    IDLE,
    CONNECTING,
    CONNECTED,
    WAITING_FOR_HOTSPOT,
    RECONNECTING_FALLBACK,
    DISCONNECTED,
    ERROR
};

const char* wifi_state_name(WiFiState state);

/**
 * @brief Operating mode derived from the number of attached dashboard clients
 *
 * STOPPED (at least one client) is taken as a sign that someone is near the
 * device, so hotspot attempts are allowed. DRIVING is passive monitoring.
 */
enum class WiFiMode { DRIVING, STOPPED };

const char* wifi_mode_name(WiFiMode mode);

enum class WiFiSecurity { OPEN, WEP, WPA, WPA2, WPA3, UNKNOWN };

const char* wifi_security_name(WiFiSecurity security);

/**
 * @brief WiFi network information from a scan
 */
struct WiFiNetwork {
    std::string ssid;                          ///< Network name (SSID)
    int signal_strength = 0;                   ///< Signal strength (0-100 percentage)
    WiFiSecurity security = WiFiSecurity::OPEN; ///< Normalized security type
    int frequency_mhz = 0;                     ///< Channel frequency (2412, 5180, ...)

    WiFiNetwork() = default;
    WiFiNetwork(const std::string& ssid_, int strength, WiFiSecurity security_, int freq)
        : ssid(ssid_), signal_strength(strength), security(security_), frequency_mhz(freq) {}

    bool is_secured() const {
        return security != WiFiSecurity::OPEN;
    }
};

/**
 * @brief Snapshot of the active connection, rebuilt on every query
 */
struct WiFiConnection {
    std::string ssid;
    std::string ip_address;
    std::string mac_address;
    int signal_strength = 0;
    std::chrono::system_clock::time_point connected_at;
};

/**
 * @brief Saved profile descriptor
 *
 * The password is write-only: NetworkManager never returns stored secrets, so
 * profiles read back from the driver always carry an empty password.
 */
struct WiFiNetworkConfig {
    std::string ssid;
    std::string password;
    int priority = 0;
    bool auto_connect = true;
};

/**
 * @brief User override for the hotspot identity
 */
struct HotspotConfig {
    std::string ssid;
    std::string password;
    std::string updated_at; ///< ISO-8601 UTC
};

/**
 * @brief The network to return to when a hotspot attempt fails
 */
struct FallbackNetwork {
    std::string ssid;
    std::string saved_at; ///< ISO-8601 UTC
};

/**
 * @brief Device-level WiFi settings (compiled defaults, config file, CLI)
 */
struct WifiSettings {
    std::string interface = "wlan0";
    std::string primary_ssid;
    std::string primary_password;
    int connection_timeout_ms = 60000;
};

/// Current UTC time formatted as ISO-8601 ("2026-01-31T12:00:00Z")
std::string iso8601_now();

} // namespace tether

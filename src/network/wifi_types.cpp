// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_error.h"
#include "wifi_types.h"

#include <ctime>

namespace tether {

const char* wifi_state_name(WiFiState state) {
    switch (state) {
    case WiFiState::IDLE:
        return "IDLE";
    case WiFiState::CONNECTING:
        return "CONNECTING";
    case WiFiState::CONNECTED:
        return "CONNECTED";
    case WiFiState::WAITING_FOR_HOTSPOT:
        return "WAITING_FOR_HOTSPOT";
    case WiFiState::RECONNECTING_FALLBACK:
        return "RECONNECTING_FALLBACK";
    case WiFiState::DISCONNECTED:
        return "DISCONNECTED";
    case WiFiState::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

const char* wifi_mode_name(WiFiMode mode) {
    return mode == WiFiMode::STOPPED ? "stopped" : "driving";
}

const char* wifi_security_name(WiFiSecurity security) {
    switch (security) {
    case WiFiSecurity::OPEN:
        return "Open";
    case WiFiSecurity::WEP:
        return "WEP";
    case WiFiSecurity::WPA:
        return "WPA";
    case WiFiSecurity::WPA2:
        return "WPA2";
    case WiFiSecurity::WPA3:
        return "WPA3";
    case WiFiSecurity::UNKNOWN:
        return "Unknown";
    }
    return "Unknown";
}

const char* wifi_result_name(WiFiResult result) {
    switch (result) {
    case WiFiResult::SUCCESS:
        return "SUCCESS";
    case WiFiResult::NOT_INITIALIZED:
        return "NOT_INITIALIZED";
    case WiFiResult::NMCLI_NOT_AVAILABLE:
        return "NMCLI_NOT_AVAILABLE";
    case WiFiResult::SCAN_FAILED:
        return "SCAN_FAILED";
    case WiFiResult::NETWORK_NOT_FOUND:
        return "NETWORK_NOT_FOUND";
    case WiFiResult::AUTH_FAILED:
        return "AUTH_FAILED";
    case WiFiResult::CONNECTION_FAILED:
        return "CONNECTION_FAILED";
    case WiFiResult::TIMEOUT:
        return "TIMEOUT";
    case WiFiResult::NOT_CONNECTED:
        return "NOT_CONNECTED";
    case WiFiResult::ALREADY_IN_PROGRESS:
        return "ALREADY_IN_PROGRESS";
    case WiFiResult::HOTSPOT_CONNECTION_TIMEOUT:
        return "HOTSPOT_CONNECTION_TIMEOUT";
    case WiFiResult::FALLBACK_RECONNECT_FAILED:
        return "FALLBACK_RECONNECT_FAILED";
    case WiFiResult::INVALID_PARAMETERS:
        return "INVALID_PARAMETERS";
    case WiFiResult::UNKNOWN_ERROR:
        return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

std::string iso8601_now() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

} // namespace tether

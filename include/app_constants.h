// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file app_constants.h
 * @brief Centralized timing constants and compiled-in defaults
 *
 * All delays used by the connectivity core live here so the scheduling
 * behaviour of the daemon can be read in one place.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace AppConstants {

/**
 * @brief Periodic timers
 */
namespace Polling {
/// ConnectionManager connected/disconnected monitor
constexpr uint32_t CONNECTION_MONITOR_INTERVAL_MS = 5000;

/// WiFiStateMachine hotspot poll
constexpr uint32_t HOTSPOT_POLL_INTERVAL_MS = 10000;
} // namespace Polling

/**
 * @brief Hotspot attempt protocol delays
 */
namespace Hotspot {
/// Hard budget for one hotspot connection attempt
constexpr uint32_t CONNECTION_TIMEOUT_MS = 60000;

/// Wait after the driver reports success before verifying
constexpr uint32_t SETTLE_DELAY_MS = 2000;

/// Extra wait before the single verification retry
constexpr uint32_t VERIFY_RETRY_DELAY_MS = 3000;

/// Debounce between "hotspot visible" and firing the attempt
constexpr uint32_t ATTEMPT_DEBOUNCE_MS = 5000;

/// Window after entering CONNECTED during which loss is ignored
constexpr uint32_t CONNECTED_GRACE_PERIOD_MS = 5000;

/// WPA2 passphrase floor
constexpr size_t MIN_PASSWORD_LENGTH = 8;
} // namespace Hotspot

/**
 * @brief Compiled-in WiFi defaults (overridable from config / CLI)
 */
namespace WiFi {
constexpr const char* DEFAULT_INTERFACE = "wlan0";
constexpr const char* DEFAULT_PRIMARY_SSID = "Tether-Setup";
constexpr const char* DEFAULT_PRIMARY_PASSWORD = "tether1234";
constexpr int DEFAULT_CONNECTION_TIMEOUT_MS = 60000;
} // namespace WiFi

namespace Paths {
constexpr const char* DEFAULT_CONFIG = "/etc/tether/tether.json";
} // namespace Paths

} // namespace AppConstants

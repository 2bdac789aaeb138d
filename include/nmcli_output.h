// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_types.h"

#include <string>
#include <utility>
#include <vector>

/**
 * @brief Parsing helpers for nmcli terse (-t) output
 *
 * In terse mode nmcli separates fields with ':' and escapes a literal ':' as
 * "\:" and a literal '\' as "\\". Multi-line "device show" output is
 * KEY:VALUE per line, and MAC addresses are printed unescaped.
 */
namespace tether::nmcli {

/**
 * @brief Split one terse line into fields, undoing nmcli escaping
 *
 * "MyNet\:5G:80:WPA2" -> {"MyNet:5G", "80", "WPA2"}
 */
std::vector<std::string> split_fields(const std::string& line);

/// Undo terse escaping on a single value ("a\:b" -> "a:b")
std::string unescape(const std::string& value);

/// Apply terse escaping to a single value ("a:b" -> "a\:b")
std::string escape(const std::string& value);

/// Split command output into lines, dropping '\r' and trailing empty line
std::vector<std::string> split_lines(const std::string& output);

/**
 * @brief Split "KEY:VALUE" on the first colon only
 *
 * The value keeps any further colons (MAC addresses). Returns false when the
 * line has no colon at all.
 */
bool split_key_value(const std::string& line, std::string& key, std::string& value);

/**
 * @brief Normalize a SECURITY column
 *
 * Substring priority WPA3 > WPA2 > WPA > WEP; empty or "--" is OPEN;
 * anything else is UNKNOWN.
 */
WiFiSecurity parse_security(const std::string& security);

/**
 * @brief Parse the leading decimal digits of @p text
 *
 * "2437 MHz" -> 2437. Returns @p fallback when no digits lead the string.
 */
int parse_leading_int(const std::string& text, int fallback = 0);

/**
 * @brief Parse `-f SSID,SIGNAL,SECURITY,FREQ device wifi list` output
 *
 * Hidden networks (empty SSID) are dropped. Signal is clamped to 0-100;
 * unparsable signal or frequency become 0. Duplicate SSIDs (one per BSSID)
 * are kept as reported.
 */
std::vector<WiFiNetwork> parse_scan_output(const std::string& output);

/**
 * @brief Reject values nmcli can't take as a profile property
 *
 * Empty, longer than 255 bytes, or containing control characters. Logs the
 * reason using @p field_name.
 */
bool validate_input(const std::string& input, const char* field_name);

/// "yes"/"no" column values
bool parse_yes_no(const std::string& value);

} // namespace tether::nmcli

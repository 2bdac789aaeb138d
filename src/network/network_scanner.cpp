// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "network_scanner.h"

#include "nmcli_output.h"
#include "nmcli_runner.h"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace tether {

NetworkScanner::NetworkScanner(NmcliRunner& runner, std::function<bool()> is_initialized)
    : runner_(runner), is_initialized_(std::move(is_initialized)) {}

void NetworkScanner::scan_networks(WiFiResultCallback<std::vector<WiFiNetwork>> callback) {
    spdlog::debug("[NetworkScanner] scan_networks()");

    if (!is_initialized_()) {
        spdlog::warn("[NetworkScanner] Scan requested before initialization");
        callback(WiFiErrorHelper::not_initialized(), {});
        return;
    }

    runner_.run({"-t", "-f", "SSID,SIGNAL,SECURITY,FREQ", "device", "wifi", "list", "--rescan",
                 "yes"},
                [callback](const NmcliResult& result) {
                    if (!result.ok()) {
                        spdlog::error("[NetworkScanner] Scan failed: {}", result.describe());
                        callback(WiFiErrorHelper::scan_failed(result.describe()), {});
                        return;
                    }

                    auto networks = nmcli::parse_scan_output(result.out);
                    spdlog::debug("[NetworkScanner] Found {} networks", networks.size());
                    for (const auto& net : networks) {
                        spdlog::trace("[NetworkScanner]   '{}' ({}%, {}, {} MHz)", net.ssid,
                                      net.signal_strength, wifi_security_name(net.security),
                                      net.frequency_mhz);
                    }
                    callback(WiFiErrorHelper::success(), networks);
                });
}

void NetworkScanner::is_network_visible(const std::string& ssid,
                                        WiFiResultCallback<bool> callback) {
    spdlog::debug("[NetworkScanner] is_network_visible('{}')", ssid);

    if (!is_initialized_()) {
        spdlog::debug("[NetworkScanner] Not initialized, '{}' treated as not visible", ssid);
        callback(WiFiErrorHelper::success(), false);
        return;
    }

    runner_.run({"-t", "-f", "SSID", "device", "wifi", "list", "--rescan", "yes"},
                [ssid, callback](const NmcliResult& result) {
                    if (!result.ok()) {
                        spdlog::debug("[NetworkScanner] Visibility check failed ({}), assuming "
                                      "'{}' not visible",
                                      result.describe(), ssid);
                        callback(WiFiErrorHelper::success(), false);
                        return;
                    }

                    auto lines = nmcli::split_lines(result.out);
                    bool visible =
                        std::any_of(lines.begin(), lines.end(), [&ssid](const std::string& line) {
                            return nmcli::unescape(line) == ssid;
                        });
                    spdlog::debug("[NetworkScanner] '{}' {}", ssid,
                                  visible ? "is visible" : "not visible");
                    callback(WiFiErrorHelper::success(), visible);
                });
}

void NetworkScanner::get_signal_strength(const std::string& ssid,
                                         WiFiResultCallback<int> callback) {
    // Reads the cached list: a rescan here would run on every status query
    runner_.run({"-t", "-f", "SSID,SIGNAL", "device", "wifi", "list", "--rescan", "no"},
                [ssid, callback](const NmcliResult& result) {
                    if (!result.ok()) {
                        spdlog::debug("[NetworkScanner] Could not get signal for '{}': {}", ssid,
                                      result.describe());
                        callback(WiFiErrorHelper::success(), 0);
                        return;
                    }

                    for (const auto& line : nmcli::split_lines(result.out)) {
                        auto fields = nmcli::split_fields(line);
                        if (fields.size() >= 2 && fields[0] == ssid) {
                            int signal =
                                std::max(0, std::min(100, nmcli::parse_leading_int(fields[1])));
                            callback(WiFiErrorHelper::success(), signal);
                            return;
                        }
                    }
                    spdlog::debug("[NetworkScanner] '{}' not in scan list, signal 0", ssid);
                    callback(WiFiErrorHelper::success(), 0);
                });
}

} // namespace tether

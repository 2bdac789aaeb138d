// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nmcli_runner_mock.h"

#include "event_scheduler.h"
#include "nmcli_output.h"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace tether {

namespace {

constexpr int NMCLI_EXIT_USAGE = 2;
constexpr int NMCLI_EXIT_ACTIVATION_FAILED = 4;
constexpr int NMCLI_EXIT_DISCONNECT_FAILED = 6;
constexpr int NMCLI_EXIT_NM_NOT_RUNNING = 8;
constexpr int NMCLI_EXIT_NOT_FOUND = 10;

NmcliResult ok_result(const std::string& out = "") {
    NmcliResult r;
    r.spawned = true;
    r.exit_code = 0;
    r.out = out;
    return r;
}

NmcliResult error_result(int code, const std::string& err) {
    NmcliResult r;
    r.spawned = true;
    r.exit_code = code;
    r.err = err + "\n";
    return r;
}

/// Value following @p flag in argv ("-f" -> "SSID,SIGNAL"), empty if absent
std::string flag_value(const std::vector<std::string>& args, const std::string& flag) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag) {
            return args[i + 1];
        }
    }
    return "";
}

std::vector<std::string> split_csv(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == ',') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

NmcliRunnerMock::NmcliRunnerMock(EventScheduler& scheduler) : scheduler_(scheduler) {
    spdlog::debug("[NmcliMock] Simulated NetworkManager created");
}

void NmcliRunnerMock::seed_demo_environment() {
    add_access_point({"HomeNetwork", 78, "WPA2", 2437, "homepass123"});
    add_access_point({"Tether-Setup", 64, "WPA2", 2412, "tether1234"});
    add_access_point({"Cafe Guest", 41, "", 2462, ""});
    add_access_point({"Neighbor:5G", 33, "WPA2 WPA3", 5180, "neighborpw"});
    add_access_point({"", 20, "WPA2", 2412, "hidden"});

    MockProfile home;
    home.name = "HomeNetwork";
    home.ssid = "HomeNetwork";
    home.psk = "homepass123";
    add_profile(home);

    MockProfile wired;
    wired.name = "Wired connection 1";
    wired.type = "802-3-ethernet";
    add_profile(wired);

    set_active_connection("HomeNetwork");
    spdlog::info("[NmcliMock] Demo environment: {} access points, {} profiles, active '{}'",
                 access_points_.size(), profiles_.size(), active_profile_);
}

// ============================================================================
// State manipulation
// ============================================================================

void NmcliRunnerMock::add_access_point(const MockAccessPoint& ap) {
    access_points_.push_back(ap);
}

void NmcliRunnerMock::remove_access_point(const std::string& ssid) {
    access_points_.erase(std::remove_if(access_points_.begin(), access_points_.end(),
                                        [&](const MockAccessPoint& ap) { return ap.ssid == ssid; }),
                         access_points_.end());
}

void NmcliRunnerMock::clear_access_points() {
    access_points_.clear();
}

void NmcliRunnerMock::add_profile(const MockProfile& profile) {
    auto it = profile_iter(profile.name);
    if (it != profiles_.end()) {
        *it = profile;
    } else {
        profiles_.push_back(profile);
    }
}

bool NmcliRunnerMock::has_profile(const std::string& name) const {
    return find_profile(name) != nullptr;
}

const MockProfile* NmcliRunnerMock::find_profile(const std::string& name) const {
    for (const auto& p : profiles_) {
        if (p.name == name) {
            return &p;
        }
    }
    return nullptr;
}

std::vector<MockProfile>::iterator NmcliRunnerMock::profile_iter(const std::string& name) {
    return std::find_if(profiles_.begin(), profiles_.end(),
                        [&](const MockProfile& p) { return p.name == name; });
}

const MockAccessPoint* NmcliRunnerMock::find_access_point(const std::string& ssid) const {
    for (const auto& ap : access_points_) {
        if (ap.ssid == ssid) {
            return &ap;
        }
    }
    return nullptr;
}

void NmcliRunnerMock::set_active_connection(const std::string& profile_name) {
    active_profile_ = profile_name;
    active_ip_ = "192.168.1." + std::to_string(next_host_octet_++) + "/24";
}

void NmcliRunnerMock::drop_connection() {
    active_profile_.clear();
    active_ip_.clear();
}

// ============================================================================
// Test controls
// ============================================================================

void NmcliRunnerMock::hold_matching(const std::string& pattern) {
    hold_patterns_.push_back(pattern);
}

void NmcliRunnerMock::stop_holding() {
    hold_patterns_.clear();
}

void NmcliRunnerMock::release_held() {
    auto held = std::move(held_);
    held_.clear();
    for (auto& cmd : held) {
        deliver(std::move(cmd.on_done), execute(cmd.args));
    }
}

void NmcliRunnerMock::fail_matching(const std::string& pattern, int exit_code,
                                    const std::string& err) {
    failures_.push_back({pattern, exit_code, err});
}

void NmcliRunnerMock::clear_failures() {
    failures_.clear();
}

size_t NmcliRunnerMock::count_matching(const std::string& pattern) const {
    return static_cast<size_t>(
        std::count_if(history_.begin(), history_.end(), [&](const std::string& cmd) {
            return cmd.find(pattern) != std::string::npos;
        }));
}

// ============================================================================
// Dispatch
// ============================================================================

void NmcliRunnerMock::run(const std::vector<std::string>& args, Completion on_done) {
    std::string rendered = format_nmcli_command(args);
    history_.push_back(rendered);
    spdlog::trace("[NmcliMock] {}", rendered);

    for (const auto& pattern : hold_patterns_) {
        if (rendered.find(pattern) != std::string::npos) {
            spdlog::trace("[NmcliMock] Holding '{}'", rendered);
            held_.push_back({args, std::move(on_done)});
            return;
        }
    }

    deliver(std::move(on_done), execute(args));
}

void NmcliRunnerMock::deliver(Completion on_done, NmcliResult result) {
    // Always asynchronous, like a real process completion
    scheduler_.post([on_done = std::move(on_done), result = std::move(result)]() {
        if (on_done) {
            on_done(result);
        }
    });
}

NmcliResult NmcliRunnerMock::execute(const std::vector<std::string>& args) {
    std::string rendered = format_nmcli_command(args);
    for (const auto& failure : failures_) {
        if (rendered.find(failure.pattern) != std::string::npos) {
            return error_result(failure.exit_code, failure.err);
        }
    }

    if (!available_) {
        return error_result(NMCLI_EXIT_NM_NOT_RUNNING, "Error: NetworkManager is not running.");
    }

    // Skip global options (-t, -f FIELDS) to find the object/verb
    size_t i = 0;
    while (i < args.size() && !args[i].empty() && args[i][0] == '-') {
        i += (args[i] == "-f") ? 2 : 1;
    }
    if (i >= args.size()) {
        return error_result(NMCLI_EXIT_USAGE, "Error: argument missing.");
    }

    const std::string& object = args[i];
    std::string verb = i + 1 < args.size() ? args[i + 1] : "";
    std::string operand = i + 2 < args.size() ? args[i + 2] : "";

    if (object == "general" && verb == "status") {
        return general_status();
    }
    if (object == "device") {
        if (verb == "wifi" && operand == "list") {
            return wifi_list(args);
        }
        if (verb == "show") {
            return device_show(operand);
        }
        if (verb == "disconnect") {
            return device_disconnect(operand);
        }
    }
    if (object == "connection") {
        if (verb == "show") {
            return operand.empty() ? connection_list() : connection_show(operand);
        }
        if (verb == "add") {
            return connection_add(args, i + 2);
        }
        if (verb == "delete") {
            return connection_delete(operand);
        }
        if (verb == "up") {
            return connection_up(operand);
        }
    }

    return error_result(NMCLI_EXIT_USAGE, "Error: argument '" + object + "' not understood.");
}

// ============================================================================
// Commands
// ============================================================================

NmcliResult NmcliRunnerMock::general_status() {
    std::string state = active_profile_.empty() ? "disconnected" : "connected";
    return ok_result(state + ":full:enabled:enabled:enabled:enabled\n");
}

NmcliResult NmcliRunnerMock::wifi_list(const std::vector<std::string>& args) {
    auto fields = split_csv(flag_value(args, "-f"));
    if (fields.empty()) {
        fields = {"SSID", "SIGNAL", "SECURITY", "FREQ"};
    }

    std::string out;
    for (const auto& ap : access_points_) {
        std::string line;
        for (size_t f = 0; f < fields.size(); ++f) {
            if (f > 0) {
                line += ':';
            }
            if (fields[f] == "SSID") {
                line += nmcli::escape(ap.ssid);
            } else if (fields[f] == "SIGNAL") {
                line += std::to_string(ap.signal);
            } else if (fields[f] == "SECURITY") {
                line += nmcli::escape(ap.security);
            } else if (fields[f] == "FREQ") {
                line += std::to_string(ap.frequency_mhz) + " MHz";
            }
        }
        out += line + "\n";
    }
    return ok_result(out);
}

NmcliResult NmcliRunnerMock::device_show(const std::string& iface) {
    if (iface != interface_) {
        return error_result(NMCLI_EXIT_NOT_FOUND, "Error: Device '" + iface + "' not found.");
    }

    std::string out = "GENERAL.HWADDR:" + hwaddr_ + "\n";
    out += "GENERAL.CONNECTION:" +
           (active_profile_.empty() ? std::string("--") : nmcli::escape(active_profile_)) + "\n";
    if (!active_profile_.empty()) {
        out += "IP4.ADDRESS[1]:" + active_ip_ + "\n";
    }
    return ok_result(out);
}

NmcliResult NmcliRunnerMock::device_disconnect(const std::string& iface) {
    if (iface != interface_) {
        return error_result(NMCLI_EXIT_NOT_FOUND, "Error: Device '" + iface + "' not found.");
    }
    if (active_profile_.empty()) {
        return error_result(NMCLI_EXIT_DISCONNECT_FAILED,
                            "Error: Device '" + iface +
                                "' disconnecting failed: This device is not active");
    }
    drop_connection();
    return ok_result("Device '" + iface + "' successfully disconnected.\n");
}

NmcliResult NmcliRunnerMock::connection_list() {
    std::string out;
    for (const auto& p : profiles_) {
        out += nmcli::escape(p.name) + ":" + p.type + ":" + (p.autoconnect ? "yes" : "no") + ":" +
               std::to_string(p.priority) + "\n";
    }
    return ok_result(out);
}

NmcliResult NmcliRunnerMock::connection_show(const std::string& name) {
    const MockProfile* profile = find_profile(name);
    if (!profile) {
        return error_result(NMCLI_EXIT_NOT_FOUND,
                            "Error: " + name + " - no such connection profile.");
    }
    std::string out = "connection.id:                          " + profile->name + "\n";
    out += "connection.type:                        " + profile->type + "\n";
    return ok_result(out);
}

NmcliResult NmcliRunnerMock::connection_add(const std::vector<std::string>& args, size_t first) {
    MockProfile profile;
    // Property/value pairs: type wifi con-name X ifname Y ssid Z ...
    for (size_t i = first; i + 1 < args.size(); i += 2) {
        const std::string& key = args[i];
        const std::string& value = args[i + 1];
        if (key == "type") {
            profile.type = (value == "wifi") ? "802-11-wireless" : value;
        } else if (key == "con-name") {
            profile.name = value;
        } else if (key == "ssid") {
            profile.ssid = value;
        } else if (key == "wifi-sec.psk") {
            profile.psk = value;
        } else if (key == "connection.autoconnect") {
            profile.autoconnect = nmcli::parse_yes_no(value);
        } else if (key == "connection.autoconnect-priority") {
            profile.priority = nmcli::parse_leading_int(value);
        }
    }

    if (profile.name.empty()) {
        profile.name = profile.ssid;
    }
    if (profile.ssid.empty()) {
        return error_result(NMCLI_EXIT_USAGE,
                            "Error: Failed to add '" + profile.name +
                                "' connection: 802-11-wireless.ssid: property is missing");
    }

    add_profile(profile);
    return ok_result("Connection '" + profile.name +
                     "' (3f2a9c1e-7d2b-4f7e-9a51-000000000000) successfully added.\n");
}

NmcliResult NmcliRunnerMock::connection_delete(const std::string& name) {
    auto it = profile_iter(name);
    if (it == profiles_.end()) {
        return error_result(NMCLI_EXIT_NOT_FOUND, "Error: unknown connection '" + name + "'.");
    }
    profiles_.erase(it);
    if (active_profile_ == name) {
        drop_connection();
    }
    return ok_result("Connection '" + name + "' successfully deleted.\n");
}

NmcliResult NmcliRunnerMock::connection_up(const std::string& name) {
    const MockProfile* profile = find_profile(name);
    if (!profile) {
        return error_result(NMCLI_EXIT_NOT_FOUND, "Error: unknown connection '" + name + "'.");
    }

    const MockAccessPoint* ap = find_access_point(profile->ssid);
    if (!ap) {
        return error_result(NMCLI_EXIT_ACTIVATION_FAILED,
                            "Error: Connection activation failed: The Wi-Fi network could not "
                            "be found.");
    }
    if (!ap->password.empty() && profile->psk != ap->password) {
        return error_result(NMCLI_EXIT_ACTIVATION_FAILED,
                            "Error: Connection activation failed: Secrets were required, but "
                            "not provided.");
    }

    set_active_connection(name);
    return ok_result("Connection successfully activated (D-Bus active path: "
                     "/org/freedesktop/NetworkManager/ActiveConnection/" +
                     std::to_string(next_active_path_++) + ")\n");
}

} // namespace tether

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "app_constants.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace tether {

Config* Config::instance{NULL};

namespace {

json get_default_config() {
    return {{"log_level", "info"},
            {"log_dest", "auto"},
            {"log_file", ""},
            {"onboarding_completed", false},
            {"wifi",
             {{"interface", AppConstants::WiFi::DEFAULT_INTERFACE},
              {"primary_ssid", AppConstants::WiFi::DEFAULT_PRIMARY_SSID},
              {"primary_password", AppConstants::WiFi::DEFAULT_PRIMARY_PASSWORD},
              {"connection_timeout_ms", AppConstants::WiFi::DEFAULT_CONNECTION_TIMEOUT_MS},
              {"hotspot", nullptr},
              {"fallback_network", nullptr}}}};
}

/// Recursively add keys present in @p defaults but missing from @p target
bool fill_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        } else if (value.is_object() && target[key].is_object()) {
            modified |= fill_missing(target[key], value);
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == NULL) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt - resetting to defaults");

            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }
            data = get_default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Config root is not an object - resetting to defaults");
            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;

        std::error_code ec;
        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
    }

    if (fill_missing(data, get_default_config())) {
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with in-memory defaults; changes will not persist");
    }

    spdlog::debug("[Config] initialized: interface={} hotspot override={} fallback={}",
                  get<std::string>("/wifi/interface", AppConstants::WiFi::DEFAULT_INTERFACE),
                  get_hotspot_config().has_value(), get_fallback_network().has_value());
}

std::string Config::get_path() const {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    if (path.empty()) {
        spdlog::error("[Config] Cannot save: no config path set");
        return false;
    }

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

// ============================================================================
// Typed accessors
// ============================================================================

WifiSettings Config::wifi_settings() {
    WifiSettings settings;
    settings.interface =
        get<std::string>("/wifi/interface", AppConstants::WiFi::DEFAULT_INTERFACE);
    settings.primary_ssid =
        get<std::string>("/wifi/primary_ssid", AppConstants::WiFi::DEFAULT_PRIMARY_SSID);
    settings.primary_password = get<std::string>("/wifi/primary_password",
                                                 AppConstants::WiFi::DEFAULT_PRIMARY_PASSWORD);
    settings.connection_timeout_ms =
        get<int>("/wifi/connection_timeout_ms", AppConstants::WiFi::DEFAULT_CONNECTION_TIMEOUT_MS);
    if (settings.connection_timeout_ms <= 0) {
        spdlog::warn("[Config] Invalid connection_timeout_ms {}, using {}",
                     settings.connection_timeout_ms,
                     AppConstants::WiFi::DEFAULT_CONNECTION_TIMEOUT_MS);
        settings.connection_timeout_ms = AppConstants::WiFi::DEFAULT_CONNECTION_TIMEOUT_MS;
    }
    return settings;
}

std::optional<HotspotConfig> Config::get_hotspot_config() {
    // contains() first: operator[] would create a null entry
    json::json_pointer ptr("/wifi/hotspot");
    if (!data.contains(ptr) || !data[ptr].is_object()) {
        return std::nullopt;
    }
    const json& node = data[ptr];
    HotspotConfig hotspot;
    hotspot.ssid = node.value("ssid", "");
    hotspot.password = node.value("password", "");
    hotspot.updated_at = node.value("updated_at", "");
    if (hotspot.ssid.empty()) {
        return std::nullopt;
    }
    return hotspot;
}

void Config::set_hotspot_config(const HotspotConfig& hotspot) {
    data[json::json_pointer("/wifi/hotspot")] = {{"ssid", hotspot.ssid},
                                                 {"password", hotspot.password},
                                                 {"updated_at", hotspot.updated_at}};
}

std::optional<FallbackNetwork> Config::get_fallback_network() {
    json::json_pointer ptr("/wifi/fallback_network");
    if (!data.contains(ptr) || !data[ptr].is_object()) {
        return std::nullopt;
    }
    const json& node = data[ptr];
    FallbackNetwork fallback;
    fallback.ssid = node.value("ssid", "");
    fallback.saved_at = node.value("saved_at", "");
    if (fallback.ssid.empty()) {
        return std::nullopt;
    }
    return fallback;
}

void Config::set_fallback_network(const std::optional<FallbackNetwork>& fallback) {
    json::json_pointer ptr("/wifi/fallback_network");
    if (fallback) {
        data[ptr] = {{"ssid", fallback->ssid}, {"saved_at", fallback->saved_at}};
    } else {
        data[ptr] = nullptr;
    }
}

bool Config::is_onboarding_completed() {
    return get<bool>("/onboarding_completed", true);
}

void Config::set_onboarding_completed(bool completed) {
    set<bool>("/onboarding_completed", completed);
}

} // namespace tether

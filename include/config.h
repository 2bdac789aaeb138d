// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __TETHER_CONFIG_H__
#define __TETHER_CONFIG_H__

#include "wifi_types.h"

#include "spdlog/spdlog.h"

#include <optional>
#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace tether {

/**
 * @brief Daemon configuration manager
 *
 * Loads and manages configuration from a JSON file. Uses JSON pointer syntax
 * (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialized once at startup and accessed
 * from the event loop thread only.
 *
 * Layout:
 * ```json
 * {
 *   "log_level": "info",
 *   "log_dest": "auto",
 *   "log_file": "",
 *   "onboarding_completed": false,
 *   "wifi": {
 *     "interface": "wlan0",
 *     "primary_ssid": "Tether-Setup",
 *     "primary_password": "tether1234",
 *     "connection_timeout_ms": 60000,
 *     "hotspot": {"ssid": "...", "password": "...", "updated_at": "..."},
 *     "fallback_network": {"ssid": "...", "saved_at": "..."}
 *   }
 * }
 * ```
 * "hotspot" and "fallback_network" are null when unset.
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults if it doesn't exist.
     * A file that fails to parse is moved aside to "<path>.corrupt" and
     * replaced by defaults. Missing keys are filled in and written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist, is null, or holds a
     * value of the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr) || data[ptr].is_null()) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Wrong type at {}: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Write configuration to file with pretty formatting
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path() const;

    // ========================================================================
    // Typed accessors
    // ========================================================================

    /// Device WiFi settings, each field falling back to its compiled default
    WifiSettings wifi_settings();

    /// Persisted hotspot override, or nullopt when none is set
    std::optional<HotspotConfig> get_hotspot_config();
    void set_hotspot_config(const HotspotConfig& hotspot);

    /// Persisted fallback network, or nullopt when none is recorded
    std::optional<FallbackNetwork> get_fallback_network();

    /// Record (or with nullopt, clear) the fallback network; in-memory until save()
    void set_fallback_network(const std::optional<FallbackNetwork>& fallback);

    /// Onboarding flag; missing means complete
    bool is_onboarding_completed();
    void set_onboarding_completed(bool completed);

    static Config* get_instance();
};

} // namespace tether

#endif // __TETHER_CONFIG_H__

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace tether {

// Test fixture for Config class testing
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        static std::atomic<int> counter{0};
        path = (std::filesystem::temp_directory_path() /
                ("tether_config_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++) + ".json"))
                   .string();
        std::filesystem::remove(path);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path + ".corrupt", ec);
    }

  protected:
    Config config;
    std::string path;

    // Helper methods to access protected members
    void set_data(const json& value) {
        config.data = value;
    }

    json& data() {
        return config.data;
    }

    void write_file(const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }

    std::string read_file(const std::string& file) {
        std::ifstream in(file);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

} // namespace tether

using namespace tether;

// ============================================================================
// init()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates defaults when file is missing",
                 "[core][config][init]") {
    config.init(path);

    REQUIRE(std::filesystem::exists(path));
    CHECK(config.get_path() == path);
    CHECK(config.get<std::string>("/wifi/interface") == "wlan0");
    CHECK(config.get<std::string>("/wifi/primary_ssid") == "Tether-Setup");
    CHECK(config.get<int>("/wifi/connection_timeout_ms") == 60000);
    CHECK(config.get<std::string>("/log_level") == "info");
    CHECK(data()["wifi"]["hotspot"].is_null());
    CHECK(data()["wifi"]["fallback_network"].is_null());

    // A fresh device has not been onboarded
    CHECK_FALSE(config.is_onboarding_completed());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps existing values and fills gaps",
                 "[core][config][init]") {
    write_file(R"({"wifi": {"interface": "wlan1", "connection_timeout_ms": 30000}})");
    config.init(path);

    CHECK(config.get<std::string>("/wifi/interface") == "wlan1");
    CHECK(config.get<int>("/wifi/connection_timeout_ms") == 30000);
    CHECK(config.get<std::string>("/wifi/primary_ssid") == "Tether-Setup");
    CHECK(config.get<std::string>("/log_dest") == "auto");

    // Written back with the missing keys
    auto on_disk = json::parse(read_file(path));
    CHECK(on_disk["wifi"]["interface"] == "wlan1");
    CHECK(on_disk["wifi"].contains("primary_password"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() sets aside a corrupt file",
                 "[core][config][init]") {
    write_file("{ this is not json");
    config.init(path);

    REQUIRE(std::filesystem::exists(path + ".corrupt"));
    CHECK(read_file(path + ".corrupt") == "{ this is not json");
    CHECK(config.get<std::string>("/wifi/interface") == "wlan0");

    // The replacement parses
    CHECK_NOTHROW(json::parse(read_file(path)));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() replaces a non-object root",
                 "[core][config][init]") {
    write_file("[1, 2, 3]");
    config.init(path);

    CHECK(data().is_object());
    CHECK(config.get<std::string>("/wifi/interface") == "wlan0");
}

// ============================================================================
// get() / set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default", "[core][config][get]") {
    set_data({{"wifi", {{"interface", "wlan2"}, {"hotspot", nullptr}}}, {"log_level", 3}});

    SECTION("existing value") {
        CHECK(config.get<std::string>("/wifi/interface", "wlan0") == "wlan2");
    }

    SECTION("missing path") {
        CHECK(config.get<std::string>("/wifi/missing", "fallback") == "fallback");
        // Not created as a side effect
        CHECK_FALSE(data()["wifi"].contains("missing"));
    }

    SECTION("null value") {
        CHECK(config.get<std::string>("/wifi/hotspot", "none") == "none");
    }

    SECTION("wrong type") {
        CHECK(config.get<std::string>("/log_level", "info") == "info");
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() without default throws on wrong type",
                 "[core][config][get]") {
    set_data({{"wifi", {{"interface", 5}}}});
    REQUIRE_THROWS_AS(config.get<std::string>("/wifi/interface"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects",
                 "[core][config][set]") {
    set_data(json::object());
    config.set<std::string>("/wifi/interface", "wlan3");
    CHECK(config.get<std::string>("/wifi/interface") == "wlan3");
    CHECK(config.get_json("/wifi").is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() without a path fails", "[core][config][save]") {
    set_data(json::object());
    CHECK_FALSE(config.save());
}

// ============================================================================
// Typed accessors
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: wifi_settings()", "[core][config][wifi]") {
    config.init(path);

    SECTION("defaults") {
        auto settings = config.wifi_settings();
        CHECK(settings.interface == "wlan0");
        CHECK(settings.primary_ssid == "Tether-Setup");
        CHECK(settings.primary_password == "tether1234");
        CHECK(settings.connection_timeout_ms == 60000);
    }

    SECTION("overrides") {
        config.set<std::string>("/wifi/interface", "wlp2s0");
        config.set<int>("/wifi/connection_timeout_ms", 45000);
        auto settings = config.wifi_settings();
        CHECK(settings.interface == "wlp2s0");
        CHECK(settings.connection_timeout_ms == 45000);
    }

    SECTION("non-positive timeout falls back") {
        config.set<int>("/wifi/connection_timeout_ms", 0);
        CHECK(config.wifi_settings().connection_timeout_ms == 60000);
        config.set<int>("/wifi/connection_timeout_ms", -5);
        CHECK(config.wifi_settings().connection_timeout_ms == 60000);
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: hotspot override", "[core][config][wifi]") {
    config.init(path);
    CHECK_FALSE(config.get_hotspot_config().has_value());

    config.set_hotspot_config(HotspotConfig{"MyPhone", "phonepass1", "2026-03-01T10:00:00Z"});
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    auto hotspot = reloaded.get_hotspot_config();
    REQUIRE(hotspot.has_value());
    CHECK(hotspot->ssid == "MyPhone");
    CHECK(hotspot->password == "phonepass1");
    CHECK(hotspot->updated_at == "2026-03-01T10:00:00Z");

    SECTION("empty SSID counts as unset") {
        config.set_hotspot_config(HotspotConfig{"", "phonepass1", ""});
        CHECK_FALSE(config.get_hotspot_config().has_value());
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: fallback network", "[core][config][wifi]") {
    config.init(path);
    CHECK_FALSE(config.get_fallback_network().has_value());

    config.set_fallback_network(FallbackNetwork{"HomeNetwork", "2026-03-01T10:00:00Z"});
    auto fallback = config.get_fallback_network();
    REQUIRE(fallback.has_value());
    CHECK(fallback->ssid == "HomeNetwork");
    CHECK(fallback->saved_at == "2026-03-01T10:00:00Z");

    config.set_fallback_network(std::nullopt);
    CHECK_FALSE(config.get_fallback_network().has_value());
    CHECK(data()["wifi"]["fallback_network"].is_null());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: onboarding flag", "[core][config]") {
    SECTION("missing key means completed") {
        set_data(json::object());
        CHECK(config.is_onboarding_completed());
    }

    SECTION("round trip") {
        config.init(path);
        config.set_onboarding_completed(true);
        CHECK(config.is_onboarding_completed());
        config.set_onboarding_completed(false);
        CHECK_FALSE(config.is_onboarding_completed());
    }
}

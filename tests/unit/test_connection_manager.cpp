// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_manager.h"
#include "network_scanner.h"
#include "nmcli_runner_mock.h"

#include "mocks/manual_scheduler.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>

namespace {

class ConnectionFixture {
  protected:
    ManualScheduler scheduler;
    NmcliRunnerMock nmcli{scheduler};
    bool initialized = true;
    NetworkScanner scanner{nmcli, [this] { return initialized; }};
    std::unique_ptr<ConnectionManager> manager;

    ConnectionFixture() {
        nmcli.seed_demo_environment();
        create_manager(60000);
    }

    void create_manager(int timeout_ms) {
        WifiSettings settings;
        settings.interface = "wlan0";
        settings.connection_timeout_ms = timeout_ms;
        manager = std::make_unique<ConnectionManager>(scheduler, nmcli, scanner, settings,
                                                      [this] { return initialized; });
    }

    std::optional<WiFiConnection> current() {
        bool done = false;
        std::optional<WiFiConnection> connection;
        manager->get_current_connection(
            [&](const WiFiError& err, const std::optional<WiFiConnection>& c) {
                REQUIRE(err.success());
                connection = c;
                done = true;
            });
        scheduler.run_pending();
        REQUIRE(done);
        return connection;
    }

    WiFiError run_connect(const std::string& ssid, const std::string& password) {
        std::optional<WiFiError> result;
        manager->connect(ssid, password, [&](const WiFiError& err) { result = err; });
        scheduler.run_pending();
        REQUIRE(result.has_value());
        return *result;
    }

    WiFiError run_disconnect() {
        std::optional<WiFiError> result;
        manager->disconnect([&](const WiFiError& err) { result = err; });
        scheduler.run_pending();
        REQUIRE(result.has_value());
        return *result;
    }
};

} // namespace

// ============================================================================
// Status
// ============================================================================

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: current connection snapshot",
                 "[network][connection]") {
    auto connection = current();
    REQUIRE(connection.has_value());
    CHECK(connection->ssid == "HomeNetwork");
    CHECK(connection->ip_address.rfind("192.168.1.", 0) == 0);
    CHECK(connection->ip_address.find('/') == std::string::npos);
    CHECK(connection->mac_address == "DC:A6:32:12:34:56");
    CHECK(connection->signal_strength == 78);

    SECTION("offline yields nullopt") {
        nmcli.drop_connection();
        CHECK_FALSE(current().has_value());
    }

    SECTION("status query failure is treated as offline") {
        nmcli.set_available(false);
        CHECK_FALSE(current().has_value());
    }
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: operations before initialization",
                 "[network][connection]") {
    initialized = false;
    std::vector<WiFiResult> results;
    auto record = [&](const WiFiError& err) { results.push_back(err.result); };

    manager->connect("HomeNetwork", "homepass123", record);
    manager->disconnect(record);
    manager->remove_network("HomeNetwork", record);
    WiFiNetworkConfig config;
    config.ssid = "HomeNetwork";
    config.password = "homepass123";
    manager->save_network(config, record);

    // All synchronous
    REQUIRE(results.size() == 4);
    for (auto r : results) {
        CHECK(r == WiFiResult::NOT_INITIALIZED);
    }
    CHECK(nmcli.history().empty());
}

// ============================================================================
// Connect / disconnect
// ============================================================================

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: connect creates and activates a profile",
                 "[network][connection]") {
    auto err = run_connect("Tether-Setup", "tether1234");
    REQUIRE(err.success());
    CHECK(nmcli.active_connection() == "Tether-Setup");
    REQUIRE(nmcli.find_profile("Tether-Setup") != nullptr);
    CHECK(nmcli.find_profile("Tether-Setup")->psk == "tether1234");
    CHECK(nmcli.count_matching("wifi-sec.key-mgmt wpa-psk") == 1);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: open network omits security settings",
                 "[network][connection]") {
    REQUIRE(run_connect("Cafe Guest", "").success());
    CHECK(nmcli.active_connection() == "Cafe Guest");
    CHECK(nmcli.count_matching("wifi-sec") == 0);

    REQUIRE(run_disconnect().success());
    CHECK(nmcli.active_connection().empty());

    SECTION("second disconnect reports not connected") {
        auto err = run_disconnect();
        CHECK(err.result == WiFiResult::NOT_CONNECTED);
        CHECK(nmcli.count_matching("device disconnect") == 1);
    }
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: existing profile is replaced",
                 "[network][connection]") {
    REQUIRE(run_connect("HomeNetwork", "homepass123").success());
    CHECK(nmcli.count_matching("connection delete HomeNetwork") == 1);
    CHECK(nmcli.count_matching("connection add") == 1);
    CHECK(nmcli.active_connection() == "HomeNetwork");
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: rejected secret is AUTH_FAILED",
                 "[network][connection]") {
    auto err = run_connect("HomeNetwork", "wrongpass1");
    CHECK(err.result == WiFiResult::AUTH_FAILED);
    CHECK_FALSE(err.user_msg.empty());
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: stderr noise on a successful activation",
                 "[network][connection]") {
    // Exit code 0, with a warning that names the security setting
    nmcli.fail_matching("connection up HomeNetwork", 0,
                        "Warning: 802-11-wireless-security.psk-flags is deprecated");
    auto err = run_connect("HomeNetwork", "homepass123");
    CHECK(err.success());
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: other activation failures",
                 "[network][connection]") {
    auto err = run_connect("Far Away", "farawaypw");
    CHECK(err.result == WiFiResult::CONNECTION_FAILED);
    CHECK(err.technical_msg.find("could not be found") != std::string::npos);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: invalid parameters are rejected",
                 "[network][connection]") {
    std::vector<WiFiResult> results;
    auto record = [&](const WiFiError& err) { results.push_back(err.result); };

    manager->connect("", "password1", record);
    manager->connect("Bad\nSSID", "password1", record);
    manager->connect("HomeNetwork", std::string("pass\0word", 9), record);

    REQUIRE(results.size() == 3);
    for (auto r : results) {
        CHECK(r == WiFiResult::INVALID_PARAMETERS);
    }
    CHECK(nmcli.history().empty());
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: activation races the timeout",
                 "[network][connection][timeout]") {
    create_manager(1000);
    nmcli.hold_matching("connection up");

    int calls = 0;
    std::optional<WiFiError> result;
    manager->connect("Tether-Setup", "tether1234", [&](const WiFiError& err) {
        calls++;
        result = err;
    });
    scheduler.run_pending();
    REQUIRE(nmcli.held_count() == 1);
    REQUIRE_FALSE(result.has_value());

    scheduler.advance(999);
    REQUIRE_FALSE(result.has_value());

    scheduler.advance(1);
    REQUIRE(result.has_value());
    CHECK(result->result == WiFiResult::TIMEOUT);

    SECTION("late driver success is dropped") {
        nmcli.release_held();
        scheduler.run_pending();
        CHECK(calls == 1);
        CHECK(result->result == WiFiResult::TIMEOUT);
    }
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: success cancels the timeout",
                 "[network][connection][timeout]") {
    create_manager(1000);
    int calls = 0;
    manager->connect("Tether-Setup", "tether1234", [&](const WiFiError& err) {
        CHECK(err.success());
        calls++;
    });
    scheduler.run_pending();
    scheduler.advance(5000);
    CHECK(calls == 1);
    CHECK(scheduler.pending_count() == 0);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: activate_profile", "[network][connection]") {
    nmcli.drop_connection();
    std::optional<WiFiError> result;
    manager->activate_profile("HomeNetwork", [&](const WiFiError& err) { result = err; });
    scheduler.run_pending();
    REQUIRE(result.has_value());
    CHECK(result->success());
    CHECK(nmcli.active_connection() == "HomeNetwork");

    SECTION("unknown profile") {
        result.reset();
        manager->activate_profile("Nope", [&](const WiFiError& err) { result = err; });
        scheduler.run_pending();
        REQUIRE(result.has_value());
        CHECK(result->result == WiFiResult::CONNECTION_FAILED);
    }
}

// ============================================================================
// Saved profiles
// ============================================================================

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: saved networks exclude other types",
                 "[network][connection][saved]") {
    WiFiNetworkConfig config;
    config.ssid = "Cafe Guest";
    config.priority = 7;
    config.auto_connect = false;

    bool saved = false;
    manager->save_network(config, [&](const WiFiError& err) {
        REQUIRE(err.success());
        saved = true;
    });
    scheduler.run_pending();
    REQUIRE(saved);
    // Saving does not activate
    CHECK(nmcli.active_connection() == "HomeNetwork");

    std::vector<WiFiNetworkConfig> networks;
    manager->get_saved_networks(
        [&](const WiFiError& err, const std::vector<WiFiNetworkConfig>& result) {
            REQUIRE(err.success());
            networks = result;
        });
    scheduler.run_pending();

    REQUIRE(networks.size() == 2);
    CHECK(std::none_of(networks.begin(), networks.end(), [](const WiFiNetworkConfig& n) {
        return n.ssid == "Wired connection 1";
    }));
    auto cafe = std::find_if(networks.begin(), networks.end(),
                             [](const WiFiNetworkConfig& n) { return n.ssid == "Cafe Guest"; });
    REQUIRE(cafe != networks.end());
    CHECK(cafe->priority == 7);
    CHECK_FALSE(cafe->auto_connect);
    CHECK(cafe->password.empty());
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: remove_network",
                 "[network][connection][saved]") {
    std::optional<WiFiError> result;
    manager->remove_network("HomeNetwork", [&](const WiFiError& err) { result = err; });
    scheduler.run_pending();
    REQUIRE(result.has_value());
    CHECK(result->success());
    CHECK_FALSE(nmcli.has_profile("HomeNetwork"));

    result.reset();
    manager->remove_network("HomeNetwork", [&](const WiFiError& err) { result = err; });
    scheduler.run_pending();
    REQUIRE(result.has_value());
    CHECK(result->result == WiFiResult::NETWORK_NOT_FOUND);
}

// ============================================================================
// Monitoring
// ============================================================================

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: monitor reports flips only",
                 "[network][connection][monitor]") {
    std::vector<bool> changes;
    auto unsubscribe = manager->on_connection_change([&](bool c) { changes.push_back(c); });
    REQUIRE(manager->callback_count() == 1);

    manager->start_connection_monitoring();
    REQUIRE(manager->is_monitoring());

    scheduler.advance(5000);
    REQUIRE(changes == std::vector<bool>{true});

    scheduler.advance(5000);
    REQUIRE(changes.size() == 1);

    nmcli.drop_connection();
    scheduler.advance(5000);
    REQUIRE(changes == std::vector<bool>{true, false});

    SECTION("unsubscribe stops delivery") {
        unsubscribe();
        CHECK(manager->callback_count() == 0);
        nmcli.set_active_connection("HomeNetwork");
        scheduler.advance(5000);
        CHECK(changes.size() == 2);
    }

    SECTION("stop cancels the timer") {
        manager->stop_connection_monitoring();
        CHECK_FALSE(manager->is_monitoring());
        nmcli.set_active_connection("HomeNetwork");
        scheduler.advance(20000);
        CHECK(changes.size() == 2);
    }
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: monitor skips ticks while a check runs",
                 "[network][connection][monitor]") {
    nmcli.hold_matching("device show");
    manager->start_connection_monitoring();

    scheduler.advance(15000);
    CHECK(nmcli.count_matching("device show") == 1);

    nmcli.stop_holding();
    nmcli.release_held();
    scheduler.run_pending();
    scheduler.advance(5000);
    CHECK(nmcli.count_matching("device show") == 2);
}

TEST_CASE_METHOD(ConnectionFixture, "ConnectionManager: throwing subscriber does not stop others",
                 "[network][connection][monitor]") {
    int delivered = 0;
    manager->on_connection_change([](bool) { throw std::runtime_error("boom"); });
    manager->on_connection_change([&](bool) { delivered++; });

    manager->start_connection_monitoring();
    scheduler.advance(5000);
    CHECK(delivered == 1);
}

// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_service.h"

#include "../wifi_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE_METHOD(WifiTestFixture, "WifiService: initial state follows the current connection",
                 "[wifi][service][init]") {
    SECTION("on another network") {
        REQUIRE(start_service().success());
        CHECK(service->is_initialized());
        CHECK(service->get_state() == WiFiState::IDLE);
        CHECK(states.empty());
    }

    SECTION("already on the hotspot") {
        nmcli.add_profile(
            {"Tether-Setup", "802-11-wireless", "Tether-Setup", "tether1234", true, 0});
        nmcli.set_active_connection("Tether-Setup");
        REQUIRE(start_service().success());
        CHECK(service->get_state() == WiFiState::CONNECTED);
    }

    SECTION("offline") {
        nmcli.drop_connection();
        REQUIRE(start_service().success());
        CHECK(service->get_state() == WiFiState::DISCONNECTED);
    }

    SECTION("timers are running") {
        REQUIRE(start_service().success());
        CHECK(service->connection_manager().is_monitoring());
        CHECK(service->state_machine().is_polling());
    }
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: NetworkManager unavailable",
                 "[wifi][service][init]") {
    nmcli.set_available(false);
    auto err = start_service();

    CHECK(err.result == WiFiResult::NMCLI_NOT_AVAILABLE);
    CHECK_FALSE(service->is_initialized());
    CHECK_FALSE(service->connection_manager().is_monitoring());
    CHECK_FALSE(service->state_machine().is_polling());

    SECTION("a later initialize may succeed") {
        nmcli.set_available(true);
        std::optional<WiFiError> retry;
        service->initialize([&](const WiFiError& e) { retry = e; });
        pump();
        REQUIRE(retry.has_value());
        CHECK(retry->success());
        CHECK(service->is_initialized());
    }
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: initialize is idempotent", "[wifi][service][init]") {
    create_service();

    std::optional<WiFiError> first;
    std::optional<WiFiError> second;
    service->initialize([&](const WiFiError& e) { first = e; });
    service->initialize([&](const WiFiError& e) { second = e; });

    // Second caller is turned away while the availability check runs
    REQUIRE(second.has_value());
    CHECK(second->result == WiFiResult::ALREADY_IN_PROGRESS);
    REQUIRE_FALSE(first.has_value());

    pump();
    REQUIRE(first.has_value());
    CHECK(first->success());

    std::optional<WiFiError> third;
    service->initialize([&](const WiFiError& e) { third = e; });
    REQUIRE(third.has_value());
    CHECK(third->success());
    CHECK(nmcli.count_matching("general status") == 1);
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: operations before initialize",
                 "[wifi][service][init]") {
    create_service();

    std::vector<WiFiResult> results;
    service->scan_networks(
        [&](const WiFiError& e, const std::vector<WiFiNetwork>&) { results.push_back(e.result); });
    service->connect("HomeNetwork", "homepass123",
                     [&](const WiFiError& e) { results.push_back(e.result); });
    service->get_saved_networks([&](const WiFiError& e, const std::vector<WiFiNetworkConfig>&) {
        results.push_back(e.result);
    });

    REQUIRE(results.size() == 3);
    for (auto r : results) {
        CHECK(r == WiFiResult::NOT_INITIALIZED);
    }
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: dispose stops everything",
                 "[wifi][service][dispose]") {
    REQUIRE(start_service().success());
    service->set_websocket_client_count(1);
    pump();
    REQUIRE(service->get_state() == WiFiState::WAITING_FOR_HOTSPOT);

    std::vector<bool> changes;
    service->on_connection_change([&](bool c) { changes.push_back(c); });

    service->dispose();
    size_t transitions = states.size();

    CHECK_FALSE(service->is_initialized());
    CHECK(service->get_state() == WiFiState::IDLE);
    CHECK_FALSE(service->connection_manager().is_monitoring());
    CHECK_FALSE(service->state_machine().is_polling());
    CHECK_FALSE(service->state_machine().has_pending_attempt());
    CHECK(service->connection_manager().callback_count() == 0);
    CHECK(service->state_machine().callback_count() == 0);

    nmcli.clear_history();
    advance(60000);
    CHECK(nmcli.history().empty());
    CHECK(states.size() == transitions);
    CHECK(changes.empty());
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: dispose aborts an attempt in flight",
                 "[wifi][service][dispose]") {
    REQUIRE(start_service().success());
    nmcli.hold_matching("connection up Tether-Setup");
    service->set_websocket_client_count(1);
    pump();
    advance(AppConstants::Hotspot::ATTEMPT_DEBOUNCE_MS);
    REQUIRE(service->hotspot_manager().is_connection_attempt_in_progress());

    service->dispose();
    CHECK_FALSE(service->hotspot_manager().is_connection_attempt_in_progress());

    nmcli.stop_holding();
    nmcli.release_held();
    pump();
    advance(AppConstants::Hotspot::CONNECTION_TIMEOUT_MS);
    CHECK(service->get_state() == WiFiState::IDLE);
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: dispose during the availability check",
                 "[wifi][service][dispose]") {
    create_service();
    nmcli.hold_matching("general status");

    std::optional<WiFiError> result;
    service->initialize([&](const WiFiError& e) { result = e; });
    pump();
    REQUIRE_FALSE(result.has_value());

    service->dispose();
    nmcli.stop_holding();
    nmcli.release_held();
    pump();

    REQUIRE(result.has_value());
    CHECK(result->result == WiFiResult::NOT_INITIALIZED);
    CHECK_FALSE(service->is_initialized());
    CHECK_FALSE(service->state_machine().is_polling());
}

// ============================================================================
// Facade
// ============================================================================

TEST_CASE_METHOD(WifiTestFixture, "WifiService: facade reaches every component",
                 "[wifi][service]") {
    REQUIRE(start_service().success());

    std::optional<bool> visible;
    service->is_network_visible("Tether-Setup", [&](const WiFiError& e, const bool& v) {
        REQUIRE(e.success());
        visible = v;
    });
    std::optional<WiFiConnection> connection;
    service->get_current_connection(
        [&](const WiFiError& e, const std::optional<WiFiConnection>& c) {
            REQUIRE(e.success());
            connection = c;
        });
    std::optional<bool> on_hotspot;
    service->is_connected_to_mobile_hotspot([&](const WiFiError& e, const bool& v) {
        REQUIRE(e.success());
        on_hotspot = v;
    });
    pump();

    REQUIRE(visible.has_value());
    CHECK(*visible);
    REQUIRE(connection.has_value());
    CHECK(connection->ssid == "HomeNetwork");
    REQUIRE(on_hotspot.has_value());
    CHECK_FALSE(*on_hotspot);

    CHECK(service->get_mobile_hotspot_ssid() == "Tether-Setup");
    CHECK(service->get_mode() == WiFiMode::DRIVING);
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: connection subscribers hear the monitor",
                 "[wifi][service][monitor]") {
    REQUIRE(start_service().success());
    std::vector<bool> changes;
    auto unsubscribe = service->on_connection_change([&](bool c) { changes.push_back(c); });

    advance(AppConstants::Polling::CONNECTION_MONITOR_INTERVAL_MS);
    REQUIRE(changes == std::vector<bool>{true});

    unsubscribe();
    nmcli.drop_connection();
    advance(AppConstants::Polling::CONNECTION_MONITOR_INTERVAL_MS);
    CHECK(changes.size() == 1);
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: new hotspot identity restarts the search",
                 "[wifi][service][hotspot]") {
    REQUIRE(start_service().success());
    drive_to_hotspot_connected();
    REQUIRE(service->get_state() == WiFiState::CONNECTED);
    service->notify_connected_screen_displayed();
    REQUIRE(service->state_machine().has_connected_screen_been_displayed());

    nmcli.add_access_point({"MyPhone", 70, "WPA2", 2437, "phonepass1"});

    std::optional<WiFiError> result;
    service->set_hotspot_config("MyPhone", "phonepass1", [&](const WiFiError& e) { result = e; });
    pump();

    REQUIRE(result.has_value());
    CHECK(result->success());
    CHECK(service->get_state() == WiFiState::WAITING_FOR_HOTSPOT);
    CHECK_FALSE(service->state_machine().has_connected_screen_been_displayed());
    CHECK(service->get_hotspot_config().ssid == "MyPhone");
    // The previous hotspot is an ordinary network now
    REQUIRE(config.get_fallback_network().has_value());
    CHECK(config.get_fallback_network()->ssid == "Tether-Setup");
    CHECK(nmcli.active_connection().empty());

    // Poll tick at 10000 finds it, attempt at 15000, verified at 17000
    advance(10000);
    CHECK(service->get_state() == WiFiState::CONNECTED);
    CHECK(nmcli.active_connection() == "MyPhone");
    CHECK_FALSE(config.get_fallback_network().has_value());
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: direct hotspot attempt", "[wifi][service][hotspot]") {
    REQUIRE(start_service().success());

    std::optional<WiFiError> result;
    service->attempt_mobile_hotspot_connection([&](const WiFiError& e) { result = e; });
    pump();
    advance(AppConstants::Hotspot::SETTLE_DELAY_MS);

    REQUIRE(result.has_value());
    CHECK(result->success());
    CHECK(service->get_state() == WiFiState::CONNECTED);
}

TEST_CASE_METHOD(WifiTestFixture, "WifiService: dispose during a hotspot change",
                 "[wifi][service][dispose]") {
    REQUIRE(start_service().success());

    std::optional<WiFiError> result;
    service->set_hotspot_config("NewPhone", "longenough1", [&](const WiFiError& e) { result = e; });
    service->dispose();
    REQUIRE(service->get_state() == WiFiState::IDLE);

    pump();

    REQUIRE(result.has_value());
    CHECK(result->result == WiFiResult::NOT_INITIALIZED);
    CHECK(service->get_state() == WiFiState::IDLE);
    CHECK_FALSE(config.get_fallback_network().has_value());
    CHECK(nmcli.count_matching("device disconnect") == 0);
    CHECK(nmcli.active_connection() == "HomeNetwork");
}

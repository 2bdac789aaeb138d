// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_nmcli_runner_mock.cpp
 * @brief Simulated NetworkManager answers like nmcli does
 *
 * The higher-level suites lean on this simulator, so its nmcli-shaped
 * output, exit codes and error text are pinned down here.
 */

#include "nmcli_runner.h"
#include "nmcli_runner_mock.h"

#include "mocks/manual_scheduler.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>

namespace {

class MockRunnerFixture {
  protected:
    ManualScheduler scheduler;
    NmcliRunnerMock nmcli{scheduler};

    MockRunnerFixture() {
        nmcli.seed_demo_environment();
    }

    NmcliResult run(const std::vector<std::string>& args) {
        std::optional<NmcliResult> result;
        nmcli.run(args, [&](const NmcliResult& r) { result = r; });
        scheduler.run_pending();
        REQUIRE(result.has_value());
        return *result;
    }
};

} // namespace

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: completions are always asynchronous",
                 "[nmcli][mock]") {
    bool called = false;
    nmcli.run({"-t", "general", "status"}, [&](const NmcliResult&) { called = true; });
    REQUIRE_FALSE(called);

    scheduler.run_pending();
    REQUIRE(called);
}

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: device show reports the active connection",
                 "[nmcli][mock]") {
    auto result = run({"-t", "-f", "GENERAL.CONNECTION,IP4.ADDRESS,GENERAL.HWADDR", "device",
                       "show", "wlan0"});
    REQUIRE(result.ok());
    CHECK(result.out.find("GENERAL.CONNECTION:HomeNetwork\n") != std::string::npos);
    CHECK(result.out.find("GENERAL.HWADDR:DC:A6:32:12:34:56\n") != std::string::npos);
    CHECK(result.out.find("IP4.ADDRESS[1]:192.168.1.") != std::string::npos);

    SECTION("disconnected device shows --") {
        nmcli.drop_connection();
        auto offline = run({"-t", "-f", "GENERAL.CONNECTION", "device", "show", "wlan0"});
        CHECK(offline.out.find("GENERAL.CONNECTION:--\n") != std::string::npos);
        CHECK(offline.out.find("IP4.ADDRESS") == std::string::npos);
    }

    SECTION("unknown interface") {
        auto missing = run({"device", "show", "wlan9"});
        CHECK_FALSE(missing.ok());
        CHECK(missing.exit_code == 10);
    }
}

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: wifi list escapes SSIDs", "[nmcli][mock]") {
    auto result = run({"-t", "-f", "SSID", "device", "wifi", "list", "--rescan", "yes"});
    REQUIRE(result.ok());
    CHECK(result.out.find("Neighbor\\:5G\n") != std::string::npos);
    CHECK(result.out.find("Tether-Setup\n") != std::string::npos);
}

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: activation checks range and secrets",
                 "[nmcli][mock]") {
    SECTION("wrong secret reports missing secrets") {
        MockProfile profile;
        profile.name = "Tether-Setup";
        profile.ssid = "Tether-Setup";
        profile.psk = "wrong-password";
        nmcli.add_profile(profile);

        auto result = run({"connection", "up", "Tether-Setup"});
        CHECK(result.exit_code == 4);
        CHECK(result.err.find("Secrets were required") != std::string::npos);
        CHECK(nmcli.active_connection() == "HomeNetwork");
    }

    SECTION("out of range") {
        nmcli.remove_access_point("HomeNetwork");
        nmcli.drop_connection();
        auto result = run({"connection", "up", "HomeNetwork"});
        CHECK(result.exit_code == 4);
        CHECK(result.err.find("could not be found") != std::string::npos);
    }

    SECTION("unknown profile") {
        auto result = run({"connection", "up", "Nope"});
        CHECK(result.exit_code == 10);
    }
}

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: hold and release", "[nmcli][mock]") {
    nmcli.hold_matching("connection up");
    bool done = false;
    nmcli.run({"connection", "up", "HomeNetwork"}, [&](const NmcliResult&) { done = true; });
    scheduler.run_pending();

    REQUIRE_FALSE(done);
    REQUIRE(nmcli.held_count() == 1);

    nmcli.release_held();
    scheduler.run_pending();
    REQUIRE(done);
    REQUIRE(nmcli.held_count() == 0);
}

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: injected failures and NetworkManager down",
                 "[nmcli][mock]") {
    nmcli.fail_matching("wifi list", 1, "Error: scan failed");
    auto failed = run({"-t", "-f", "SSID", "device", "wifi", "list"});
    CHECK(failed.exit_code == 1);
    CHECK(failed.describe() == "Error: scan failed");

    nmcli.clear_failures();
    nmcli.set_available(false);
    auto down = run({"-t", "general", "status"});
    CHECK(down.exit_code == 8);
}

TEST_CASE_METHOD(MockRunnerFixture, "NmcliMock: passphrases are masked in history",
                 "[nmcli][mock][security]") {
    run({"connection", "add", "type", "wifi", "con-name", "X", "ifname", "wlan0", "ssid", "X",
         "wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", "supersecret"});

    REQUIRE(nmcli.count_matching("connection add") == 1);
    CHECK(nmcli.count_matching("supersecret") == 0);
    CHECK(nmcli.find_profile("X") != nullptr);
    CHECK(nmcli.find_profile("X")->psk == "supersecret");
}

TEST_CASE("format_nmcli_command quotes and masks", "[nmcli]") {
    CHECK(format_nmcli_command({"connection", "up", "Cafe Guest"}) ==
          "nmcli connection up \"Cafe Guest\"");
    CHECK(format_nmcli_command({"wifi-sec.psk", "hunter22"}) == "nmcli wifi-sec.psk ********");
}

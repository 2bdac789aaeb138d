// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_manual_scheduler.cpp
 * @brief The virtual-clock scheduler every other suite relies on
 */

#include "mocks/manual_scheduler.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

TEST_CASE("ManualScheduler: timeouts fire at their deadline", "[scheduler]") {
    ManualScheduler scheduler;
    int fired = 0;
    scheduler.set_timeout(1000, [&] { fired++; });

    scheduler.advance(999);
    REQUIRE(fired == 0);
    REQUIRE(scheduler.now_ms() == 999);

    scheduler.advance(1);
    REQUIRE(fired == 1);

    scheduler.advance(5000);
    REQUIRE(fired == 1);
}

TEST_CASE("ManualScheduler: posted tasks run on run_pending", "[scheduler]") {
    ManualScheduler scheduler;
    std::vector<std::string> order;

    scheduler.post([&] {
        order.push_back("a");
        scheduler.post([&] { order.push_back("c"); });
    });
    scheduler.post([&] { order.push_back("b"); });

    REQUIRE(order.empty());
    scheduler.run_pending();

    REQUIRE(order == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(scheduler.now_ms() == 0);
}

TEST_CASE("ManualScheduler: equal deadlines run in registration order", "[scheduler]") {
    ManualScheduler scheduler;
    std::vector<int> order;

    scheduler.set_timeout(100, [&] { order.push_back(1); });
    scheduler.set_timeout(50, [&] { order.push_back(0); });
    scheduler.set_timeout(100, [&] { order.push_back(2); });

    scheduler.advance(100);
    REQUIRE(order == std::vector<int>{0, 1, 2});
}

TEST_CASE("ManualScheduler: intervals re-arm until cancelled", "[scheduler]") {
    ManualScheduler scheduler;
    int ticks = 0;
    TimerId id = scheduler.set_interval(10, [&] { ticks++; });

    scheduler.advance(35);
    REQUIRE(ticks == 3);

    scheduler.cancel(id);
    scheduler.advance(100);
    REQUIRE(ticks == 3);
    REQUIRE_FALSE(scheduler.is_pending(id));
}

TEST_CASE("ManualScheduler: an interval may cancel itself", "[scheduler]") {
    ManualScheduler scheduler;
    int ticks = 0;
    TimerId id = INVALID_TIMER;
    id = scheduler.set_interval(10, [&] {
        if (++ticks == 2) {
            scheduler.cancel(id);
        }
    });

    scheduler.advance(100);
    REQUIRE(ticks == 2);
    REQUIRE(scheduler.pending_count() == 0);
}

TEST_CASE("ManualScheduler: cancel of an unknown id is ignored", "[scheduler]") {
    ManualScheduler scheduler;
    scheduler.cancel(INVALID_TIMER);
    scheduler.cancel(12345);
    REQUIRE(scheduler.pending_count() == 0);
}

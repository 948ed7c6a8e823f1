/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE TickSchedulerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/TickScheduler.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Lifeline;
using namespace std::chrono_literals;

struct SchedulerFixture {
    SchedulerFixture() { Logger::SetQuietMode(true); }
};

BOOST_FIXTURE_TEST_SUITE(TickSchedulerTestSuite, SchedulerFixture)

BOOST_AUTO_TEST_CASE(TestTicksRepeatedly) {
    TickScheduler scheduler("test");
    std::atomic<int> ticks{0};
    BOOST_REQUIRE(scheduler.start(10ms, [&ticks](double) { ++ticks; }));
    BOOST_CHECK(scheduler.isRunning());

    std::this_thread::sleep_for(200ms);
    scheduler.stop();

    BOOST_CHECK(!scheduler.isRunning());
    BOOST_CHECK_GE(ticks.load(), 3);
    BOOST_CHECK_EQUAL(static_cast<uint64_t>(ticks.load()), scheduler.getTickCount());
}

BOOST_AUTO_TEST_CASE(TestElapsedIsRealTime) {
    TickScheduler scheduler("elapsed");
    std::mutex mutex;
    std::vector<double> elapsed;
    scheduler.start(30ms, [&](double seconds) {
        std::lock_guard<std::mutex> lock(mutex);
        elapsed.push_back(seconds);
    });
    std::this_thread::sleep_for(200ms);
    scheduler.stop();

    std::lock_guard<std::mutex> lock(mutex);
    BOOST_REQUIRE(!elapsed.empty());
    for (double seconds : elapsed) {
        // Never earlier than the period
        BOOST_CHECK_GE(seconds, 0.029);
    }
}

BOOST_AUTO_TEST_CASE(TestTicksNeverOverlap) {
    TickScheduler scheduler("slow");
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    std::atomic<int> ticks{0};

    // Each tick takes three periods
    scheduler.start(5ms, [&](double) {
        int current = ++inFlight;
        int seen = maxInFlight.load();
        while (current > seen && !maxInFlight.compare_exchange_weak(seen, current)) {
        }
        std::this_thread::sleep_for(15ms);
        --inFlight;
        ++ticks;
    });
    std::this_thread::sleep_for(150ms);
    scheduler.stop();

    BOOST_CHECK_EQUAL(maxInFlight.load(), 1);
    BOOST_CHECK_GE(ticks.load(), 2);
    BOOST_CHECK_GE(scheduler.getOverrunCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestStopLetsInFlightTickFinish) {
    TickScheduler scheduler("finish");
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    scheduler.start(1ms, [&](double) {
        if (started.exchange(true)) {
            return;
        }
        std::this_thread::sleep_for(50ms);
        finished = true;
    });

    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    scheduler.stop();
    BOOST_CHECK(finished.load());

    // No ticks after stop() returns
    uint64_t count = scheduler.getTickCount();
    std::this_thread::sleep_for(20ms);
    BOOST_CHECK_EQUAL(scheduler.getTickCount(), count);
}

BOOST_AUTO_TEST_CASE(TestStopIsPrompt) {
    TickScheduler scheduler("prompt");
    scheduler.start(std::chrono::milliseconds(10000), [](double) {});

    auto begin = std::chrono::steady_clock::now();
    scheduler.stop();
    auto waited = std::chrono::steady_clock::now() - begin;
    BOOST_CHECK(waited < 1s);
    BOOST_CHECK_EQUAL(scheduler.getTickCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestThrowingTickKeepsRunning) {
    TickScheduler scheduler("throws");
    std::atomic<int> ticks{0};
    scheduler.start(5ms, [&ticks](double) {
        ++ticks;
        throw std::runtime_error("tick failure");
    });
    std::this_thread::sleep_for(100ms);
    scheduler.stop();
    BOOST_CHECK_GE(ticks.load(), 2);
}

BOOST_AUTO_TEST_CASE(TestInvalidStart) {
    TickScheduler scheduler("invalid");
    BOOST_CHECK(!scheduler.start(0ms, [](double) {}));
    BOOST_CHECK(!scheduler.start(10ms, nullptr));

    BOOST_REQUIRE(scheduler.start(10ms, [](double) {}));
    BOOST_CHECK(!scheduler.start(10ms, [](double) {}));
    scheduler.stop();
    scheduler.stop();
}

BOOST_AUTO_TEST_CASE(TestSetPeriod) {
    TickScheduler scheduler("period");
    std::atomic<int> ticks{0};
    scheduler.start(std::chrono::milliseconds(10000), [&ticks](double) { ++ticks; });
    scheduler.setPeriod(5ms);
    BOOST_CHECK(scheduler.getPeriod() == 5ms);

    std::this_thread::sleep_for(100ms);
    scheduler.stop();
    BOOST_CHECK_GE(ticks.load(), 2);
}

BOOST_AUTO_TEST_SUITE_END()

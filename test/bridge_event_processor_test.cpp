#include <catch2/catch_test_macros.hpp>
#include "test_utils.h"

#include <bridge/bridge_event_processor.h>
#include <QSignalSpy>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using bridge::BridgeEventProcessor;
using namespace std::chrono_literals;

TEST_CASE("BridgeEventProcessor runs events sequentially in posting order", "[BridgeEventProcessor]") {
    testutils::ensureQCoreApplication();
    BridgeEventProcessor processor;

    std::mutex mutex;
    std::vector<int> seen;
    std::atomic<int> concurrent{0};
    std::atomic<int> maxConcurrent{0};
    std::thread::id workerId;

    processor.setEventHandler(BridgeEventProcessor::INBOUND_MESSAGE, [&](const QVariantHash& data) {
        int now = ++concurrent;
        maxConcurrent = std::max(maxConcurrent.load(), now);
        std::this_thread::sleep_for(1ms);
        {
            std::scoped_lock locker(mutex);
            seen.push_back(data.value("seq").toInt());
            workerId = std::this_thread::get_id();
        }
        --concurrent;
    });
    processor.start();

    // Two producers interleave; each producer's own order must be kept
    std::thread producerA([&]() {
        for (int i = 0; i < 50; ++i) processor.postEvent(BridgeEventProcessor::INBOUND_MESSAGE, {{"seq", i}});
    });
    std::thread producerB([&]() {
        for (int i = 1000; i < 1050; ++i) processor.postEvent(BridgeEventProcessor::INBOUND_MESSAGE, {{"seq", i}});
    });
    producerA.join();
    producerB.join();

    REQUIRE(processor.waitForIdle(5s));
    REQUIRE(processor.pendingEventCount() == 0);
    REQUIRE(maxConcurrent.load() == 1);

    std::scoped_lock locker(mutex);
    REQUIRE(seen.size() == 100);
    REQUIRE(workerId != std::this_thread::get_id());
    int lastA = -1;
    int lastB = 999;
    for (int value : seen) {
        if (value < 1000) {
            REQUIRE(value == lastA + 1);
            lastA = value;
        } else {
            REQUIRE(value == lastB + 1);
            lastB = value;
        }
    }
}

TEST_CASE("BridgeEventProcessor drops events while stopped", "[BridgeEventProcessor]") {
    testutils::ensureQCoreApplication();
    BridgeEventProcessor processor;
    std::atomic<int> handled{0};
    processor.setEventHandler(BridgeEventProcessor::VOLUME_CHANGED, [&](const QVariantHash&) { ++handled; });

    processor.postEvent(BridgeEventProcessor::VOLUME_CHANGED);
    REQUIRE(processor.pendingEventCount() == 0);

    processor.start();
    processor.postEvent(BridgeEventProcessor::VOLUME_CHANGED);
    REQUIRE(processor.waitForIdle(2s));
    REQUIRE(handled == 1);

    processor.stop();
    REQUIRE_FALSE(processor.isRunning());
    processor.postEvent(BridgeEventProcessor::VOLUME_CHANGED);
    std::this_thread::sleep_for(20ms);
    REQUIRE(handled == 1);
}

TEST_CASE("BridgeEventProcessor stop discards pending events", "[BridgeEventProcessor]") {
    testutils::ensureQCoreApplication();
    BridgeEventProcessor processor;
    std::atomic<bool> release{false};
    std::atomic<int> handled{0};
    processor.setEventHandler(BridgeEventProcessor::INBOUND_MESSAGE, [&](const QVariantHash&) {
        while (!release) std::this_thread::sleep_for(1ms);
        ++handled;
    });
    processor.start();
    for (int i = 0; i < 10; ++i) processor.postEvent(BridgeEventProcessor::INBOUND_MESSAGE);

    // First event is blocked in its handler; stop from another thread
    std::this_thread::sleep_for(20ms);
    std::thread stopper([&]() { processor.stop(); });
    std::this_thread::sleep_for(20ms);
    release = true;
    stopper.join();

    REQUIRE(handled == 1);
    REQUIRE(processor.pendingEventCount() == 0);
}

TEST_CASE("BridgeEventProcessor reports handler exceptions and keeps going", "[BridgeEventProcessor]") {
    testutils::ensureQCoreApplication();
    testutils::LogCapture logs;
    BridgeEventProcessor processor;
    QSignalSpy errorSpy(&processor, &BridgeEventProcessor::processingError);
    std::atomic<int> handled{0};

    processor.setEventHandler(BridgeEventProcessor::TRACK_PLAYBACK_STARTED, [](const QVariantHash&) {
        throw std::runtime_error("formatter exploded");
    });
    processor.setEventHandler(BridgeEventProcessor::TRACK_PLAYBACK_ENDED, [&](const QVariantHash&) { ++handled; });
    processor.start();

    processor.postEvent(BridgeEventProcessor::TRACK_PLAYBACK_STARTED);
    processor.postEvent(BridgeEventProcessor::TRACK_PLAYBACK_ENDED);
    REQUIRE(processor.waitForIdle(2s));

    REQUIRE(handled == 1);
    REQUIRE(testutils::waitUntil([&]() { return errorSpy.count() == 1; }));
    REQUIRE(errorSpy.at(0).at(0).toString() == "formatter exploded");
    REQUIRE(logs.contains(spdlog::level::err, "formatter exploded"));
}

TEST_CASE("BridgeEventProcessor can be stopped from its own handler and restarted", "[BridgeEventProcessor]") {
    testutils::ensureQCoreApplication();
    BridgeEventProcessor processor;
    std::atomic<int> handled{0};
    processor.setEventHandler(BridgeEventProcessor::INBOUND_MESSAGE, [&](const QVariantHash& data) {
        ++handled;
        if (data.value("stop").toBool()) {
            processor.stop();
        }
    });
    processor.start();
    processor.postEvent(BridgeEventProcessor::INBOUND_MESSAGE, {{"stop", true}});
    REQUIRE(testutils::waitUntil([&]() { return !processor.isRunning(); }));
    REQUIRE(handled == 1);

    processor.start();
    REQUIRE(processor.isRunning());
    processor.postEvent(BridgeEventProcessor::INBOUND_MESSAGE);
    REQUIRE(processor.waitForIdle(2s));
    REQUIRE(handled == 2);
}

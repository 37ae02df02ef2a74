/**
 * BridgeController tests: full wiring against in-memory player and bus.
 */

#include <catch2/catch_test_macros.hpp>
#include "test_utils.h"
#include "util/fake_message_bus.h"
#include "util/fake_player.h"

#include <bridge/bridge_controller.h>
#include <QSignalSpy>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using bridge::BridgeController;
using bridge::BridgeSettings;
using bridge::BridgeState;
using player::PlaybackState;
using test_bus::FakeMessageBus;
using test_player::FakePlayer;
using namespace std::chrono_literals;

namespace {
BridgeSettings testSettings()
{
    BridgeSettings settings;
    settings.broker.host = "broker.test";
    settings.broker.port = 1884;
    settings.broker.clientId = "bridge-under-test";
    settings.commandTopic = "mopidy/c";
    settings.stateTopic = "mopidy/i";
    settings.retainState = true;
    return settings;
}
}

TEST_CASE("BridgeController lifecycle", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    FakePlayer player;
    FakeMessageBus bus;
    BridgeController controller(player, bus, testSettings());
    QSignalSpy stateSpy(&controller, &BridgeController::stateChanged);

    REQUIRE(controller.state() == BridgeState::Stopped);

    SECTION("start connects, subscribes and enters Running") {
        REQUIRE(controller.start());
        REQUIRE(controller.state() == BridgeState::Running);
        REQUIRE(bus.isConnected());
        REQUIRE(bus.settings().host == "broker.test");
        REQUIRE(bus.settings().port == 1884);
        REQUIRE(bus.subscriptions() == QStringList{"mopidy/c/+"});
        REQUIRE(player.events()->SubscriberCount<player::VolumeChangedEvent>() == 1);
        REQUIRE(stateSpy.count() == 2);
        REQUIRE(stateSpy.at(0).at(0).value<BridgeState>() == BridgeState::Starting);
        REQUIRE(stateSpy.at(1).at(0).value<BridgeState>() == BridgeState::Running);
    }

    SECTION("start is only allowed from Stopped") {
        testutils::LogCapture logs;
        REQUIRE(controller.start());
        REQUIRE_FALSE(controller.start());
        REQUIRE(bus.connectCount() == 1);
        REQUIRE(logs.warnings() == 1);
    }

    SECTION("stop tears everything down and is idempotent") {
        REQUIRE(controller.start());
        controller.stop();
        REQUIRE(controller.state() == BridgeState::Stopped);
        REQUIRE_FALSE(bus.isConnected());
        REQUIRE(bus.subscriptions().isEmpty());
        REQUIRE(player.events()->SubscriberCount<player::VolumeChangedEvent>() == 0);

        controller.stop();
        controller.stop();
        REQUIRE(bus.disconnectCount() == 1);
    }

    SECTION("stop on a never-started controller does nothing") {
        controller.stop();
        REQUIRE(bus.disconnectCount() == 0);
        REQUIRE(stateSpy.count() == 0);
    }

    SECTION("controller can be restarted after stop") {
        REQUIRE(controller.start());
        controller.stop();
        REQUIRE(controller.start());
        REQUIRE(controller.state() == BridgeState::Running);
        REQUIRE(bus.connectCount() == 2);
    }
}

TEST_CASE("BridgeController start failure leaves it stopped", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    testutils::LogCapture logs;
    FakePlayer player;
    FakeMessageBus bus;
    bus.setFailConnect(true);
    BridgeController controller(player, bus, testSettings());

    REQUIRE_FALSE(controller.start());
    REQUIRE(controller.state() == BridgeState::Stopped);
    REQUIRE(logs.contains(spdlog::level::err, "broker unreachable"));
    REQUIRE(player.events()->SubscriberCount<player::PlaybackStateChangedEvent>() == 0);

    bus.setFailConnect(false);
    REQUIRE(controller.start());
}

TEST_CASE("BridgeController routes inbound commands to the player", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    FakePlayer player;
    FakeMessageBus bus;
    BridgeController controller(player, bus, testSettings());
    REQUIRE(controller.start());

    SECTION("commands are dispatched in arrival order") {
        player.setCurrentVolume(95);
        REQUIRE(bus.deliver("mopidy/c/plb", "play") == 1);
        REQUIRE(bus.deliver("mopidy/c/vol", "+10") == 1);
        REQUIRE(bus.deliver("mopidy/c/add", "spotify:track:1") == 1);
        REQUIRE(controller.waitForIdle(2s));
        REQUIRE(player.calls() == QStringList{"play", "setVolume:100", "addToQueue:spotify:track:1"});
    }

    SECTION("toggle while playing pauses and publishes nothing") {
        player.setState(PlaybackState::Playing);
        bus.deliver("mopidy/c/plb", "toggle");
        REQUIRE(controller.waitForIdle(2s));
        REQUIRE(player.calls() == QStringList{"pause"});
        REQUIRE(bus.published().isEmpty());
    }

    SECTION("inf state answers on the state topic") {
        player.setState(PlaybackState::Paused);
        bus.deliver("mopidy/c/inf", "state");
        REQUIRE(controller.waitForIdle(2s));
        auto published = bus.published();
        REQUIRE(published.size() == 1);
        REQUIRE(published[0].topic == "mopidy/i/sta");
        REQUIRE(published[0].payload == "paused");
    }

    SECTION("state topics are not command topics") {
        REQUIRE(bus.deliver("mopidy/i/vol", "=10") == 0);
    }

    SECTION("player failures do not stop the bridge") {
        QSignalSpy failedSpy(&controller, &BridgeController::failed);
        player.failNextCall(FakePlayer::FailureMode::PlayerError);
        bus.deliver("mopidy/c/plb", "play");
        bus.deliver("mopidy/c/plb", "next");
        REQUIRE(controller.waitForIdle(2s));
        REQUIRE(controller.state() == BridgeState::Running);
        REQUIRE(player.calls() == QStringList{"next"});
        REQUIRE(failedSpy.count() == 0);
    }
}

TEST_CASE("BridgeController publishes player events", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    FakePlayer player;
    FakeMessageBus bus;
    BridgeController controller(player, bus, testSettings());
    REQUIRE(controller.start());

    player::TrackInfo track;
    track.name = "Song";
    track.uri = "local:track:song.mp3";

    player.emitStateChanged(PlaybackState::Stopped, PlaybackState::Playing);
    player.emitTrackStarted(track);
    player.emitVolumeChanged(64);
    player.emitTrackEnded(track, 1000);
    player.emitStreamTitleChanged("Artist - Title");
    REQUIRE(controller.waitForIdle(2s));

    auto published = bus.published();
    REQUIRE(published.size() == 5);
    REQUIRE(published[0].topic == "mopidy/i/sta");
    REQUIRE(published[0].payload == "playing");
    REQUIRE(published[1].topic == "mopidy/i/trk");
    REQUIRE(published[1].payload.contains("\"name\":\"Song\""));
    REQUIRE(published[2].topic == "mopidy/i/vol");
    REQUIRE(published[2].payload == "64");
    REQUIRE(published[3].topic == "mopidy/i/trk");
    REQUIRE(published[3].payload.isEmpty());
    REQUIRE(published[4].topic == "mopidy/i/trk");
    REQUIRE(published[4].payload.contains("\"artist\":\"Artist\""));
    for (const auto& message : published) {
        REQUIRE(message.retain);
    }
}

TEST_CASE("BridgeController is silent after stop", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    FakePlayer player;
    FakeMessageBus bus;
    BridgeController controller(player, bus, testSettings());
    REQUIRE(controller.start());
    // A message already in flight on the client when the bridge stops
    bus::MessageCallback lateDelivery = bus.callbackFor("mopidy/c/+");
    REQUIRE(lateDelivery);
    controller.stop();

    REQUIRE(bus.deliver("mopidy/c/plb", "play") == 0);
    lateDelivery("mopidy/c/plb", "play");
    lateDelivery("mopidy/c/vol", "=50");
    player.emitVolumeChanged(10);
    player.emitTrackStarted(player::TrackInfo{"Late", "late:uri", {}, {}});
    REQUIRE(controller.waitForIdle(1s));
    REQUIRE(player.calls().isEmpty());
    REQUIRE(bus.published().isEmpty());
}

TEST_CASE("BridgeController stops itself on unrecoverable failure", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    testutils::LogCapture logs;
    FakePlayer player;
    FakeMessageBus bus;
    BridgeController controller(player, bus, testSettings());
    QSignalSpy failedSpy(&controller, &BridgeController::failed);
    REQUIRE(controller.start());

    player.failNextCall(FakePlayer::FailureMode::Unexpected);
    bus.deliver("mopidy/c/plb", "play");

    REQUIRE(testutils::waitUntil([&]() { return controller.state() == BridgeState::Stopped; }));
    REQUIRE(failedSpy.count() == 1);
    REQUIRE(failedSpy.at(0).at(0).toString().contains("mopidy/c/plb"));
    REQUIRE_FALSE(bus.isConnected());
    REQUIRE(logs.contains(spdlog::level::err, "Bridge failed"));

    // No automatic restart
    bus.deliver("mopidy/c/plb", "play");
    REQUIRE(controller.waitForIdle(1s));
    REQUIRE(player.calls().isEmpty());
    REQUIRE(controller.state() == BridgeState::Stopped);
}

TEST_CASE("BridgeController teardown waits for a failure already stopping it", "[BridgeController]") {
    testutils::ensureQCoreApplication();
    FakePlayer player;
    FakeMessageBus bus;
    std::atomic<bool> disconnecting{false};
    // Holds the processor thread inside its own stop() long enough to overlap
    bus.setOnDisconnect([&disconnecting]() {
        disconnecting.store(true);
        std::this_thread::sleep_for(100ms);
    });
    auto controller = std::make_unique<BridgeController>(player, bus, testSettings());
    REQUIRE(controller->start());

    player.failNextCall(FakePlayer::FailureMode::Unexpected);
    bus.deliver("mopidy/c/plb", "play");
    REQUIRE(testutils::waitUntil([&]() { return disconnecting.load(); }));

    SECTION("external stop returns only once Stopped") {
        controller->stop();
        REQUIRE(controller->state() == BridgeState::Stopped);
        controller.reset();
    }

    SECTION("destruction during the failure teardown") {
        controller.reset();
    }

    REQUIRE(bus.disconnectCount() == 1);
    REQUIRE_FALSE(bus.isConnected());
    REQUIRE(player.calls().isEmpty());
}

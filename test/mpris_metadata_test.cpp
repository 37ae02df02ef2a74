/**
 * MPRIS translation tests. PropertiesChanged payloads are fed straight into
 * the facade's slot, so no session bus or player is required.
 */

#include <catch2/catch_test_macros.hpp>
#include "test_utils.h"

#include <event/event_bus.hpp>
#include <player/mpris_player_facade.h>
#include <player/player_events.h>
#include <QDBusObjectPath>
#include <QMetaObject>
#include <memory>
#include <vector>

using player::MprisPlayerFacade;
using player::PlaybackState;

namespace {
const QString kPlayerInterface = "org.mpris.MediaPlayer2.Player";

QVariantMap metadata(const QString& trackId, const QString& title,
                     const QStringList& artists = {}, const QString& url = {})
{
    QVariantMap map;
    map.insert("mpris:trackid", QVariant::fromValue(QDBusObjectPath(trackId)));
    map.insert("xesam:title", title);
    map.insert("xesam:artist", artists);
    map.insert("xesam:url", url);
    return map;
}

void propertiesChanged(MprisPlayerFacade& facade, const QVariantMap& changed)
{
    QMetaObject::invokeMethod(&facade, "onPropertiesChanged", Qt::DirectConnection,
                              Q_ARG(QString, kPlayerInterface),
                              Q_ARG(QVariantMap, changed),
                              Q_ARG(QStringList, QStringList()));
}

// Collects everything posted on a facade's event bus
struct EventRecorder {
    std::shared_ptr<int> token = std::make_shared<int>(0);
    std::vector<player::PlaybackStateChangedEvent> states;
    std::vector<player::TrackPlaybackStartedEvent> started;
    std::vector<player::TrackPlaybackEndedEvent> ended;
    std::vector<player::VolumeChangedEvent> volumes;
    std::vector<player::StreamTitleChangedEvent> titles;

    explicit EventRecorder(const std::shared_ptr<EventBus>& bus)
    {
        bus->Subscribe<player::PlaybackStateChangedEvent>(token, [this](const auto& e) { states.push_back(e); return true; });
        bus->Subscribe<player::TrackPlaybackStartedEvent>(token, [this](const auto& e) { started.push_back(e); return true; });
        bus->Subscribe<player::TrackPlaybackEndedEvent>(token, [this](const auto& e) { ended.push_back(e); return true; });
        bus->Subscribe<player::VolumeChangedEvent>(token, [this](const auto& e) { volumes.push_back(e); return true; });
        bus->Subscribe<player::StreamTitleChangedEvent>(token, [this](const auto& e) { titles.push_back(e); return true; });
    }
};
}

TEST_CASE("MprisPlayerFacade parses PlaybackStatus", "[MprisPlayerFacade]") {
    REQUIRE(MprisPlayerFacade::parsePlaybackStatus("Playing") == PlaybackState::Playing);
    REQUIRE(MprisPlayerFacade::parsePlaybackStatus("Paused") == PlaybackState::Paused);
    REQUIRE(MprisPlayerFacade::parsePlaybackStatus("Stopped") == PlaybackState::Stopped);
    REQUIRE(MprisPlayerFacade::parsePlaybackStatus("") == PlaybackState::Stopped);
}

TEST_CASE("MprisPlayerFacade parses Metadata", "[MprisPlayerFacade]") {
    QString trackId;
    player::TrackInfo track = MprisPlayerFacade::parseMetadata(
        metadata("/org/mopidy/track/7", "Intro", {"The xx"}, "local:track:intro.flac"), &trackId);
    REQUIRE(trackId == "/org/mopidy/track/7");
    REQUIRE(track.name == "Intro");
    REQUIRE(track.artists == QStringList{"The xx"});
    REQUIRE(track.uri == "local:track:intro.flac");

    MprisPlayerFacade::parseMetadata(metadata("/org/mpris/MediaPlayer2/TrackList/NoTrack", ""), &trackId);
    REQUIRE(trackId.isEmpty());
}

TEST_CASE("MprisPlayerFacade translates PropertiesChanged into lifecycle events", "[MprisPlayerFacade]") {
    testutils::ensureQCoreApplication();
    MprisPlayerFacade facade("org.mpris.MediaPlayer2.test_player_that_does_not_exist", 200);
    EventRecorder recorder(facade.events());

    SECTION("state changes carry old and new state and repeated values are ignored") {
        propertiesChanged(facade, {{"PlaybackStatus", "Playing"}});
        propertiesChanged(facade, {{"PlaybackStatus", "Playing"}});
        propertiesChanged(facade, {{"PlaybackStatus", "Paused"}});
        REQUIRE(recorder.states.size() == 2);
        REQUIRE(recorder.states[0].oldState == PlaybackState::Stopped);
        REQUIRE(recorder.states[0].newState == PlaybackState::Playing);
        REQUIRE(recorder.states[1].oldState == PlaybackState::Playing);
        REQUIRE(recorder.states[1].newState == PlaybackState::Paused);
    }

    SECTION("volume is scaled to 0..100") {
        propertiesChanged(facade, {{"Volume", 0.25}});
        propertiesChanged(facade, {{"Volume", 0.25}});
        propertiesChanged(facade, {{"Volume", 1.7}});
        REQUIRE(recorder.volumes.size() == 2);
        REQUIRE(recorder.volumes[0].volume == 25);
        REQUIRE(recorder.volumes[1].volume == 100);
    }

    SECTION("a new track ends the previous one and starts the next") {
        propertiesChanged(facade, {{"Metadata", metadata("/t/1", "First")}});
        REQUIRE(recorder.started.size() == 1);
        REQUIRE(recorder.ended.empty());

        propertiesChanged(facade, {{"Metadata", metadata("/t/2", "Second")}});
        REQUIRE(recorder.ended.size() == 1);
        REQUIRE(recorder.ended[0].track.name == "First");
        REQUIRE(recorder.started.size() == 2);
        REQUIRE(recorder.started[1].track.name == "Second");
    }

    SECTION("a new title on the same entry is a stream title change") {
        propertiesChanged(facade, {{"Metadata", metadata("/t/radio", "Radio One")}});
        propertiesChanged(facade, {{"Metadata", metadata("/t/radio", "Artist - Song")}});
        REQUIRE(recorder.started.size() == 1);
        REQUIRE(recorder.ended.empty());
        REQUIRE(recorder.titles.size() == 1);
        REQUIRE(recorder.titles[0].title == "Artist - Song");
    }

    SECTION("clearing the track ends it without starting another") {
        propertiesChanged(facade, {{"Metadata", metadata("/t/1", "Only")}});
        propertiesChanged(facade, {{"Metadata", QVariantMap()}});
        REQUIRE(recorder.started.size() == 1);
        REQUIRE(recorder.ended.size() == 1);
    }
}

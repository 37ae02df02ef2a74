#pragma once

#include "i_player_facade.h"
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <cstdint>
#include <memory>

class EventBus;
class QDBusMessage;

namespace player {

/**
 * @brief IPlayerFacade backed by an MPRIS2 player on the session D-Bus.
 *
 * Commands are blocking D-Bus calls with a per-call timeout; a failed or timed
 * out call throws PlayerError. PropertiesChanged signals on the player object
 * are translated into lifecycle events on events().
 *
 * The queue operations need the optional org.mpris.MediaPlayer2.TrackList
 * interface (Mopidy-MPRIS provides it).
 */
class MprisPlayerFacade : public QObject, public IPlayerFacade
{
    Q_OBJECT
public:
    explicit MprisPlayerFacade(const QString& serviceName, int callTimeoutMs = 2000, QObject* parent = nullptr);
    ~MprisPlayerFacade() override;

    // Connects to the session bus and seeds the cached player state.
    // Throws PlayerError when the session bus is unavailable.
    void initialize();

    void play() override;
    void stop() override;
    void pause() override;
    void resume() override;
    void previous() override;
    void next() override;

    PlaybackState state() override;

    int volume() override;
    void setVolume(int volume) override;

    void addToQueue(const QString& uri) override;
    void clearQueue() override;

    std::shared_ptr<EventBus> events() const override { return m_events; }

    QString serviceName() const { return m_serviceName; }

    static PlaybackState parsePlaybackStatus(const QString& status);
    static TrackInfo parseMetadata(const QVariantMap& metadata, QString* trackId = nullptr);

private slots:
    void onPropertiesChanged(const QString& interfaceName, const QVariantMap& changed, const QStringList& invalidated);

private:
    QDBusMessage call(const QString& interfaceName, const QString& method, const QVariantList& args = {});
    QVariant getProperty(const QString& interfaceName, const QString& name);
    void setProperty(const QString& interfaceName, const QString& name, const QVariant& value);
    int64_t currentPositionMs();
    void handleMetadataChange(const QVariantMap& metadata);

    QString m_serviceName;
    int m_callTimeoutMs;
    std::shared_ptr<EventBus> m_events;
    bool m_signalsConnected = false;

    // Last values seen on the bus, used to derive old/new pairs and track transitions
    PlaybackState m_lastState = PlaybackState::Stopped;
    int m_lastVolume = -1;
    QString m_currentTrackId;
    TrackInfo m_currentTrack;
};

} // namespace player

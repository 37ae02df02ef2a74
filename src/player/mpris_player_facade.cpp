#include "mpris_player_facade.h"
#include "player_events.h"

#include <event/event_bus.hpp>
#include <log/log_manager.h>
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusMetaType>
#include <QDBusObjectPath>
#include <QDBusVariant>
#include <QList>
#include <QtMath>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

namespace player {

namespace {
const QString kMprisPath = QStringLiteral("/org/mpris/MediaPlayer2");
const QString kPlayerInterface = QStringLiteral("org.mpris.MediaPlayer2.Player");
const QString kTrackListInterface = QStringLiteral("org.mpris.MediaPlayer2.TrackList");
const QString kPropertiesInterface = QStringLiteral("org.freedesktop.DBus.Properties");
const QString kNoTrack = QStringLiteral("/org/mpris/MediaPlayer2/TrackList/NoTrack");

QString objectPathString(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusObjectPath>()) {
        return value.value<QDBusObjectPath>().path();
    }
    return value.toString();
}

QVariantMap toVariantMap(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusArgument>()) {
        return qdbus_cast<QVariantMap>(value.value<QDBusArgument>());
    }
    return value.toMap();
}

QList<QDBusObjectPath> toObjectPathList(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusArgument>()) {
        return qdbus_cast<QList<QDBusObjectPath>>(value.value<QDBusArgument>());
    }
    return value.value<QList<QDBusObjectPath>>();
}
}

MprisPlayerFacade::MprisPlayerFacade(const QString& serviceName, int callTimeoutMs, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_callTimeoutMs(callTimeoutMs > 0 ? callTimeoutMs : 2000)
    , m_events(EventBus::Create())
{
    LOG_DEBUG("MprisPlayerFacade created for {}", m_serviceName.toStdString());
}

MprisPlayerFacade::~MprisPlayerFacade()
{
    if (m_signalsConnected) {
        QDBusConnection::sessionBus().disconnect(m_serviceName, kMprisPath, kPropertiesInterface,
            QStringLiteral("PropertiesChanged"), this,
            SLOT(onPropertiesChanged(QString,QVariantMap,QStringList)));
    }
    LOG_DEBUG("MprisPlayerFacade destroyed");
}

void MprisPlayerFacade::initialize()
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        throw PlayerError(fmt::format("Session D-Bus not available: {}", bus.lastError().message().toStdString()));
    }
    qDBusRegisterMetaType<QList<QDBusObjectPath>>();

    m_signalsConnected = bus.connect(m_serviceName, kMprisPath, kPropertiesInterface,
        QStringLiteral("PropertiesChanged"), this,
        SLOT(onPropertiesChanged(QString,QVariantMap,QStringList)));
    if (!m_signalsConnected) {
        throw PlayerError(fmt::format("Failed to watch {} for property changes", m_serviceName.toStdString()));
    }

    // The player may not be running yet; events start flowing once it appears
    try {
        m_lastState = state();
        m_lastVolume = volume();
        handleMetadataChange(toVariantMap(getProperty(kPlayerInterface, QStringLiteral("Metadata"))));
        LOG_INFO("MPRIS player {} is {}, volume {}", m_serviceName.toStdString(),
                 magic_enum::enum_name(m_lastState), m_lastVolume);
    } catch (const PlayerError& e) {
        LOG_WARN("MPRIS player {} not reachable yet: {}", m_serviceName.toStdString(), e.what());
    }
}

QDBusMessage MprisPlayerFacade::call(const QString& interfaceName, const QString& method, const QVariantList& args)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(m_serviceName, kMprisPath, interfaceName, method);
    msg.setArguments(args);
    QDBusMessage reply = QDBusConnection::sessionBus().call(msg, QDBus::Block, m_callTimeoutMs);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        throw PlayerError(fmt::format("{}.{} failed: {} ({})",
                                      interfaceName.toStdString(), method.toStdString(),
                                      reply.errorMessage().toStdString(), reply.errorName().toStdString()));
    }
    return reply;
}

QVariant MprisPlayerFacade::getProperty(const QString& interfaceName, const QString& name)
{
    QDBusMessage reply = call(kPropertiesInterface, QStringLiteral("Get"), {interfaceName, name});
    if (reply.arguments().isEmpty()) {
        throw PlayerError(fmt::format("Empty reply reading property {}", name.toStdString()));
    }
    return reply.arguments().first().value<QDBusVariant>().variant();
}

void MprisPlayerFacade::setProperty(const QString& interfaceName, const QString& name, const QVariant& value)
{
    call(kPropertiesInterface, QStringLiteral("Set"),
         {interfaceName, name, QVariant::fromValue(QDBusVariant(value))});
}

void MprisPlayerFacade::play()
{
    call(kPlayerInterface, QStringLiteral("Play"));
}

void MprisPlayerFacade::stop()
{
    call(kPlayerInterface, QStringLiteral("Stop"));
}

void MprisPlayerFacade::pause()
{
    call(kPlayerInterface, QStringLiteral("Pause"));
}

// MPRIS has no separate resume: Play continues a paused track
void MprisPlayerFacade::resume()
{
    call(kPlayerInterface, QStringLiteral("Play"));
}

void MprisPlayerFacade::previous()
{
    call(kPlayerInterface, QStringLiteral("Previous"));
}

void MprisPlayerFacade::next()
{
    call(kPlayerInterface, QStringLiteral("Next"));
}

PlaybackState MprisPlayerFacade::state()
{
    return parsePlaybackStatus(getProperty(kPlayerInterface, QStringLiteral("PlaybackStatus")).toString());
}

int MprisPlayerFacade::volume()
{
    bool ok = false;
    double value = getProperty(kPlayerInterface, QStringLiteral("Volume")).toDouble(&ok);
    if (!ok) {
        throw PlayerError("Volume property is not a number");
    }
    return clampVolume(qRound64(value * 100.0));
}

void MprisPlayerFacade::setVolume(int volume)
{
    setProperty(kPlayerInterface, QStringLiteral("Volume"), QVariant(clampVolume(volume) / 100.0));
}

void MprisPlayerFacade::addToQueue(const QString& uri)
{
    QList<QDBusObjectPath> tracks = toObjectPathList(getProperty(kTrackListInterface, QStringLiteral("Tracks")));
    QDBusObjectPath after(tracks.isEmpty() ? kNoTrack : tracks.last().path());
    call(kTrackListInterface, QStringLiteral("AddTrack"),
         {uri, QVariant::fromValue(after), false});
    LOG_DEBUG("Queued {} after {}", uri.toStdString(), after.path().toStdString());
}

void MprisPlayerFacade::clearQueue()
{
    QList<QDBusObjectPath> tracks = toObjectPathList(getProperty(kTrackListInterface, QStringLiteral("Tracks")));
    for (const QDBusObjectPath& track : tracks) {
        call(kTrackListInterface, QStringLiteral("RemoveTrack"), {QVariant::fromValue(track)});
    }
    LOG_DEBUG("Removed {} tracks from queue", tracks.size());
}

PlaybackState MprisPlayerFacade::parsePlaybackStatus(const QString& status)
{
    if (status == QLatin1String("Playing")) {
        return PlaybackState::Playing;
    }
    if (status == QLatin1String("Paused")) {
        return PlaybackState::Paused;
    }
    return PlaybackState::Stopped;
}

TrackInfo MprisPlayerFacade::parseMetadata(const QVariantMap& metadata, QString* trackId)
{
    TrackInfo track;
    track.name = metadata.value(QStringLiteral("xesam:title")).toString();
    track.uri = metadata.value(QStringLiteral("xesam:url")).toString();
    track.artists = metadata.value(QStringLiteral("xesam:artist")).toStringList();
    track.album = metadata.value(QStringLiteral("xesam:album")).toString();
    if (trackId) {
        *trackId = objectPathString(metadata.value(QStringLiteral("mpris:trackid")));
        if (*trackId == kNoTrack) {
            trackId->clear();
        }
    }
    return track;
}

int64_t MprisPlayerFacade::currentPositionMs()
{
    try {
        // MPRIS reports microseconds
        return getProperty(kPlayerInterface, QStringLiteral("Position")).toLongLong() / 1000;
    } catch (const PlayerError& e) {
        LOG_DEBUG("Position unavailable: {}", e.what());
        return 0;
    }
}

void MprisPlayerFacade::handleMetadataChange(const QVariantMap& metadata)
{
    QString trackId;
    TrackInfo track = parseMetadata(metadata, &trackId);

    if (!trackId.isEmpty() && trackId == m_currentTrackId) {
        // Same queue entry with a new title: a stream announced its current song
        if (track.name != m_currentTrack.name) {
            m_currentTrack = track;
            m_events->Post(StreamTitleChangedEvent{track.name});
        }
        return;
    }

    if (!m_currentTrackId.isEmpty()) {
        m_events->Post(TrackPlaybackEndedEvent{m_currentTrack, currentPositionMs()});
    }
    m_currentTrackId = trackId;
    m_currentTrack = track;
    if (!trackId.isEmpty()) {
        m_events->Post(TrackPlaybackStartedEvent{track});
    }
}

void MprisPlayerFacade::onPropertiesChanged(const QString& interfaceName, const QVariantMap& changed, const QStringList& invalidated)
{
    Q_UNUSED(invalidated);
    if (interfaceName != kPlayerInterface) {
        return;
    }

    auto statusIt = changed.constFind(QStringLiteral("PlaybackStatus"));
    if (statusIt != changed.constEnd()) {
        PlaybackState newState = parsePlaybackStatus(statusIt.value().toString());
        if (newState != m_lastState) {
            PlaybackStateChangedEvent evt{m_lastState, newState};
            m_lastState = newState;
            m_events->Post(evt);
        }
    }

    auto metadataIt = changed.constFind(QStringLiteral("Metadata"));
    if (metadataIt != changed.constEnd()) {
        handleMetadataChange(toVariantMap(metadataIt.value()));
    }

    auto volumeIt = changed.constFind(QStringLiteral("Volume"));
    if (volumeIt != changed.constEnd()) {
        int newVolume = clampVolume(qRound64(volumeIt.value().toDouble() * 100.0));
        if (newVolume != m_lastVolume) {
            m_lastVolume = newVolume;
            m_events->Post(VolumeChangedEvent{newVolume});
        }
    }
}

} // namespace player

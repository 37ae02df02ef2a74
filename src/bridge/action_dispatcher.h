#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <functional>

namespace player { class IPlayerFacade; }

namespace bridge {

class EventPublisher;

enum class DispatchResult {
    Handled = 0,        // Handler ran and called the player
    Rejected = 1,       // Malformed value, logged and dropped
    UnknownAction = 2,  // No handler for the topic suffix
    NotImplemented = 3, // Known action without behaviour
    PlayerFailure = 4,  // Player call failed; later dispatches are unaffected
    Failed = 5          // Unexpected error; the caller should treat the bridge as broken
};

/**
 * ActionDispatcher
 * Routes one inbound (topic suffix, payload) pair to the handler registered
 * for its action code. Never throws: every failure is logged and mapped to a
 * DispatchResult. The handler table is built once in the constructor and is
 * read-only afterwards, so dispatch() may be called from any thread.
 */
class ActionDispatcher
{
public:
    ActionDispatcher(player::IPlayerFacade& player, EventPublisher& publisher);

    DispatchResult dispatch(const QString& topicSuffix, const QByteArray& payload);

    QStringList actions() const { return m_handlers.keys(); }

private:
    using Handler = std::function<DispatchResult(const QString& value)>;

    void registerHandlers();

    DispatchResult onPlaybackAction(const QString& value);
    DispatchResult onVolumeAction(const QString& value);
    DispatchResult onAddAction(const QString& value);
    DispatchResult onClearAction(const QString& value);
    DispatchResult onLoadAction(const QString& value);
    DispatchResult onSearchAction(const QString& value);
    DispatchResult onInfoAction(const QString& value);

    player::IPlayerFacade& m_player;
    EventPublisher& m_publisher;
    QHash<QString, Handler> m_handlers;
};

} // namespace bridge

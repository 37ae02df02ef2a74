#pragma once

#include <QObject>
#include <QString>

class QTimer;
namespace bridge { class BridgeController; }

/**
 * BridgeSupervisor
 * Restarts a failed BridgeController after a fixed delay. A delay of 0 turns
 * restarts off: the first failure requests an exit with kFailureExitCode.
 *
 * All decisions are taken on the supervisor's thread; failures raised on the
 * processor thread are queued here.
 */
class BridgeSupervisor : public QObject
{
    Q_OBJECT
public:
    static constexpr int kFailureExitCode = 2;

    BridgeSupervisor(bridge::BridgeController& controller, int restartDelayMs, QObject* parent = nullptr);
    ~BridgeSupervisor() override;

    // First start. A failure is handled from the event loop, so an exit
    // request issued before QCoreApplication::exec() is not lost.
    void start();
    // Cancels any pending restart and stops the controller
    void shutdown();

    int restartDelay() const { return m_restartDelayMs; }
    int restartCount() const { return m_restartCount; }
    bool isRestartPending() const;

signals:
    void bridgeRestarted(int attempt);
    void exitRequested(int exitCode);

private:
    void onBridgeFailed(const QString& reason);
    void scheduleRestart();
    void restartBridge();

    bridge::BridgeController& m_controller;
    QTimer* m_restartTimer;
    int m_restartDelayMs;
    int m_restartCount = 0;
    bool m_shuttingDown = false;
};

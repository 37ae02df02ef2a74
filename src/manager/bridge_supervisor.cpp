#include "bridge_supervisor.h"

#include <bridge/bridge_controller.h>
#include <log/log_manager.h>
#include <QTimer>
#include <algorithm>

BridgeSupervisor::BridgeSupervisor(bridge::BridgeController& controller, int restartDelayMs, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_restartTimer(new QTimer(this))
    , m_restartDelayMs(std::max(restartDelayMs, 0))
{
    m_restartTimer->setSingleShot(true);
    connect(m_restartTimer, &QTimer::timeout, this, &BridgeSupervisor::restartBridge);

    // failed() is raised on the processor thread; queue it onto ours
    connect(&m_controller, &bridge::BridgeController::failed,
            this, &BridgeSupervisor::onBridgeFailed, Qt::QueuedConnection);
}

BridgeSupervisor::~BridgeSupervisor()
{
    m_restartTimer->stop();
}

void BridgeSupervisor::start()
{
    m_shuttingDown = false;
    if (m_controller.start()) {
        return;
    }
    LOG_WARN("Bridge did not start on first attempt");
    QTimer::singleShot(0, this, &BridgeSupervisor::scheduleRestart);
}

void BridgeSupervisor::shutdown()
{
    m_shuttingDown = true;
    m_restartTimer->stop();
    m_controller.stop();
}

bool BridgeSupervisor::isRestartPending() const
{
    return m_restartTimer->isActive();
}

void BridgeSupervisor::onBridgeFailed(const QString& reason)
{
    LOG_ERROR("Bridge reported failure: {}", reason.toStdString());
    scheduleRestart();
}

void BridgeSupervisor::scheduleRestart()
{
    if (m_shuttingDown) {
        return;
    }
    if (m_restartDelayMs == 0) {
        LOG_CRITICAL("Restarts disabled, exiting");
        emit exitRequested(kFailureExitCode);
        return;
    }
    if (m_restartTimer->isActive()) {
        return;
    }
    LOG_INFO("Restarting bridge in {} ms", m_restartDelayMs);
    m_restartTimer->start(m_restartDelayMs);
}

void BridgeSupervisor::restartBridge()
{
    if (m_shuttingDown) {
        return;
    }
    if (m_controller.state() != bridge::BridgeState::Stopped) {
        // Waits for a teardown still running on the processor thread
        m_controller.stop();
    }
    ++m_restartCount;
    LOG_INFO("Restarting bridge (attempt {})", m_restartCount);
    emit bridgeRestarted(m_restartCount);
    if (!m_controller.start()) {
        scheduleRestart();
    }
}

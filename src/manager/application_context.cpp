#include "application_context.h"
#include <QDir>
#include <QCoreApplication>

#include <bridge/bridge_controller.h>
#include <bus/qt_mqtt_bus_client.h>
#include <config/config_manager.h>
#include <log/log_manager.h>
#include <manager/bridge_supervisor.h>
#include <player/mpris_player_facade.h>
#include <magic_enum/magic_enum.hpp>

ApplicationContext& ApplicationContext::instance()
{
    static ApplicationContext instance;
    return instance;
}

ApplicationContext::ApplicationContext(QObject* parent)
    : QObject(parent)
    , m_initialized(false)
    , m_currentPhase(0)
{
}

ApplicationContext::~ApplicationContext() = default;

void ApplicationContext::initialize(const QString& workspaceDir)
{
    if (m_initialized) {
        LOG_WARN("ApplicationContext already initialized");
        return;
    }

    // Determine workspace directory
    QString workspace = workspaceDir;
    if (workspace.isEmpty()) {
        // Use directory where executable is located
        workspace = QCoreApplication::applicationDirPath();
    }

    // Initialize logging first; log.properties is read from <workspace>/config
    QDir wsDir(workspace);
    LogManager::instance().initialize(wsDir.absoluteFilePath("log").toStdString(),
                                      wsDir.absoluteFilePath("config").toStdString());

    LOG_INFO("Initializing ApplicationContext with workspace: {}", workspace.toStdString());

    try {
        initializePhase1(workspace); // Config
        initializePhase2();          // Player and bus
        initializePhase3();          // Bridge

        m_initialized = true;
        LOG_INFO("ApplicationContext initialized successfully");

    } catch (const std::exception& e) {
        LOG_CRITICAL("Failed to initialize ApplicationContext: {}", e.what());
        throw;
    }
}

void ApplicationContext::initializePhase1(const QString& workspaceDir)
{
    LOG_INFO("Phase 1: Initializing core managers (Config)");

    initializeConfigManager(workspaceDir);

    m_currentPhase = 1;
}

void ApplicationContext::initializePhase2()
{
    LOG_INFO("Phase 2: Initializing player and message bus");

    initializePlayerFacade();
    initializeBusClient();

    m_currentPhase = 2;
}

void ApplicationContext::initializePhase3()
{
    LOG_INFO("Phase 3: Initializing bridge");

    initializeBridgeController();

    m_currentPhase = 3;

    m_supervisor->start();
}

void ApplicationContext::initializeConfigManager(const QString& workspaceDir)
{
    LOG_DEBUG("Creating ConfigManager...");
    m_configManager = std::make_unique<ConfigManager>();
    m_configManager->initialize(workspaceDir);
    LOG_DEBUG("ConfigManager initialized and config loaded");
}

void ApplicationContext::initializePlayerFacade()
{
    LOG_DEBUG("Creating MprisPlayerFacade...");
    m_playerFacade = std::make_unique<player::MprisPlayerFacade>(
        m_configManager->getMprisServiceName(),
        m_configManager->getPlayerCallTimeout());
    // Throws PlayerError without a session bus
    m_playerFacade->initialize();
    LOG_DEBUG("MprisPlayerFacade initialized for {}", m_playerFacade->serviceName().toStdString());
}

void ApplicationContext::initializeBusClient()
{
    LOG_DEBUG("Creating QtMqttBusClient...");
    m_busClient = std::make_unique<bus::QtMqttBusClient>(m_configManager->getReconnectInterval(), nullptr);
    LOG_DEBUG("QtMqttBusClient initialized");
}

void ApplicationContext::initializeBridgeController()
{
    LOG_DEBUG("Creating BridgeController...");
    // Throws std::runtime_error on invalid settings
    bridge::BridgeSettings settings = m_configManager->bridgeSettings();
    m_bridgeController = std::make_unique<bridge::BridgeController>(*m_playerFacade, *m_busClient, settings);
    connect(m_bridgeController.get(), &bridge::BridgeController::stateChanged,
            this, [](bridge::BridgeState state) {
                LOG_DEBUG("Bridge state: {}", magic_enum::enum_name(state));
            });

    m_supervisor = std::make_unique<BridgeSupervisor>(*m_bridgeController, m_configManager->getRestartDelay());
    connect(m_supervisor.get(), &BridgeSupervisor::exitRequested, this, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    });

    LOG_DEBUG("BridgeController initialized");
}

void ApplicationContext::shutdown()
{
    if (!m_initialized && m_currentPhase == 0) {
        LOG_DEBUG("ApplicationContext already shutdown or not initialized");
        return;
    }

    LOG_INFO("Shutting down ApplicationContext...");

    try {
        // Phase 3 shutdown: stop the bridge before its collaborators go away
        LOG_INFO("Shutdown Phase 3: Stopping bridge");
        if (m_supervisor) {
            m_supervisor->shutdown();
        }
        m_supervisor.reset();
        m_bridgeController.reset();

        // Phase 2 shutdown: bus and player
        LOG_INFO("Shutdown Phase 2: Bus and player cleanup");
        m_busClient.reset();
        m_playerFacade.reset();

        // Phase 1 shutdown: Core managers (config last)
        LOG_INFO("Shutdown Phase 1: Core manager cleanup");
        if (m_configManager) {
            LOG_DEBUG("Saving configuration...");
            m_configManager->saveToFile();
        }
        m_configManager.reset();

        m_initialized = false;
        m_currentPhase = 0;

        LOG_INFO("ApplicationContext shutdown complete");

    } catch (const std::exception& e) {
        LOG_ERROR("Error during ApplicationContext shutdown: {}", e.what());
        // Force reset even if error occurred to prevent zombie state
        m_supervisor.reset();
        m_bridgeController.reset();
        m_busClient.reset();
        m_playerFacade.reset();
        m_configManager.reset();
        m_initialized = false;
        m_currentPhase = 0;
    }

    // Shutdown logging system last (after all other logging is complete)
    LogManager::instance().flush();
    LogManager::instance().shutdown();
}

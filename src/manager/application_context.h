#pragma once

#include <QObject>
#include <QString>
#include <memory>

// Forward declarations
class BridgeSupervisor;
class ConfigManager;
namespace bridge { class BridgeController; }
namespace bus { class QtMqttBusClient; }
namespace player { class MprisPlayerFacade; }

/**
 * Central application context that holds all global managers
 * Provides controlled access to shared services with proper initialization order
 */
class ApplicationContext : public QObject
{
    Q_OBJECT

public:
    static ApplicationContext& instance();

    // Initialize all managers with proper dependency order (call once in main.cpp)
    void initialize(const QString& workspaceDir = "");

    // Step-by-step initialization
    void initializePhase1(const QString& workspaceDir); // Core managers (Config)
    void initializePhase2(); // Player and message bus
    void initializePhase3(); // Bridge controller and supervisor

    // Cleanup
    void shutdown();

private:
    explicit ApplicationContext(QObject* parent = nullptr);
    ~ApplicationContext();
    Q_DISABLE_COPY(ApplicationContext)

    void initializeConfigManager(const QString& workspaceDir);
    void initializePlayerFacade();
    void initializeBusClient();
    void initializeBridgeController();

    std::unique_ptr<ConfigManager> m_configManager;
    std::unique_ptr<player::MprisPlayerFacade> m_playerFacade;
    std::unique_ptr<bus::QtMqttBusClient> m_busClient;
    std::unique_ptr<bridge::BridgeController> m_bridgeController;
    std::unique_ptr<BridgeSupervisor> m_supervisor;

    bool m_initialized = false;
    int m_currentPhase = 0;
};

// Convenience macro for easy access
#define APP_CONTEXT ApplicationContext::instance()

#pragma once

#include <bridge/bridge_controller.h>
#include <QObject>
#include <QString>
#include <QSettings>
#include <QDir>

/**
 * Configuration Manager - handles all application settings
 * All paths are relative to workspace directory for portability
 * Must be initialized first as other managers depend on it
 */
class ConfigManager : public QObject
{
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    // Initialization with workspace directory
    void initialize(const QString& workspaceDir);
    void loadFromFile();
    void saveToFile();

    // Workspace management
    QString getAbsolutePath(const QString& relativePath) const;

    // Default workspace structure paths (relative to workspace)
    QString getConfigDirectory() const { return "config"; }
    QString getLogDirectory() const { return "log"; }
    QString getConfigFilePath() const { return "config.ini"; } // Fixed file at workspace root

    // Broker settings
    QString getMqttHost() const;
    int getMqttPort() const;
    QString getMqttUsername() const;
    QString getMqttPassword() const;
    QString getMqttClientId() const;
    int getMqttQos() const;
    int getReconnectInterval() const; // 0 disables automatic reconnects
    void setMqttHost(const QString& host);
    void setMqttPort(int port);
    void setMqttCredentials(const QString& username, const QString& password);

    // Topic layout: <topic>/<command_subtopic>/<code> and <topic>/<state_subtopic>/<code>
    QString getMqttTopic() const;
    QString getCommandSubtopic() const;
    QString getStateSubtopic() const;
    bool getRetainState() const;
    void setMqttTopic(const QString& topic);
    void setRetainState(bool retain);

    // Player settings
    QString getMprisServiceName() const;
    int getPlayerCallTimeout() const;

    // Supervisor: 0 disables restarts
    int getRestartDelay() const;

    // Validated settings for the controller. Throws std::runtime_error on
    // blank host, out-of-range port or empty topic.
    bridge::BridgeSettings bridgeSettings() const;

private:
    void setupDefaults();
    void ensureDefaultDirectoriesExist();

    QSettings* m_settings;
    QString m_workspaceDir;
};

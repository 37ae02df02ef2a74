#include "config_manager.h"
#include "../log/log_manager.h"
#include <QFileInfo>
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

namespace {
const char* kDefaultHost = "localhost";
const int kDefaultPort = 1883;
const char* kDefaultClientId = "mqtt-player-bridge";
const char* kDefaultTopic = "mopidy";
const char* kDefaultCommandSubtopic = "c";
const char* kDefaultStateSubtopic = "i";
const char* kDefaultMprisService = "org.mpris.MediaPlayer2.mopidy";
const int kDefaultReconnectIntervalMs = 2000;
const int kDefaultCallTimeoutMs = 2000;
const int kDefaultRestartDelayMs = 5000;

QString joinTopic(const QString& base, const QString& sub)
{
    QString left = base;
    while (left.endsWith('/')) left.chop(1);
    QString right = sub;
    while (right.startsWith('/')) right = right.mid(1);
    if (right.isEmpty()) return left;
    return left + "/" + right;
}
}

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , m_settings(nullptr)
{
    LOG_DEBUG("ConfigManager created");
}

ConfigManager::~ConfigManager()
{
    if (m_settings) {
        delete m_settings;
    }
    LOG_DEBUG("ConfigManager destroyed");
}

void ConfigManager::initialize(const QString& workspaceDir)
{
    LOG_INFO("Initializing ConfigManager with workspace: {}", workspaceDir.toStdString());

    // Set workspace directory (must be absolute path)
    QDir wsDir(workspaceDir);
    m_workspaceDir = wsDir.absolutePath();

    if (!wsDir.exists()) {
        if (!wsDir.mkpath(m_workspaceDir)) {
            std::string error = fmt::format("Failed to create workspace directory: {}", m_workspaceDir.toStdString());
            LOG_ERROR(error);
            throw std::runtime_error(error);
        }
        LOG_INFO("Created workspace directory: {}", m_workspaceDir.toStdString());
    }

    ensureDefaultDirectoriesExist();

    // Setup QSettings to use workspace-based config file
    QString configPath = getAbsolutePath(getConfigFilePath());
    delete m_settings;
    m_settings = new QSettings(configPath, QSettings::IniFormat);

    LOG_INFO("ConfigManager initialized with config file: {}", configPath.toStdString());

    setupDefaults();
    loadFromFile();
}

void ConfigManager::ensureDefaultDirectoriesExist()
{
    QStringList defaultDirs = {
        getConfigDirectory(),
        getLogDirectory()
    };

    for (const QString& relativeDir : defaultDirs) {
        QString absoluteDir = getAbsolutePath(relativeDir);
        QDir dir;
        if (!dir.exists(absoluteDir)) {
            if (!dir.mkpath(absoluteDir)) {
                LOG_ERROR("Failed to create default directory: {}", absoluteDir.toStdString());
            } else {
                LOG_DEBUG("Created default directory: {}", absoluteDir.toStdString());
            }
        }
    }
}

QString ConfigManager::getAbsolutePath(const QString& relativePath) const
{
    if (m_workspaceDir.isEmpty()) {
        LOG_ERROR("Workspace directory not set");
        return relativePath;
    }

    QDir wsDir(m_workspaceDir);
    return wsDir.absoluteFilePath(relativePath);
}

void ConfigManager::setupDefaults()
{
    if (!m_settings) return;

    LOG_DEBUG("Setting up default configuration values");

    // Broker
    if (!m_settings->contains("mqtt/host")) {
        m_settings->setValue("mqtt/host", kDefaultHost);
    }
    if (!m_settings->contains("mqtt/port")) {
        m_settings->setValue("mqtt/port", kDefaultPort);
    }
    if (!m_settings->contains("mqtt/username")) {
        m_settings->setValue("mqtt/username", "");
    }
    if (!m_settings->contains("mqtt/password")) {
        m_settings->setValue("mqtt/password", "");
    }
    if (!m_settings->contains("mqtt/client_id")) {
        m_settings->setValue("mqtt/client_id", kDefaultClientId);
    }
    if (!m_settings->contains("mqtt/qos")) {
        m_settings->setValue("mqtt/qos", 0);
    }
    if (!m_settings->contains("mqtt/reconnect_interval_ms")) {
        m_settings->setValue("mqtt/reconnect_interval_ms", kDefaultReconnectIntervalMs);
    }

    // Topics
    if (!m_settings->contains("mqtt/topic")) {
        m_settings->setValue("mqtt/topic", kDefaultTopic);
    }
    if (!m_settings->contains("mqtt/command_subtopic")) {
        m_settings->setValue("mqtt/command_subtopic", kDefaultCommandSubtopic);
    }
    if (!m_settings->contains("mqtt/state_subtopic")) {
        m_settings->setValue("mqtt/state_subtopic", kDefaultStateSubtopic);
    }
    if (!m_settings->contains("mqtt/retain_state")) {
        m_settings->setValue("mqtt/retain_state", true);
    }

    // Player
    if (!m_settings->contains("player/mpris_service")) {
        m_settings->setValue("player/mpris_service", kDefaultMprisService);
    }
    if (!m_settings->contains("player/call_timeout_ms")) {
        m_settings->setValue("player/call_timeout_ms", kDefaultCallTimeoutMs);
    }

    // Supervisor
    if (!m_settings->contains("bridge/restart_delay_ms")) {
        m_settings->setValue("bridge/restart_delay_ms", kDefaultRestartDelayMs);
    }

    m_settings->sync();
    LOG_DEBUG("Default configuration values set");
}

void ConfigManager::loadFromFile()
{
    if (!m_settings) {
        LOG_ERROR("Settings not initialized");
        return;
    }

    LOG_INFO("Loading configuration from file");
    m_settings->sync();
    if (m_settings->status() == QSettings::FormatError) {
        LOG_WARN("Configuration file is malformed, defaults will be used for unreadable keys");
    }

    LOG_INFO("Broker {}:{}, topic '{}'", getMqttHost().toStdString(), getMqttPort(), getMqttTopic().toStdString());
    LOG_INFO("Configuration loaded successfully");
}

void ConfigManager::saveToFile()
{
    if (!m_settings) {
        LOG_ERROR("Settings not initialized");
        return;
    }

    LOG_DEBUG("Saving configuration to file");
    m_settings->sync();

    if (m_settings->status() != QSettings::NoError) {
        LOG_ERROR("Failed to save configuration file");
    } else {
        LOG_DEBUG("Configuration saved successfully");
    }
}

// Broker settings
QString ConfigManager::getMqttHost() const
{
    return m_settings ? m_settings->value("mqtt/host", kDefaultHost).toString() : kDefaultHost;
}

int ConfigManager::getMqttPort() const
{
    return m_settings ? m_settings->value("mqtt/port", kDefaultPort).toInt() : kDefaultPort;
}

QString ConfigManager::getMqttUsername() const
{
    return m_settings ? m_settings->value("mqtt/username", "").toString() : QString();
}

QString ConfigManager::getMqttPassword() const
{
    return m_settings ? m_settings->value("mqtt/password", "").toString() : QString();
}

QString ConfigManager::getMqttClientId() const
{
    return m_settings ? m_settings->value("mqtt/client_id", kDefaultClientId).toString() : kDefaultClientId;
}

int ConfigManager::getMqttQos() const
{
    int qos = m_settings ? m_settings->value("mqtt/qos", 0).toInt() : 0;
    return std::clamp(qos, 0, 2);
}

int ConfigManager::getReconnectInterval() const
{
    int interval = m_settings ? m_settings->value("mqtt/reconnect_interval_ms", kDefaultReconnectIntervalMs).toInt() : kDefaultReconnectIntervalMs;
    return std::max(interval, 0);
}

void ConfigManager::setMqttHost(const QString& host)
{
    if (!m_settings) return;
    m_settings->setValue("mqtt/host", host);
    LOG_INFO("Broker host changed to: {}", host.toStdString());
}

void ConfigManager::setMqttPort(int port)
{
    if (!m_settings) return;
    m_settings->setValue("mqtt/port", port);
    LOG_INFO("Broker port changed to: {}", port);
}

void ConfigManager::setMqttCredentials(const QString& username, const QString& password)
{
    if (!m_settings) return;
    m_settings->setValue("mqtt/username", username);
    m_settings->setValue("mqtt/password", password);
    LOG_INFO("Broker credentials changed for user '{}'", username.toStdString());
}

// Topic layout
QString ConfigManager::getMqttTopic() const
{
    return m_settings ? m_settings->value("mqtt/topic", kDefaultTopic).toString() : kDefaultTopic;
}

QString ConfigManager::getCommandSubtopic() const
{
    return m_settings ? m_settings->value("mqtt/command_subtopic", kDefaultCommandSubtopic).toString() : kDefaultCommandSubtopic;
}

QString ConfigManager::getStateSubtopic() const
{
    return m_settings ? m_settings->value("mqtt/state_subtopic", kDefaultStateSubtopic).toString() : kDefaultStateSubtopic;
}

bool ConfigManager::getRetainState() const
{
    return m_settings ? m_settings->value("mqtt/retain_state", true).toBool() : true;
}

void ConfigManager::setMqttTopic(const QString& topic)
{
    if (!m_settings) return;
    m_settings->setValue("mqtt/topic", topic);
    LOG_INFO("Base topic changed to: {}", topic.toStdString());
}

void ConfigManager::setRetainState(bool retain)
{
    if (!m_settings) return;
    m_settings->setValue("mqtt/retain_state", retain);
}

// Player settings
QString ConfigManager::getMprisServiceName() const
{
    return m_settings ? m_settings->value("player/mpris_service", kDefaultMprisService).toString() : kDefaultMprisService;
}

int ConfigManager::getPlayerCallTimeout() const
{
    int timeout = m_settings ? m_settings->value("player/call_timeout_ms", kDefaultCallTimeoutMs).toInt() : kDefaultCallTimeoutMs;
    return timeout > 0 ? timeout : kDefaultCallTimeoutMs;
}

int ConfigManager::getRestartDelay() const
{
    int delay = m_settings ? m_settings->value("bridge/restart_delay_ms", kDefaultRestartDelayMs).toInt() : kDefaultRestartDelayMs;
    return std::max(delay, 0);
}

bridge::BridgeSettings ConfigManager::bridgeSettings() const
{
    if (getMqttHost().trimmed().isEmpty()) {
        std::string error = "Broker host must not be empty";
        LOG_ERROR(error);
        throw std::runtime_error(error);
    }
    int port = getMqttPort();
    if (port < 1 || port > 65535) {
        std::string error = fmt::format("Invalid broker port: {}", port);
        LOG_ERROR(error);
        throw std::runtime_error(error);
    }
    QString topic = getMqttTopic().trimmed();
    if (topic.isEmpty() || topic == "/") {
        std::string error = "Base topic must not be empty";
        LOG_ERROR(error);
        throw std::runtime_error(error);
    }
    QString commandTopic = joinTopic(topic, getCommandSubtopic());
    QString stateTopic = joinTopic(topic, getStateSubtopic());
    if (commandTopic == stateTopic) {
        LOG_WARN("Command and state topics are both {}, published state will be read back as commands",
                 commandTopic.toStdString());
    }

    bridge::BridgeSettings settings;
    settings.broker.host = getMqttHost().trimmed();
    settings.broker.port = static_cast<uint16_t>(port);
    settings.broker.username = getMqttUsername();
    settings.broker.password = getMqttPassword();
    settings.broker.clientId = getMqttClientId();
    settings.broker.qos = static_cast<quint8>(getMqttQos());
    settings.commandTopic = commandTopic;
    settings.stateTopic = stateTopic;
    settings.retainState = getRetainState();
    return settings;
}

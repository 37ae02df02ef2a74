#include "log_manager.h"
#include <filesystem>
#include <iostream>
#include <fstream>
#include <unordered_map>
#include <vector>

LogManager& LogManager::instance()
{
    static LogManager instance;
    return instance;
}

spdlog::level::level_enum LogManager::parseLevel(std::string name, spdlog::level::level_enum fallback)
{
    for (auto &c : name) c = static_cast<char>(::toupper(c));
    if (name == "TRACE") return spdlog::level::trace;
    if (name == "DEBUG") return spdlog::level::debug;
    if (name == "INFO") return spdlog::level::info;
    if (name == "WARN") return spdlog::level::warn;
    if (name == "ERROR") return spdlog::level::err;
    if (name == "CRITICAL") return spdlog::level::critical;
    return fallback;
}

void LogManager::initialize(const std::string& logDirectory, const std::string& configDirectory)
{
    if (m_initialized) {
        return;
    }

    try {
        m_logDirectory = logDirectory;

        // Optional log.properties, first match wins:
        // <configDirectory>/log.properties, <logDirectory>/log.properties
        std::unordered_map<std::string, std::string> props;
        std::vector<std::filesystem::path> candidates = {
            std::filesystem::path(configDirectory) / "log.properties",
            std::filesystem::path(logDirectory) / "log.properties"
        };
        for (const auto &p : candidates) {
            if (!std::filesystem::exists(p)) continue;
            std::ifstream ifs(p);
            if (ifs) {
                std::string line;
                while (std::getline(ifs, line)) {
                    auto start = line.find_first_not_of(" \t\r\n");
                    if (start == std::string::npos) continue;
                    if (line[start] == '#') continue;
                    auto eq = line.find('=', start);
                    if (eq == std::string::npos) continue;
                    std::string key = line.substr(start, eq - start);
                    std::string val = line.substr(eq + 1);
                    auto end = val.find_last_not_of(" \t\r\n");
                    if (end != std::string::npos) val = val.substr(0, end + 1);
                    for (auto &c : key) c = static_cast<char>(::tolower(c));
                    props[key] = val;
                }
            }
            break;
        }

        std::filesystem::create_directories(logDirectory);

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(props.count("console_level")
                                    ? parseLevel(props["console_level"], spdlog::level::info)
                                    : spdlog::level::info);
        console_sink->set_pattern(props.count("console_pattern")
                                      ? props["console_pattern"]
                                      : "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        std::string fileName = "mqtt_player_bridge.log";
        if (props.count("file")) fileName = props["file"];
        std::string logFilePath = (std::filesystem::path(logDirectory) / fileName).string();
        size_t maxFileSize = 1024ULL * 1024ULL * 10ULL; // default 10MB
        size_t maxFiles = 5;
        if (props.count("max_size")) {
            try {
                maxFileSize = static_cast<size_t>(std::stoull(props["max_size"]));
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid log max_size: " << props["max_size"] << std::endl;
            }
        }
        if (props.count("max_files")) {
            try {
                maxFiles = static_cast<size_t>(std::stoul(props["max_files"]));
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid log max_files: " << props["max_files"] << std::endl;
            }
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, maxFileSize, maxFiles);
        file_sink->set_level(props.count("file_level")
                                 ? parseLevel(props["file_level"], spdlog::level::trace)
                                 : spdlog::level::trace);
        file_sink->set_pattern(props.count("file_pattern")
                                   ? props["file_pattern"]
                                   : "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
        sinks.push_back(file_sink);

        m_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        m_logger->set_level(spdlog::level::debug);
        m_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(m_logger);
        spdlog::set_default_logger(m_logger);

        m_initialized = true;

        LOG_INFO("LogManager initialized successfully");
        LOG_INFO("Log directory: {}", logDirectory);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize LogManager: " << e.what() << std::endl;
        m_initialized = false;
    }
}

void LogManager::shutdown()
{
    if (!m_initialized) {
        return;
    }

    LOG_INFO("LogManager shutting down...");

    if (m_logger) {
        m_logger->flush();
        spdlog::drop_all();
        m_logger.reset();
    }

    m_initialized = false;
}

void LogManager::flush()
{
    if (m_logger) {
        m_logger->flush();
    }
}

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTimer>
#include <manager/application_context.h>
#include <exception>
#include <csignal>
#include <iostream>
#include <log/log_manager.h>

namespace {
volatile std::sig_atomic_t s_stopRequested = 0;

void onTerminationSignal(int)
{
    s_stopRequested = 1;
}
}

int main(int argc, char *argv[])
{
    // Install terminate handler to capture uncaught exceptions and make them
    // visible in logs before aborting.
    std::set_terminate([]() {
        try {
            if (std::current_exception()) {
                try { std::rethrow_exception(std::current_exception()); }
                catch (const std::exception &e) {
                    std::cerr << "terminate due to exception: " << e.what() << std::endl;
                }
                catch (...) {
                    std::cerr << "terminate due to unknown non-std exception" << std::endl;
                }
            } else {
                std::cerr << "terminate called without an active exception" << std::endl;
            }
        } catch (...) {}
        LogManager::instance().flush();
        std::abort();
    });

    QCoreApplication a(argc, argv);
    a.setApplicationName("mqtt-player-bridge");
    a.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Bridges MPRIS media player control and MQTT topics");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption workspaceOption(QStringList() << "w" << "workspace",
        "Workspace directory holding config.ini and log/ (default: executable directory).",
        "dir");
    parser.addOption(workspaceOption);
    parser.process(a);

    // SIGINT/SIGTERM only raise a flag; the event loop polls it and quits
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
    QTimer stopPoller;
    QObject::connect(&stopPoller, &QTimer::timeout, &a, []() {
        if (s_stopRequested) {
            LOG_INFO("Termination signal received, shutting down");
            QCoreApplication::quit();
        }
    });
    stopPoller.start(200);

    try {
        APP_CONTEXT.initialize(parser.value(workspaceOption));
    } catch (const std::exception& e) {
        std::cerr << "Initialization failed: " << e.what() << std::endl;
        APP_CONTEXT.shutdown();
        return 1;
    }

    // Handle cleanup on app quit (wrap in try/catch to ensure errors are logged)
    QObject::connect(&a, &QCoreApplication::aboutToQuit, []() {
        try {
            APP_CONTEXT.shutdown();
        } catch (const std::exception& e) {
            std::cerr << "Exception during APP_CONTEXT.shutdown(): " << e.what() << std::endl;
            std::abort();
        }
    });

    int execRet = a.exec();
    std::cerr << "Application exiting with code: " << execRet << std::endl;
    return execRet;
}

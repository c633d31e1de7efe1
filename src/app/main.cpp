#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "app/demo_session.hpp"
#include "app/logging_window_control.hpp"
#include "app/shutdown_watcher.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/pomotray_version.hpp"
#include "dbus/bus_connection.hpp"
#include "tray/tray_controller.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pomotray"));
    QCoreApplication::setApplicationVersion(QStringLiteral(POMOTRAY_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("StatusNotifierItem and dbusmenu tray services."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption demoOption(QStringList() << "demo-duration",
                                  "Play one demo session lasting <seconds>.",
                                  "seconds",
                                  "0");
    parser.addOption(traceOption);
    parser.addOption(demoOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("POMOTRAY_TRACE") == 1;
    pomotray::logging::initLogging(QStringLiteral("pomotray"), trace);

    bool demoOk = false;
    const int demoSeconds = parser.value(demoOption).toInt(&demoOk);
    if (!demoOk || demoSeconds < 0) {
        qWarning() << "Invalid --demo-duration value" << parser.value(demoOption);
        return 2;
    }

    PLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("tray_start"),
              QStringLiteral("user_start"),
              QStringLiteral("qt_app"),
              (nlohmann::json{{"version", POMOTRAY_VERSION}, {"demoSeconds", demoSeconds}}));

    const pomotray::TrayConfig config = pomotray::loadTrayConfig();

    pomotray::SessionBusConnection bus;
    if (!bus.isConnected()) {
        qWarning() << "Session bus not available. Exiting.";
        return 1;
    }

    pomotray::LoggingWindowControl window;
    pomotray::TrayController controller(window);
    if (!controller.configure(bus, config)) {
        qWarning() << "Could not register the tray item. Is a StatusNotifierWatcher running?";
        return 1;
    }

    QObject::connect(&window, &pomotray::LoggingWindowControl::windowShown,
                     &controller, &pomotray::TrayController::onWindowShown);
    QObject::connect(&window, &pomotray::LoggingWindowControl::windowHidden,
                     &controller, &pomotray::TrayController::onWindowHidden);
    controller.activate();

    pomotray::DemoSession demo(demoSeconds);
    QObject::connect(&demo, &pomotray::DemoSession::sessionStarted,
                     &controller, &pomotray::TrayController::onSessionStarted);
    QObject::connect(&demo, &pomotray::DemoSession::timerUpdated,
                     &controller, &pomotray::TrayController::onTimerUpdated);
    QObject::connect(&demo, &pomotray::DemoSession::sessionEnded,
                     &controller, &pomotray::TrayController::onSessionEnded);

    // Passive goes out while the loop still runs; quit on the next turn.
    const auto stopTray = [&app, &controller]() {
        controller.deactivate();
        QTimer::singleShot(0, &app, &QCoreApplication::quit);
    };

    if (demoSeconds > 0) {
        QObject::connect(&demo, &pomotray::DemoSession::sessionEnded, &app, stopTray);
        QTimer::singleShot(0, &demo, &pomotray::DemoSession::start);
    }

    pomotray::ShutdownWatcher shutdown;
    QObject::connect(&shutdown, &pomotray::ShutdownWatcher::shutdownRequested, &app, stopTray);

    return app.exec();
}

#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include <csignal>

#include "app/demo_session.hpp"
#include "app/shutdown_watcher.hpp"
#include "common/config.hpp"
#include "tray/tray_controller.hpp"
#include "tray/window_control.hpp"
#include "fake_bus_connection.hpp"

namespace {

class NullWindowControl : public pomotray::WindowControl
{
public:
    void showWindow() override {}
    void hideWindow() override {}
};

} // namespace

class HostTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testTerminationSignalRequestsShutdown();
    void testShutdownPublishesPassive();
    void testDemoSessionRunsToCompletion();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void HostTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void HostTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void HostTests::testTerminationSignalRequestsShutdown()
{
    pomotray::ShutdownWatcher watcher;
    QSignalSpy requested(&watcher, &pomotray::ShutdownWatcher::shutdownRequested);
    QCOMPARE(watcher.receivedSignal(), 0);

    std::raise(SIGTERM);

    QVERIFY(requested.wait(2000));
    QCOMPARE(requested.count(), 1);
    QCOMPARE(requested.at(0).at(0).toInt(), int(SIGTERM));
    QCOMPARE(watcher.receivedSignal(), int(SIGTERM));
}

void HostTests::testShutdownPublishesPassive()
{
    FakeBusConnection bus;
    NullWindowControl window;
    pomotray::TrayController controller(window);
    QVERIFY(controller.configure(bus, pomotray::TrayConfig()));
    controller.activate();
    controller.onSessionStarted();

    pomotray::ShutdownWatcher watcher;
    bool loopStopped = false;
    connect(&watcher, &pomotray::ShutdownWatcher::shutdownRequested, this,
            [&controller, &loopStopped]() {
                controller.deactivate();
                loopStopped = true;
            });

    std::raise(SIGINT);

    QTRY_VERIFY(loopStopped);
    QVERIFY(!controller.isActivated());
    QVERIFY(controller.item()->state().status == pomotray::ItemStatus::Passive);
    QCOMPARE(bus.propertyChanges(QStringLiteral("Status")).last().toString(),
             QStringLiteral("Passive"));
}

void HostTests::testDemoSessionRunsToCompletion()
{
    pomotray::DemoSession demo(1);
    QSignalSpy started(&demo, &pomotray::DemoSession::sessionStarted);
    QSignalSpy ticks(&demo, &pomotray::DemoSession::timerUpdated);
    QSignalSpy ended(&demo, &pomotray::DemoSession::sessionEnded);

    demo.start();
    QVERIFY(demo.isRunning());
    QCOMPARE(started.count(), 1);

    QVERIFY(ended.wait(5000));
    QVERIFY(!demo.isRunning());
    QCOMPARE(ticks.first().at(0).toDouble(), 0.0);
    QCOMPARE(ticks.last().at(0).toDouble(), 100.0);
}

QTEST_MAIN(HostTests)
#include "test_host.moc"

#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include <stdexcept>

#include "common/config.hpp"
#include "tray/tray_controller.hpp"
#include "tray/window_control.hpp"
#include "fake_bus_connection.hpp"

using pomotray::ItemStatus;
using pomotray::MenuModel;
using pomotray::SessionPhase;
using pomotray::TrayController;

namespace {

class FakeWindowControl : public pomotray::WindowControl
{
public:
    int showCount = 0;
    int hideCount = 0;
    bool failNext = false;

    void showWindow() override
    {
        ++showCount;
    }

    void hideWindow() override
    {
        ++hideCount;
        if (failNext) {
            failNext = false;
            throw std::runtime_error("window already destroyed");
        }
    }
};

bool menuEntryVisible(const TrayController &controller, int id)
{
    return controller.menu()->getProperty(id, QStringLiteral("visible")).toBool();
}

} // namespace

class TrayControllerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testIconNameForPercent_data();
    void testIconNameForPercent();
    void testConfigureRegistersBothServices();
    void testConfigureFailureIsContained();
    void testInactiveControllerIgnoresEvents();
    void testStartThenEndEmitsTwoStatusChanges();
    void testInterruptAndRepeatedEvents();
    void testTimerUpdatesIcon();
    void testWindowVisibilityDrivesMenu();
    void testMenuClicksReachWindowControl();
    void testWindowControlFailureIsContained();
    void testActivateDuringRunningSession();
    void testDeactivateSetsPassive();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    pomotray::TrayConfig m_config;
};

void TrayControllerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TrayControllerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void TrayControllerTests::testIconNameForPercent_data()
{
    QTest::addColumn<double>("percent");
    QTest::addColumn<QString>("expected");

    QTest::newRow("zero") << 0.0 << QStringLiteral("tomate-00");
    QTest::newRow("single digit") << 5.4 << QStringLiteral("tomate-05");
    QTest::newRow("rounds up") << 99.6 << QStringLiteral("tomate-100");
    QTest::newRow("full") << 100.0 << QStringLiteral("tomate-100");
    QTest::newRow("tie to even down") << 42.5 << QStringLiteral("tomate-42");
    QTest::newRow("tie to even up") << 43.5 << QStringLiteral("tomate-44");
}

void TrayControllerTests::testIconNameForPercent()
{
    QFETCH(double, percent);
    QFETCH(QString, expected);
    QCOMPARE(TrayController::iconNameForPercent(QStringLiteral("tomate-"), percent), expected);
}

void TrayControllerTests::testConfigureRegistersBothServices()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);

    QVERIFY(controller.configure(bus, m_config));
    QVERIFY(controller.isConfigured());
    QCOMPARE(bus.objectPaths,
             (QStringList{QStringLiteral("/MenuBar"), QStringLiteral("/StatusNotifierItem")}));
    QCOMPARE(bus.calls.size(), 1);
}

void TrayControllerTests::testConfigureFailureIsContained()
{
    FakeBusConnection bus;
    bus.failMethodCalls = true;
    FakeWindowControl window;
    TrayController controller(window);

    QVERIFY(!controller.configure(bus, m_config));
    QVERIFY(!controller.isConfigured());
    QVERIFY(controller.item() == nullptr);
    QVERIFY(controller.menu() == nullptr);

    controller.activate();
    controller.onSessionStarted();
    controller.onTimerUpdated(50.0);
    controller.onWindowHidden();
    controller.onSessionEnded();
    controller.deactivate();
    QVERIFY(bus.broadcasts.isEmpty());
}

void TrayControllerTests::testInactiveControllerIgnoresEvents()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));
    QSignalSpy menuUpdates(controller.menu(), &pomotray::DBusMenu::ItemsPropertiesUpdated);

    controller.onSessionStarted();
    controller.onTimerUpdated(10.0);

    QVERIFY(controller.phase() == SessionPhase::Running);
    QVERIFY(controller.item()->state().status == ItemStatus::Passive);
    QCOMPARE(controller.item()->iconName(), QStringLiteral("pomotray-idle"));
    QCOMPARE(menuUpdates.count(), 0);
    QVERIFY(bus.broadcasts.isEmpty());
}

void TrayControllerTests::testStartThenEndEmitsTwoStatusChanges()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));
    controller.activate();
    QSignalSpy newStatus(controller.item(), &pomotray::StatusNotifierItem::NewStatus);

    controller.onSessionStarted();
    controller.onSessionEnded();

    QVERIFY(controller.item()->state().status == ItemStatus::Passive);
    QVERIFY(controller.phase() == SessionPhase::Idle);
    QCOMPARE(bus.propertyChanges(QStringLiteral("Status")),
             (QList<QVariant>{QStringLiteral("Active"), QStringLiteral("Passive")}));
    QCOMPARE(newStatus.count(), 2);
}

void TrayControllerTests::testInterruptAndRepeatedEvents()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));
    controller.activate();

    controller.onSessionStarted();
    controller.onSessionStarted();
    controller.onSessionInterrupted();
    QVERIFY(controller.phase() == SessionPhase::Interrupted);
    controller.onSessionEnded();

    QCOMPARE(bus.propertyChanges(QStringLiteral("Status")),
             (QList<QVariant>{QStringLiteral("Active"), QStringLiteral("Passive")}));
}

void TrayControllerTests::testTimerUpdatesIcon()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));
    controller.activate();
    QSignalSpy newIcon(controller.item(), &pomotray::StatusNotifierItem::NewIcon);

    controller.onTimerUpdated(0.0);
    controller.onTimerUpdated(0.2);
    controller.onTimerUpdated(12.7);
    controller.onTimerUpdated(99.6);

    QCOMPARE(controller.item()->iconName(), QStringLiteral("pomotray-100"));
    QCOMPARE(bus.propertyChanges(QStringLiteral("IconName")),
             (QList<QVariant>{QStringLiteral("pomotray-00"),
                              QStringLiteral("pomotray-13"),
                              QStringLiteral("pomotray-100")}));
    QCOMPARE(newIcon.count(), 3);
}

void TrayControllerTests::testWindowVisibilityDrivesMenu()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));
    controller.activate();
    QSignalSpy menuUpdates(controller.menu(), &pomotray::DBusMenu::ItemsPropertiesUpdated);

    controller.onWindowHidden();
    QVERIFY(menuEntryVisible(controller, MenuModel::kShowId));
    QVERIFY(!menuEntryVisible(controller, MenuModel::kHideId));

    controller.onSessionStarted();
    QVERIFY(!menuEntryVisible(controller, MenuModel::kShowId));
    QVERIFY(menuEntryVisible(controller, MenuModel::kHideId));

    controller.onWindowShown();
    QCOMPARE(menuUpdates.count(), 3);
}

void TrayControllerTests::testMenuClicksReachWindowControl()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));

    controller.menu()->dispatchEvent(MenuModel::kHideId, QStringLiteral("clicked"), QVariant(), 0);
    QCOMPARE(window.hideCount, 1);
    QCOMPARE(window.showCount, 0);

    const QList<int> notFound = controller.menu()->dispatchEventGroup(
        {pomotray::DBusMenuEvent{MenuModel::kShowId, QStringLiteral("clicked"), QDBusVariant(QVariant(0)), 0},
         pomotray::DBusMenuEvent{9999, QStringLiteral("clicked"), QDBusVariant(QVariant(0)), 0}});
    QCOMPARE(notFound, QList<int>{9999});
    QCOMPARE(window.showCount, 1);
    QCOMPARE(window.hideCount, 1);
}

void TrayControllerTests::testWindowControlFailureIsContained()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    window.failNext = true;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));

    controller.menu()->dispatchEvent(MenuModel::kHideId, QStringLiteral("clicked"), QVariant(), 0);
    QCOMPARE(window.hideCount, 1);
}

void TrayControllerTests::testActivateDuringRunningSession()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));

    controller.onSessionStarted();
    QVERIFY(controller.item()->state().status == ItemStatus::Passive);

    controller.activate();
    QVERIFY(controller.isActivated());
    QVERIFY(controller.item()->state().status == ItemStatus::Active);
}

void TrayControllerTests::testDeactivateSetsPassive()
{
    FakeBusConnection bus;
    FakeWindowControl window;
    TrayController controller(window);
    QVERIFY(controller.configure(bus, m_config));
    controller.activate();
    controller.onSessionStarted();

    controller.deactivate();
    QVERIFY(!controller.isActivated());
    QVERIFY(controller.item()->state().status == ItemStatus::Passive);

    controller.onSessionStarted();
    QVERIFY(controller.item()->state().status == ItemStatus::Passive);
}

QTEST_MAIN(TrayControllerTests)
#include "test_tray_controller.moc"

#include <QtTest/QtTest>

#include <QDBusMessage>
#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "dbus/bus_call_context.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSkippedWithoutTrace();
    void testTraceWrites();
    void testCallScopeNests();
    void testBusCallerBecomesWho();
    void testSlotCalledInProcessGetsLocalContext();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logDir() const;
    nlohmann::json lastLine(const QString &path) const;
};

namespace {

// A QDBusContext whose slot was not invoked from the bus.
class InProcessContext : public QDBusContext
{
};

} // namespace

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logDir() const
{
    return m_tempDir.path() + "/.local/share/pomotray/logs";
}

nlohmann::json LoggingTests::lastLine(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    QByteArray last;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            last = line;
        }
    }
    return nlohmann::json::parse(last.toStdString(), nullptr, false);
}

void LoggingTests::testLogEventWrites()
{
    pomotray::logging::initLogging(QStringLiteral("pomotray-test"), false);
    const QString logPath = logDir() + "/pomotray-test.log";

    pomotray::logging::logEvent(pomotray::logging::LogLevel::Info,
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                nlohmann::json{{"names", pomotray::logging::toJson({"label", "visible"})}});

    QVERIFY(QFile::exists(logPath));
    const nlohmann::json parsed = lastLine(logPath);
    QVERIFY(parsed.is_object());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")), QStringLiteral("pomotray-test"));
    QVERIFY(QString::fromStdString(parsed.value("who", "")).startsWith(QStringLiteral("pid:")));
    QVERIFY(!parsed.contains("call"));
    QCOMPARE(parsed["context"]["names"].size(), std::size_t(2));
    QCOMPARE(QString::fromStdString(parsed["context"]["names"][1].get<std::string>()),
             QStringLiteral("visible"));
}

void LoggingTests::testDebugSkippedWithoutTrace()
{
    pomotray::logging::initLogging(QStringLiteral("pomotray-quiet"), false);
    QVERIFY(!pomotray::logging::isTraceEnabled());

    PLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugSkippedWithoutTrace"),
               QStringLiteral("test_debug"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               nlohmann::json::object());

    QVERIFY(!QFile::exists(logDir() + "/pomotray-quiet.log"));
    QVERIFY(!QFile::exists(logDir() + "/pomotray-quiet-trace.log"));
}

void LoggingTests::testTraceWrites()
{
    pomotray::logging::initLogging(QStringLiteral("pomotray-test"), true);
    const QString tracePath = logDir() + "/pomotray-test-trace.log";

    PLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testTraceWrites"),
               QStringLiteral("test_trace"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               nlohmann::json::object());

    const nlohmann::json parsed = lastLine(tracePath);
    QVERIFY(parsed.is_object());
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("DEBUG"));
    QCOMPARE(QString::fromStdString(lastLine(logDir() + "/pomotray-test.log").value("what", "")),
             QStringLiteral("test_trace"));
}

void LoggingTests::testCallScopeNests()
{
    using pomotray::logging::CallScope;
    using pomotray::logging::currentCallContext;

    QVERIFY(currentCallContext().correlationId.isEmpty());
    {
        CallScope outer(pomotray::logging::CallContext{QString(), QStringLiteral("outer"), QStringLiteral("c-1")});
        {
            CallScope inner(pomotray::logging::localCallContext(QStringLiteral("inner")));
            QCOMPARE(currentCallContext().member, QStringLiteral("inner"));
            QVERIFY(!currentCallContext().correlationId.isEmpty());
            QVERIFY(currentCallContext().correlationId != QStringLiteral("c-1"));
        }
        QCOMPARE(currentCallContext().member, QStringLiteral("outer"));
        QCOMPARE(currentCallContext().correlationId, QStringLiteral("c-1"));
    }
    QVERIFY(currentCallContext().member.isEmpty());
}

void LoggingTests::testBusCallerBecomesWho()
{
    pomotray::logging::initLogging(QStringLiteral("pomotray-bus"), false);

    const QDBusMessage message = QDBusMessage::createMethodCall(QStringLiteral(":1.42"),
                                                                QStringLiteral("/MenuBar"),
                                                                QStringLiteral("com.canonical.dbusmenu"),
                                                                QStringLiteral("Event"));
    const pomotray::logging::CallContext first = pomotray::callContextFor(message);
    const pomotray::logging::CallContext second = pomotray::callContextFor(message);
    QCOMPARE(first.caller, QStringLiteral(":1.42"));
    QCOMPARE(first.member, QStringLiteral("com.canonical.dbusmenu.Event"));
    QVERIFY(first.correlationId.startsWith(QStringLiteral(":1.42#")));
    QVERIFY(first.correlationId != second.correlationId);

    {
        pomotray::logging::CallScope scope(first);
        PLOG_INFO(QStringLiteral("Test"),
                  QStringLiteral("testBusCallerBecomesWho"),
                  QStringLiteral("bus_event"),
                  QStringLiteral("unit_test"),
                  QStringLiteral("macro"),
                  nlohmann::json::object());
    }

    const nlohmann::json parsed = lastLine(logDir() + "/pomotray-bus.log");
    QVERIFY(parsed.is_object());
    QCOMPARE(QString::fromStdString(parsed.value("who", "")), QStringLiteral(":1.42"));
    QCOMPARE(QString::fromStdString(parsed.value("call", "")),
             QStringLiteral("com.canonical.dbusmenu.Event"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), first.correlationId);
}

void LoggingTests::testSlotCalledInProcessGetsLocalContext()
{
    InProcessContext context;
    const pomotray::logging::CallContext local =
        pomotray::callContextFor(context, QStringLiteral("GetLayout"));
    QVERIFY(local.caller.isEmpty());
    QCOMPARE(local.member, QStringLiteral("GetLayout"));
    QVERIFY(!local.correlationId.isEmpty());
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"

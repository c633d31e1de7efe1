#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>
#include <utility>

namespace pomotray::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// Where lines go. Resolved by initLogging(), or lazily on first use.
struct LogSink {
    QString processName;
    QString mainPath;
    QString tracePath;
    bool traceEnabled = false;
};

std::mutex g_logMutex;
LogSink g_sink;
bool g_sinkReady = false;

thread_local CallContext t_callContext;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/pomotray/logs");
    }
    return home + QStringLiteral("/.local/share/pomotray/logs");
}

LogSink makeSink(QString processName, bool traceEnabled)
{
    if (processName.isEmpty() && QCoreApplication::instance()) {
        processName = QCoreApplication::applicationName();
    }
    if (processName.isEmpty()) {
        processName = QStringLiteral("pomotray");
    }

    const QString dir = logsDirPath();
    LogSink sink;
    sink.mainPath = dir + QDir::separator() + processName + QStringLiteral(".log");
    sink.tracePath = dir + QDir::separator() + processName + QStringLiteral("-trace.log");
    sink.processName = std::move(processName);
    sink.traceEnabled = traceEnabled;
    return sink;
}

// Caller holds g_logMutex.
const LogSink &sink()
{
    if (!g_sinkReady) {
        g_sink = makeSink(QString(), false);
        g_sinkReady = true;
    }
    return g_sink;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void appendLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString localWho()
{
    return QStringLiteral("pid:%1,uid:%2")
        .arg(static_cast<qint64>(getpid()))
        .arg(static_cast<int>(getuid()));
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sink = makeSink(processName, traceEnabled);
    g_sinkReady = true;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return sink().traceEnabled;
}

CallContext currentCallContext()
{
    return t_callContext;
}

CallScope::CallScope(CallContext context)
    : m_prev(std::exchange(t_callContext, std::move(context)))
{
}

CallScope::~CallScope()
{
    t_callContext = std::move(m_prev);
}

CallContext localCallContext(const QString &member)
{
    return CallContext{QString(), member, QUuid::createUuid().toString(QUuid::WithoutBraces)};
}

nlohmann::json toJson(const QStringList &values)
{
    nlohmann::json array = nlohmann::json::array();
    for (const QString &value : values) {
        array.push_back(value.toStdString());
    }
    return array;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const nlohmann::json &context)
{
    const CallContext &call = t_callContext;

    std::lock_guard<std::mutex> lock(g_logMutex);
    const LogSink &out = sink();
    if (level == LogLevel::Debug && !out.traceEnabled) {
        return;
    }

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", out.processName.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", (call.caller.isEmpty() ? localWho() : call.caller).toStdString()},
        {"corr", call.correlationId.toStdString()},
        {"context", context}
    };
    if (!call.member.isEmpty()) {
        payload["call"] = call.member.toStdString();
    }

    const QByteArray line = QByteArray::fromStdString(payload.dump());
    appendLine(out.mainPath, line);
    if (out.traceEnabled) {
        appendLine(out.tracePath, line);
    }
}

} // namespace pomotray::logging

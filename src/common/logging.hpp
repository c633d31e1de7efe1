#pragma once

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

namespace pomotray::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

/**
 * CallContext identifies the request a thread is currently serving.
 *
 * caller is the unique bus name of the remote peer and member the bus method
 * it invoked, or the host handler for work the process started itself. With
 * no caller, log lines carry the local process identity as "who".
 */
struct CallContext {
    QString caller;
    QString member;
    QString correlationId;
};

CallContext currentCallContext();

// Installs a CallContext for the current thread until destroyed.
class CallScope {
public:
    explicit CallScope(CallContext context);
    ~CallScope();

    CallScope(const CallScope &) = delete;
    CallScope &operator=(const CallScope &) = delete;

private:
    CallContext m_prev;
};

// A context for work not triggered by a bus peer, with a fresh correlation id.
CallContext localCallContext(const QString &member);

// Structured log event. who, corr and call come from currentCallContext().
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const nlohmann::json &context = nlohmann::json::object());

nlohmann::json toJson(const QStringList &values);

} // namespace pomotray::logging

#define PLOG_DEBUG(component, where, what, why, how, ctxJson) \
    ::pomotray::logging::logEvent(::pomotray::logging::LogLevel::Debug, \
                                  (component), (where), (what), (why), (how), (ctxJson))

#define PLOG_INFO(component, where, what, why, how, ctxJson) \
    ::pomotray::logging::logEvent(::pomotray::logging::LogLevel::Info, \
                                  (component), (where), (what), (why), (how), (ctxJson))

#define PLOG_WARN(component, where, what, why, how, ctxJson) \
    ::pomotray::logging::logEvent(::pomotray::logging::LogLevel::Warn, \
                                  (component), (where), (what), (why), (how), (ctxJson))

#define PLOG_ERROR(component, where, what, why, how, ctxJson) \
    ::pomotray::logging::logEvent(::pomotray::logging::LogLevel::Error, \
                                  (component), (where), (what), (why), (how), (ctxJson))

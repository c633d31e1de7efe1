#include "dbus/bus_call_context.hpp"

#include <atomic>

namespace pomotray {

namespace {

std::atomic<quint64> g_incomingCalls{0};

} // namespace

logging::CallContext callContextFor(const QDBusMessage &message)
{
    const quint64 sequence = ++g_incomingCalls;
    const QString sender = message.service().isEmpty()
        ? QStringLiteral("peer")
        : message.service();

    logging::CallContext context;
    context.caller = sender;
    context.member = message.interface().isEmpty()
        ? message.member()
        : message.interface() + QLatin1Char('.') + message.member();
    context.correlationId = QStringLiteral("%1#%2").arg(sender).arg(sequence);
    return context;
}

logging::CallContext callContextFor(const QDBusContext &context, const QString &member)
{
    if (!context.calledFromDBus()) {
        return logging::localCallContext(member);
    }
    return callContextFor(context.message());
}

} // namespace pomotray

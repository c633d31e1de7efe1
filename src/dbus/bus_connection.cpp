#include "dbus/bus_connection.hpp"

#include <utility>

#include <QDBusError>
#include <QDBusMessage>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace pomotray {

namespace {

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

SessionBusConnection::SessionBusConnection(QDBusConnection connection)
    : m_connection(std::move(connection))
{
}

SessionBusConnection::~SessionBusConnection()
{
    for (const QString &path : m_objectPaths) {
        m_connection.unregisterObject(path);
    }
    for (const QString &service : m_services) {
        m_connection.unregisterService(service);
    }
}

bool SessionBusConnection::isConnected() const
{
    return m_connection.isConnected();
}

bool SessionBusConnection::registerService(const QString &serviceName, QString *error)
{
    if (!m_connection.isConnected()) {
        setError(error, QStringLiteral("not connected to the session bus: %1")
                            .arg(m_connection.lastError().message()));
        return false;
    }

    if (!m_connection.registerService(serviceName)) {
        setError(error, m_connection.lastError().message());
        return false;
    }

    m_services << serviceName;
    return true;
}

void SessionBusConnection::unregisterService(const QString &serviceName)
{
    if (m_services.removeAll(serviceName) > 0) {
        m_connection.unregisterService(serviceName);
    }
}

bool SessionBusConnection::registerObject(const QString &path, QObject *object, QString *error)
{
    if (!m_connection.registerObject(path, object, QDBusConnection::ExportScriptableContents)) {
        setError(error, QStringLiteral("failed to register object at %1: %2")
                            .arg(path, m_connection.lastError().message()));
        return false;
    }

    m_objectPaths << path;
    return true;
}

bool SessionBusConnection::registerVirtualObject(const QString &path,
                                                 QDBusVirtualObject *object,
                                                 QString *error)
{
    if (!m_connection.registerVirtualObject(path, object, QDBusConnection::SingleNode)) {
        setError(error, QStringLiteral("failed to register virtual object at %1: %2")
                            .arg(path, m_connection.lastError().message()));
        return false;
    }

    m_objectPaths << path;
    return true;
}

void SessionBusConnection::unregisterObject(const QString &path)
{
    if (m_objectPaths.removeAll(path) > 0) {
        m_connection.unregisterObject(path);
    }
}

bool SessionBusConnection::callMethod(const QString &service,
                                      const QString &path,
                                      const QString &interface,
                                      const QString &method,
                                      const QVariantList &arguments,
                                      QString *error)
{
    QDBusMessage message = QDBusMessage::createMethodCall(service, path, interface, method);
    message.setArguments(arguments);

    const QDBusMessage reply = m_connection.call(message);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        setError(error, QStringLiteral("%1: %2").arg(reply.errorName(), reply.errorMessage()));
        return false;
    }
    return true;
}

void SessionBusConnection::broadcastSignal(const QString &path,
                                           const QString &interface,
                                           const QString &name,
                                           const QVariantList &arguments)
{
    QDBusMessage message = QDBusMessage::createSignal(path, interface, name);
    message.setArguments(arguments);

    if (!m_connection.send(message)) {
        PLOG_WARN(QStringLiteral("SessionBusConnection"),
                  QStringLiteral("broadcastSignal"),
                  QStringLiteral("signal_send_failed"),
                  QStringLiteral("bus_error"),
                  QStringLiteral("qdbus_send"),
                  (nlohmann::json{{"path", path.toStdString()},
                                  {"interface", interface.toStdString()},
                                  {"signal", name.toStdString()}}));
    }
}

} // namespace pomotray

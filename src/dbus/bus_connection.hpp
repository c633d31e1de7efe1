#pragma once

#include <QDBusConnection>
#include <QDBusVirtualObject>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantList>

namespace pomotray {

/**
 * BusConnection is every outbound interaction the tray services have with the
 * message bus: claiming a name, exporting objects, the watcher call and
 * broadcasting signals that are not declared on the exported objects.
 */
class BusConnection
{
public:
    virtual ~BusConnection() = default;

    virtual bool registerService(const QString &serviceName, QString *error) = 0;
    virtual void unregisterService(const QString &serviceName) = 0;
    // Exports the object's scriptable slots, signals and properties at path.
    virtual bool registerObject(const QString &path, QObject *object, QString *error) = 0;
    // Hands every message addressed to path, Properties and Introspectable
    // included, to object.
    virtual bool registerVirtualObject(const QString &path, QDBusVirtualObject *object, QString *error) = 0;
    virtual void unregisterObject(const QString &path) = 0;
    // Blocking method call. Returns false with error filled on an error reply.
    virtual bool callMethod(const QString &service,
                            const QString &path,
                            const QString &interface,
                            const QString &method,
                            const QVariantList &arguments,
                            QString *error) = 0;
    virtual void broadcastSignal(const QString &path,
                                 const QString &interface,
                                 const QString &name,
                                 const QVariantList &arguments) = 0;
};

class SessionBusConnection : public BusConnection
{
public:
    explicit SessionBusConnection(QDBusConnection connection = QDBusConnection::sessionBus());
    ~SessionBusConnection() override;

    bool isConnected() const;

    bool registerService(const QString &serviceName, QString *error) override;
    void unregisterService(const QString &serviceName) override;
    bool registerObject(const QString &path, QObject *object, QString *error) override;
    bool registerVirtualObject(const QString &path, QDBusVirtualObject *object, QString *error) override;
    void unregisterObject(const QString &path) override;
    bool callMethod(const QString &service,
                    const QString &path,
                    const QString &interface,
                    const QString &method,
                    const QVariantList &arguments,
                    QString *error) override;
    void broadcastSignal(const QString &path,
                         const QString &interface,
                         const QString &name,
                         const QVariantList &arguments) override;

private:
    QDBusConnection m_connection;
    QStringList m_services;
    QStringList m_objectPaths;
};

} // namespace pomotray

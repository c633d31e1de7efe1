#pragma once

#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QDBusVirtualObject>
#include <QString>
#include <QVariant>
#include <QVariantMap>

#include "common/config.hpp"
#include "common/models.hpp"
#include "dbus/bus_connection.hpp"
#include "dbus/dbus_types.hpp"

namespace pomotray {

/**
 * StatusNotifierItem exports ItemState as org.kde.StatusNotifierItem.
 *
 * Construction claims a per-process bus name, exports the object and
 * registers that name with the StatusNotifierWatcher. Any of these failing
 * throws std::runtime_error after releasing whatever was already claimed.
 *
 * The object is registered as a virtual object: every incoming message,
 * org.freedesktop.DBus.Properties included, goes through dispatch(), so a
 * remote Get/GetAll reads the same snapshot as getProperty()/getAllProperties().
 * Changes are announced with PropertiesChanged plus NewStatus/NewIcon, and
 * only when a value changed.
 */
class StatusNotifierItem : public QDBusVirtualObject
{
    Q_OBJECT
public:
    StatusNotifierItem(BusConnection &bus, const TrayConfig &config, QObject *parent = nullptr);
    ~StatusNotifierItem() override;

    // Bus name handed to the watcher, "org.kde.StatusNotifierItem-<pid>-<n>".
    QString serviceName() const;
    const ItemState &state() const;

    void changeStatus(ItemStatus newStatus);
    void changeIcon(const QString &newIconName);

    // Invalid QVariant / empty map for unknown interfaces and properties.
    QVariant getProperty(const QString &interfaceName, const QString &propertyName) const;
    QVariantMap getAllProperties(const QString &interfaceName) const;

    // Builds the reply for one method call addressed to the item object.
    QDBusMessage dispatch(const QDBusMessage &message);

    QString introspect(const QString &path) const override;
    bool handleMessage(const QDBusMessage &message, const QDBusConnection &connection) override;

    QString category() const;
    QString id() const;
    QString title() const;
    QString status() const;
    int windowId() const;
    QString iconName() const;
    QString overlayIconName() const;
    QString attentionIconName() const;
    DBusImageList emptyPixmap() const;
    DBusToolTip toolTip() const;
    bool itemIsMenu() const;
    QDBusObjectPath menu() const;

public slots:
    void ContextMenu(int x, int y);
    void Activate(int x, int y);
    void SecondaryActivate(int x, int y);
    void Scroll(int delta, const QString &orientation);

signals:
    void NewIcon();
    void NewStatus(const QString &status);

    // In-process hooks for the interaction methods. Nothing is bound by default.
    void contextMenuRequested(int x, int y);
    void activateRequested(int x, int y);
    void secondaryActivateRequested(int x, int y);
    void scrollRequested(int delta, const QString &orientation);

private:
    QDBusMessage dispatchProperties(const QDBusMessage &message) const;
    QDBusMessage dispatchItemMethod(const QDBusMessage &message);
    void publishPropertyChange(const QString &name, const QVariant &value);

    BusConnection &m_bus;
    QString m_objectPath;
    QString m_serviceName;
    ItemState m_state;
};

} // namespace pomotray

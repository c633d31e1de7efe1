#pragma once

#include <QDBusContext>
#include <QDBusVariant>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/enums.hpp"
#include "dbus/bus_connection.hpp"
#include "dbus/dbus_types.hpp"
#include "menu/menu_model.hpp"

namespace pomotray {

struct MenuLayout {
    quint32 revision = 0;
    DBusMenuLayoutItem root;
};

/**
 * DBusMenu exports MenuModel as com.canonical.dbusmenu.
 *
 * The capitalised slots are the bus surface; they translate C++ exceptions
 * into D-Bus error replies. The lowerCamel methods are the in-process API and
 * report lookup failures by throwing.
 *
 * Clicks are not executed here: a "clicked" event on an entry with an action
 * tag emits actionRequested() and the owner decides what to do with it.
 */
class DBusMenu : public QObject, protected QDBusContext
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "com.canonical.dbusmenu")
    Q_PROPERTY(uint Version READ version)
    Q_PROPERTY(QString TextDirection READ textDirection)
    Q_PROPERTY(QString Status READ status)
public:
    // Registers the object on bus. Throws std::runtime_error on failure.
    DBusMenu(BusConnection &bus, const TrayConfig &config, QObject *parent = nullptr);
    ~DBusMenu() override;

    const MenuModel &model() const;

    uint version() const;
    QString textDirection() const;
    QString status() const;

    // Show is offered while the target is hidden and Hide while it is shown.
    // Always emits ItemsPropertiesUpdated, even when nothing changed.
    void updateMenuVisibility(bool isTargetVisible);

    // Throws std::invalid_argument for an unknown parent.
    MenuLayout getLayout(int parentId, int recursionDepth, const QStringList &propertyNames) const;
    DBusMenuItemList getGroupProperties(const QList<int> &ids, const QStringList &propertyNames) const;
    // Throws std::out_of_range for an unknown id or property.
    QVariant getProperty(int id, const QString &name) const;
    // Returns false when id is not in the menu.
    bool dispatchEvent(int id, const QString &eventId, const QVariant &data, uint timestamp);
    // Returns the ids that are not in the menu, in batch order.
    QList<int> dispatchEventGroup(const DBusMenuEventList &events);
    bool aboutToShow(int id) const;

public slots:
    Q_SCRIPTABLE uint GetLayout(int parentId,
                                int recursionDepth,
                                const QStringList &propertyNames,
                                pomotray::DBusMenuLayoutItem &layout);
    Q_SCRIPTABLE pomotray::DBusMenuItemList GetGroupProperties(const QList<int> &ids,
                                                               const QStringList &propertyNames);
    Q_SCRIPTABLE QDBusVariant GetProperty(int id, const QString &name);
    Q_SCRIPTABLE void Event(int id, const QString &eventId, const QDBusVariant &data, uint timestamp);
    Q_SCRIPTABLE QList<int> EventGroup(const pomotray::DBusMenuEventList &events);
    Q_SCRIPTABLE bool AboutToShow(int id);
    Q_SCRIPTABLE QList<int> AboutToShowGroup(const QList<int> &ids, QList<int> &idErrors);
    Q_SCRIPTABLE QList<int> AboutToShowGroup(const QList<int> &ids,
                                             const QList<int> &updatesNeeded,
                                             QList<int> &idErrors);

signals:
    Q_SCRIPTABLE void LayoutUpdated(uint revision, int parent);
    Q_SCRIPTABLE void ItemsPropertiesUpdated(const pomotray::DBusMenuItemList &updatedProps,
                                             const pomotray::DBusMenuItemKeysList &removedProps);
    Q_SCRIPTABLE void ItemActivationRequested(int id, uint timestamp);

    void actionRequested(pomotray::MenuAction action);

private:
    QList<int> unknownIds(const QList<int> &ids) const;

    MenuModel m_model;
    QString m_objectPath;
};

} // namespace pomotray

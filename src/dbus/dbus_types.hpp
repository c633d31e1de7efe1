#pragma once

#include <QByteArray>
#include <QDBusArgument>
#include <QDBusVariant>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace pomotray {

// (ia{sv}): one menu entry with its rendered properties.
struct DBusMenuItem {
    int id = 0;
    QVariantMap properties;
};
using DBusMenuItemList = QList<DBusMenuItem>;

// (ias): property names removed from an entry.
struct DBusMenuItemKeys {
    int id = 0;
    QStringList properties;
};
using DBusMenuItemKeysList = QList<DBusMenuItemKeys>;

// (ia{sv}av): recursive layout node. Children travel as variants on the wire.
struct DBusMenuLayoutItem {
    int id = 0;
    QVariantMap properties;
    QList<DBusMenuLayoutItem> children;
};

// (isvu): one entry of an EventGroup batch.
struct DBusMenuEvent {
    int id = 0;
    QString eventId;
    QDBusVariant data;
    uint timestamp = 0;
};
using DBusMenuEventList = QList<DBusMenuEvent>;

// (iiay): ARGB32 pixmap. Only ever published empty.
struct DBusImage {
    int width = 0;
    int height = 0;
    QByteArray data;
};
using DBusImageList = QList<DBusImage>;

// (sa(iiay)ss)
struct DBusToolTip {
    QString iconName;
    DBusImageList iconPixmap;
    QString title;
    QString description;
};

QDBusArgument &operator<<(QDBusArgument &argument, const DBusMenuItem &item);
const QDBusArgument &operator>>(const QDBusArgument &argument, DBusMenuItem &item);

QDBusArgument &operator<<(QDBusArgument &argument, const DBusMenuItemKeys &keys);
const QDBusArgument &operator>>(const QDBusArgument &argument, DBusMenuItemKeys &keys);

QDBusArgument &operator<<(QDBusArgument &argument, const DBusMenuLayoutItem &layout);
const QDBusArgument &operator>>(const QDBusArgument &argument, DBusMenuLayoutItem &layout);

QDBusArgument &operator<<(QDBusArgument &argument, const DBusMenuEvent &event);
const QDBusArgument &operator>>(const QDBusArgument &argument, DBusMenuEvent &event);

QDBusArgument &operator<<(QDBusArgument &argument, const DBusImage &image);
const QDBusArgument &operator>>(const QDBusArgument &argument, DBusImage &image);

QDBusArgument &operator<<(QDBusArgument &argument, const DBusToolTip &toolTip);
const QDBusArgument &operator>>(const QDBusArgument &argument, DBusToolTip &toolTip);

// Registers every type above with QtDBus. Safe to call more than once.
void registerDBusTypes();

} // namespace pomotray

Q_DECLARE_METATYPE(pomotray::DBusMenuItem)
Q_DECLARE_METATYPE(pomotray::DBusMenuItemList)
Q_DECLARE_METATYPE(pomotray::DBusMenuItemKeys)
Q_DECLARE_METATYPE(pomotray::DBusMenuItemKeysList)
Q_DECLARE_METATYPE(pomotray::DBusMenuLayoutItem)
Q_DECLARE_METATYPE(pomotray::DBusMenuEvent)
Q_DECLARE_METATYPE(pomotray::DBusMenuEventList)
Q_DECLARE_METATYPE(pomotray::DBusImage)
Q_DECLARE_METATYPE(pomotray::DBusImageList)
Q_DECLARE_METATYPE(pomotray::DBusToolTip)

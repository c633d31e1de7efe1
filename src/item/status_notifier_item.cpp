#include "item/status_notifier_item.hpp"

#include <initializer_list>
#include <stdexcept>

#include <QCoreApplication>
#include <QDBusError>
#include <QDBusVariant>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/enum_strings.hpp"
#include "common/logging.hpp"
#include "dbus/bus_call_context.hpp"

namespace pomotray {

namespace {

int g_itemInstances = 0;

const QString kIntrospectableInterface = QStringLiteral("org.freedesktop.DBus.Introspectable");

const char kIntrospectDoctype[] =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    " \"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n";

const char kItemIntrospection[] = R"xml(  <interface name="org.kde.StatusNotifierItem">
    <property name="Category" type="s" access="read"/>
    <property name="Id" type="s" access="read"/>
    <property name="Title" type="s" access="read"/>
    <property name="Status" type="s" access="read"/>
    <property name="WindowId" type="i" access="read"/>
    <property name="IconName" type="s" access="read"/>
    <property name="IconPixmap" type="a(iiay)" access="read"/>
    <property name="OverlayIconName" type="s" access="read"/>
    <property name="OverlayIconPixmap" type="a(iiay)" access="read"/>
    <property name="AttentionIconName" type="s" access="read"/>
    <property name="AttentionIconPixmap" type="a(iiay)" access="read"/>
    <property name="ToolTip" type="(sa(iiay)ss)" access="read"/>
    <property name="ItemIsMenu" type="b" access="read"/>
    <property name="Menu" type="o" access="read"/>
    <method name="ContextMenu">
      <arg name="x" type="i" direction="in"/>
      <arg name="y" type="i" direction="in"/>
    </method>
    <method name="Activate">
      <arg name="x" type="i" direction="in"/>
      <arg name="y" type="i" direction="in"/>
    </method>
    <method name="SecondaryActivate">
      <arg name="x" type="i" direction="in"/>
      <arg name="y" type="i" direction="in"/>
    </method>
    <method name="Scroll">
      <arg name="delta" type="i" direction="in"/>
      <arg name="orientation" type="s" direction="in"/>
    </method>
    <signal name="NewTitle"/>
    <signal name="NewIcon"/>
    <signal name="NewAttentionIcon"/>
    <signal name="NewOverlayIcon"/>
    <signal name="NewToolTip"/>
    <signal name="NewStatus">
      <arg name="status" type="s"/>
    </signal>
  </interface>
  <interface name="org.freedesktop.DBus.Properties">
    <method name="Get">
      <arg name="interface_name" type="s" direction="in"/>
      <arg name="property_name" type="s" direction="in"/>
      <arg name="value" type="v" direction="out"/>
    </method>
    <method name="GetAll">
      <arg name="interface_name" type="s" direction="in"/>
      <arg name="properties" type="a{sv}" direction="out"/>
    </method>
    <method name="Set">
      <arg name="interface_name" type="s" direction="in"/>
      <arg name="property_name" type="s" direction="in"/>
      <arg name="value" type="v" direction="in"/>
    </method>
    <signal name="PropertiesChanged">
      <arg name="interface_name" type="s"/>
      <arg name="changed_properties" type="a{sv}"/>
      <arg name="invalidated_properties" type="as"/>
    </signal>
  </interface>
)xml";

const char kIntrospectableIntrospection[] = R"xml(  <interface name="org.freedesktop.DBus.Introspectable">
    <method name="Introspect">
      <arg name="xml_data" type="s" direction="out"/>
    </method>
  </interface>
)xml";

bool hasArgumentTypes(const QVariantList &arguments, std::initializer_list<int> typeIds)
{
    if (arguments.size() != static_cast<qsizetype>(typeIds.size())) {
        return false;
    }
    int index = 0;
    for (int typeId : typeIds) {
        if (arguments.at(index++).metaType().id() != typeId) {
            return false;
        }
    }
    return true;
}

QDBusMessage invalidArguments(const QDBusMessage &message)
{
    return message.createErrorReply(QDBusError::InvalidArgs,
                                    QStringLiteral("Invalid arguments for %1.%2")
                                        .arg(message.interface(), message.member()));
}

[[noreturn]] void failRegistration(const QString &step, const QString &error)
{
    PLOG_ERROR(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("StatusNotifierItem"),
               QStringLiteral("item_register_failed"),
               QStringLiteral("bus_error"),
               step,
               (nlohmann::json{{"error", error.toStdString()}}));
    throw std::runtime_error(step.toStdString() + " failed: " + error.toStdString());
}

} // namespace

StatusNotifierItem::StatusNotifierItem(BusConnection &bus, const TrayConfig &config, QObject *parent)
    : QDBusVirtualObject(parent)
    , m_bus(bus)
    , m_objectPath(config.itemObjectPath)
{
    registerDBusTypes();

    m_state.status = ItemStatus::Passive;
    m_state.iconName = config.idleIconName();
    m_state.id = config.itemId;
    m_state.title = config.title;
    m_state.category = config.category;
    m_state.attentionIconName = config.attentionIconName();
    m_state.menuPath = config.menuObjectPath;

    m_serviceName = QStringLiteral("%1-%2-%3")
        .arg(QLatin1String(kItemInterface))
        .arg(QCoreApplication::applicationPid())
        .arg(++g_itemInstances);

    QString error;
    if (!m_bus.registerService(m_serviceName, &error)) {
        failRegistration(QStringLiteral("register_service"), error);
    }
    if (!m_bus.registerVirtualObject(m_objectPath, this, &error)) {
        m_bus.unregisterService(m_serviceName);
        failRegistration(QStringLiteral("register_object"), error);
    }
    if (!m_bus.callMethod(config.watcherService,
                          config.watcherPath,
                          config.watcherInterface,
                          QStringLiteral("RegisterStatusNotifierItem"),
                          {m_serviceName},
                          &error)) {
        m_bus.unregisterObject(m_objectPath);
        m_bus.unregisterService(m_serviceName);
        failRegistration(QStringLiteral("register_with_watcher"), error);
    }

    PLOG_INFO(QStringLiteral("StatusNotifierItem"),
              QStringLiteral("StatusNotifierItem"),
              QStringLiteral("item_registered"),
              QStringLiteral("service_start"),
              QStringLiteral("status_notifier_watcher"),
              (nlohmann::json{{"service", m_serviceName.toStdString()},
                              {"path", m_objectPath.toStdString()}}));
}

StatusNotifierItem::~StatusNotifierItem() = default;

QString StatusNotifierItem::serviceName() const
{
    return m_serviceName;
}

const ItemState &StatusNotifierItem::state() const
{
    return m_state;
}

void StatusNotifierItem::changeStatus(ItemStatus newStatus)
{
    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("changeStatus"),
               QStringLiteral("change_status"),
               QStringLiteral("controller_request"),
               QStringLiteral("properties_changed"),
               (nlohmann::json{{"current", m_state.status}, {"new", newStatus}}));

    if (m_state.status == newStatus) {
        return;
    }

    m_state.status = newStatus;
    const QString value = toStatusString(newStatus);
    publishPropertyChange(QStringLiteral("Status"), value);
    m_bus.broadcastSignal(m_objectPath, QLatin1String(kItemInterface),
                          QStringLiteral("NewStatus"), {value});
    emit NewStatus(value);
}

void StatusNotifierItem::changeIcon(const QString &newIconName)
{
    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("changeIcon"),
               QStringLiteral("change_icon"),
               QStringLiteral("controller_request"),
               QStringLiteral("properties_changed"),
               (nlohmann::json{{"current", m_state.iconName.toStdString()},
                               {"new", newIconName.toStdString()}}));

    if (m_state.iconName == newIconName) {
        return;
    }

    m_state.iconName = newIconName;
    publishPropertyChange(QStringLiteral("IconName"), newIconName);
    m_bus.broadcastSignal(m_objectPath, QLatin1String(kItemInterface),
                          QStringLiteral("NewIcon"), {});
    emit NewIcon();
}

void StatusNotifierItem::publishPropertyChange(const QString &name, const QVariant &value)
{
    QVariantMap changed;
    changed.insert(name, value);
    m_bus.broadcastSignal(m_objectPath,
                          QLatin1String(kPropertiesInterface),
                          QStringLiteral("PropertiesChanged"),
                          {QLatin1String(kItemInterface), changed, QStringList()});
}

QVariant StatusNotifierItem::getProperty(const QString &interfaceName, const QString &propertyName) const
{
    return getAllProperties(interfaceName).value(propertyName);
}

QVariantMap StatusNotifierItem::getAllProperties(const QString &interfaceName) const
{
    if (interfaceName != QLatin1String(kItemInterface)) {
        return QVariantMap();
    }

    return {
        {QStringLiteral("AttentionIconName"), attentionIconName()},
        {QStringLiteral("AttentionIconPixmap"), QVariant::fromValue(emptyPixmap())},
        {QStringLiteral("Category"), category()},
        {QStringLiteral("IconName"), iconName()},
        {QStringLiteral("IconPixmap"), QVariant::fromValue(emptyPixmap())},
        {QStringLiteral("Id"), id()},
        {QStringLiteral("ItemIsMenu"), itemIsMenu()},
        {QStringLiteral("Menu"), QVariant::fromValue(menu())},
        {QStringLiteral("OverlayIconName"), overlayIconName()},
        {QStringLiteral("OverlayIconPixmap"), QVariant::fromValue(emptyPixmap())},
        {QStringLiteral("Status"), status()},
        {QStringLiteral("Title"), title()},
        {QStringLiteral("ToolTip"), QVariant::fromValue(toolTip())},
        {QStringLiteral("WindowId"), windowId()},
    };
}

QDBusMessage StatusNotifierItem::dispatch(const QDBusMessage &message)
{
    logging::CallScope callScope(callContextFor(message));

    const QString interface = message.interface();
    if (interface == QLatin1String(kPropertiesInterface)) {
        return dispatchProperties(message);
    }
    if (interface == kIntrospectableInterface && message.member() == QLatin1String("Introspect")) {
        return message.createReply(QStringLiteral("%1<node>\n%2%3</node>\n")
                                       .arg(QLatin1String(kIntrospectDoctype),
                                            introspect(message.path()),
                                            QLatin1String(kIntrospectableIntrospection)));
    }
    // Callers may leave the interface out.
    if (interface.isEmpty() || interface == QLatin1String(kItemInterface)) {
        return dispatchItemMethod(message);
    }

    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("dispatch"),
               QStringLiteral("unknown_interface"),
               QStringLiteral("remote_call"),
               QStringLiteral("dbus_error_reply"),
               (nlohmann::json{{"interface", interface.toStdString()}}));
    return message.createErrorReply(QDBusError::UnknownInterface,
                                    QStringLiteral("No such interface %1").arg(interface));
}

QDBusMessage StatusNotifierItem::dispatchProperties(const QDBusMessage &message) const
{
    const QVariantList arguments = message.arguments();
    const QString member = message.member();

    if (member == QLatin1String("Get")) {
        if (!hasArgumentTypes(arguments, {QMetaType::QString, QMetaType::QString})) {
            return invalidArguments(message);
        }
        const QVariant value = getProperty(arguments.at(0).toString(), arguments.at(1).toString());
        // Unknown names answer with an empty string; a reply must carry a value.
        return message.createReply(
            QVariant::fromValue(QDBusVariant(value.isValid() ? value : QVariant(QString()))));
    }
    if (member == QLatin1String("GetAll")) {
        if (!hasArgumentTypes(arguments, {QMetaType::QString})) {
            return invalidArguments(message);
        }
        return message.createReply(QVariant(getAllProperties(arguments.at(0).toString())));
    }
    if (member == QLatin1String("Set")) {
        return message.createErrorReply(QDBusError::PropertyReadOnly,
                                        QStringLiteral("StatusNotifierItem properties are read-only"));
    }
    return message.createErrorReply(QDBusError::UnknownMethod,
                                    QStringLiteral("No such method %1.%2")
                                        .arg(message.interface(), member));
}

QDBusMessage StatusNotifierItem::dispatchItemMethod(const QDBusMessage &message)
{
    const QVariantList arguments = message.arguments();
    const QString member = message.member();

    if (member == QLatin1String("Scroll")) {
        if (!hasArgumentTypes(arguments, {QMetaType::Int, QMetaType::QString})) {
            return invalidArguments(message);
        }
        Scroll(arguments.at(0).toInt(), arguments.at(1).toString());
        return message.createReply();
    }

    void (StatusNotifierItem::*pointMethod)(int, int) = nullptr;
    if (member == QLatin1String("Activate")) {
        pointMethod = &StatusNotifierItem::Activate;
    } else if (member == QLatin1String("SecondaryActivate")) {
        pointMethod = &StatusNotifierItem::SecondaryActivate;
    } else if (member == QLatin1String("ContextMenu")) {
        pointMethod = &StatusNotifierItem::ContextMenu;
    } else {
        return message.createErrorReply(QDBusError::UnknownMethod,
                                        QStringLiteral("No such method %1").arg(member));
    }

    if (!hasArgumentTypes(arguments, {QMetaType::Int, QMetaType::Int})) {
        return invalidArguments(message);
    }
    (this->*pointMethod)(arguments.at(0).toInt(), arguments.at(1).toInt());
    return message.createReply();
}

QString StatusNotifierItem::introspect(const QString &path) const
{
    Q_UNUSED(path)
    return QLatin1String(kItemIntrospection);
}

bool StatusNotifierItem::handleMessage(const QDBusMessage &message, const QDBusConnection &connection)
{
    const QDBusMessage reply = dispatch(message);
    if (message.isReplyRequired()) {
        connection.send(reply);
    }
    return true;
}

QString StatusNotifierItem::category() const
{
    return toCategoryString(m_state.category);
}

QString StatusNotifierItem::id() const
{
    return m_state.id;
}

QString StatusNotifierItem::title() const
{
    return m_state.title;
}

QString StatusNotifierItem::status() const
{
    return toStatusString(m_state.status);
}

int StatusNotifierItem::windowId() const
{
    return m_state.windowId;
}

QString StatusNotifierItem::iconName() const
{
    return m_state.iconName;
}

QString StatusNotifierItem::overlayIconName() const
{
    return m_state.overlayIconName;
}

QString StatusNotifierItem::attentionIconName() const
{
    return m_state.attentionIconName;
}

DBusImageList StatusNotifierItem::emptyPixmap() const
{
    return DBusImageList();
}

DBusToolTip StatusNotifierItem::toolTip() const
{
    return DBusToolTip();
}

bool StatusNotifierItem::itemIsMenu() const
{
    return m_state.itemIsMenu;
}

QDBusObjectPath StatusNotifierItem::menu() const
{
    return QDBusObjectPath(m_state.menuPath);
}

void StatusNotifierItem::ContextMenu(int x, int y)
{
    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("ContextMenu"),
               QStringLiteral("context_menu"),
               QStringLiteral("remote_interaction"),
               QStringLiteral("qt_signal"),
               (nlohmann::json{{"x", x}, {"y", y}}));
    emit contextMenuRequested(x, y);
}

void StatusNotifierItem::Activate(int x, int y)
{
    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("Activate"),
               QStringLiteral("activate"),
               QStringLiteral("remote_interaction"),
               QStringLiteral("qt_signal"),
               (nlohmann::json{{"x", x}, {"y", y}}));
    emit activateRequested(x, y);
}

void StatusNotifierItem::SecondaryActivate(int x, int y)
{
    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("SecondaryActivate"),
               QStringLiteral("secondary_activate"),
               QStringLiteral("remote_interaction"),
               QStringLiteral("qt_signal"),
               (nlohmann::json{{"x", x}, {"y", y}}));
    emit secondaryActivateRequested(x, y);
}

void StatusNotifierItem::Scroll(int delta, const QString &orientation)
{
    PLOG_DEBUG(QStringLiteral("StatusNotifierItem"),
               QStringLiteral("Scroll"),
               QStringLiteral("scroll"),
               QStringLiteral("remote_interaction"),
               QStringLiteral("qt_signal"),
               (nlohmann::json{{"delta", delta}, {"orientation", orientation.toStdString()}}));
    emit scrollRequested(delta, orientation);
}

} // namespace pomotray

#include "menu/dbus_menu.hpp"

#include <stdexcept>

#include <QDBusError>

#include <nlohmann/json.hpp>

#include "common/enum_strings.hpp"
#include "common/logging.hpp"
#include "dbus/bus_call_context.hpp"

namespace pomotray {

namespace {

constexpr uint kProtocolVersion = 4;
const QString kClickedEvent = QStringLiteral("clicked");

} // namespace

DBusMenu::DBusMenu(BusConnection &bus, const TrayConfig &config, QObject *parent)
    : QObject(parent)
    , m_objectPath(config.menuObjectPath)
{
    registerDBusTypes();

    QString error;
    if (!bus.registerObject(m_objectPath, this, &error)) {
        PLOG_ERROR(QStringLiteral("DBusMenu"),
                   QStringLiteral("DBusMenu"),
                   QStringLiteral("menu_register_failed"),
                   QStringLiteral("bus_error"),
                   QStringLiteral("register_object"),
                   (nlohmann::json{{"path", m_objectPath.toStdString()},
                                   {"error", error.toStdString()}}));
        throw std::runtime_error("failed to register menu object: " + error.toStdString());
    }

    PLOG_INFO(QStringLiteral("DBusMenu"),
              QStringLiteral("DBusMenu"),
              QStringLiteral("menu_registered"),
              QStringLiteral("service_start"),
              QStringLiteral("register_object"),
              (nlohmann::json{{"path", m_objectPath.toStdString()},
                              {"revision", m_model.revision()}}));
}

DBusMenu::~DBusMenu() = default;

const MenuModel &DBusMenu::model() const
{
    return m_model;
}

uint DBusMenu::version() const
{
    return kProtocolVersion;
}

QString DBusMenu::textDirection() const
{
    return QStringLiteral("ltr");
}

QString DBusMenu::status() const
{
    return QStringLiteral("normal");
}

void DBusMenu::updateMenuVisibility(bool isTargetVisible)
{
    PLOG_DEBUG(QStringLiteral("DBusMenu"),
               QStringLiteral("updateMenuVisibility"),
               QStringLiteral("update_menu_visibility"),
               QStringLiteral("target_visibility_changed"),
               QStringLiteral("items_properties_updated"),
               (nlohmann::json{{"targetVisible", isTargetVisible}}));

    m_model.setVisible(MenuModel::kShowId, !isTargetVisible);
    m_model.setVisible(MenuModel::kHideId, isTargetVisible);

    DBusMenuItemList updated;
    for (int id : {MenuModel::kShowId, MenuModel::kHideId}) {
        updated.append(DBusMenuItem{id, m_model.renderProperties(id)});
    }
    emit ItemsPropertiesUpdated(updated, DBusMenuItemKeysList());
}

MenuLayout DBusMenu::getLayout(int parentId, int recursionDepth, const QStringList &propertyNames) const
{
    PLOG_DEBUG(QStringLiteral("DBusMenu"),
               QStringLiteral("getLayout"),
               QStringLiteral("get_layout"),
               QStringLiteral("remote_query"),
               QStringLiteral("render_layout"),
               (nlohmann::json{{"parentId", parentId},
                               {"recursionDepth", recursionDepth},
                               {"propertyNames", logging::toJson(propertyNames)}}));

    MenuLayout layout;
    layout.revision = m_model.revision();
    layout.root = m_model.layout(parentId, recursionDepth, propertyNames);
    return layout;
}

DBusMenuItemList DBusMenu::getGroupProperties(const QList<int> &ids,
                                              const QStringList &propertyNames) const
{
    // An empty id list asks for every entry.
    const QList<int> requested = ids.isEmpty() ? m_model.ids() : ids;

    DBusMenuItemList items;
    for (int id : requested) {
        if (!m_model.contains(id)) {
            continue;
        }
        items.append(DBusMenuItem{id, m_model.renderProperties(id, propertyNames)});
    }
    return items;
}

QVariant DBusMenu::getProperty(int id, const QString &name) const
{
    return m_model.property(id, name);
}

bool DBusMenu::dispatchEvent(int id, const QString &eventId, const QVariant &data, uint timestamp)
{
    Q_UNUSED(data)

    const MenuEntry *entry = m_model.entry(id);
    PLOG_DEBUG(QStringLiteral("DBusMenu"),
               QStringLiteral("dispatchEvent"),
               QStringLiteral("menu_event"),
               QStringLiteral("remote_event"),
               QStringLiteral("action_tag"),
               (nlohmann::json{{"id", id},
                               {"eventId", eventId.toStdString()},
                               {"timestamp", timestamp},
                               {"known", entry != nullptr}}));
    if (!entry) {
        return false;
    }

    // hovered, opened, closed and x-<vendor>-* events carry no behaviour.
    if (eventId == kClickedEvent && entry->action != MenuAction::None) {
        emit actionRequested(entry->action);
    }
    return true;
}

QList<int> DBusMenu::dispatchEventGroup(const DBusMenuEventList &events)
{
    QList<int> notFound;
    for (const DBusMenuEvent &event : events) {
        if (!dispatchEvent(event.id, event.eventId, event.data.variant(), event.timestamp)) {
            notFound.append(event.id);
        }
    }
    return notFound;
}

bool DBusMenu::aboutToShow(int id) const
{
    Q_UNUSED(id)
    // Visibility changes are pushed through ItemsPropertiesUpdated.
    return false;
}

QList<int> DBusMenu::unknownIds(const QList<int> &ids) const
{
    QList<int> unknown;
    for (int id : ids) {
        if (!m_model.contains(id)) {
            unknown.append(id);
        }
    }
    return unknown;
}

uint DBusMenu::GetLayout(int parentId,
                         int recursionDepth,
                         const QStringList &propertyNames,
                         DBusMenuLayoutItem &layout)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("GetLayout")));
    try {
        const MenuLayout result = getLayout(parentId, recursionDepth, propertyNames);
        layout = result.root;
        return result.revision;
    } catch (const std::invalid_argument &e) {
        PLOG_WARN(QStringLiteral("DBusMenu"),
                  QStringLiteral("GetLayout"),
                  QStringLiteral("get_layout_rejected"),
                  QStringLiteral("unknown_parent"),
                  QStringLiteral("dbus_error_reply"),
                  (nlohmann::json{{"parentId", parentId}}));
        sendErrorReply(QDBusError::InvalidArgs, QString::fromStdString(e.what()));
        return m_model.revision();
    }
}

DBusMenuItemList DBusMenu::GetGroupProperties(const QList<int> &ids, const QStringList &propertyNames)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("GetGroupProperties")));
    return getGroupProperties(ids, propertyNames);
}

QDBusVariant DBusMenu::GetProperty(int id, const QString &name)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("GetProperty")));
    try {
        return QDBusVariant(getProperty(id, name));
    } catch (const std::out_of_range &e) {
        PLOG_WARN(QStringLiteral("DBusMenu"),
                  QStringLiteral("GetProperty"),
                  QStringLiteral("get_property_rejected"),
                  QStringLiteral("unknown_id_or_property"),
                  QStringLiteral("dbus_error_reply"),
                  (nlohmann::json{{"id", id}, {"name", name.toStdString()}}));
        sendErrorReply(QDBusError::InvalidArgs, QString::fromStdString(e.what()));
        return QDBusVariant(QVariant(QString()));
    }
}

void DBusMenu::Event(int id, const QString &eventId, const QDBusVariant &data, uint timestamp)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("Event")));
    dispatchEvent(id, eventId, data.variant(), timestamp);
}

QList<int> DBusMenu::EventGroup(const DBusMenuEventList &events)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("EventGroup")));
    return dispatchEventGroup(events);
}

bool DBusMenu::AboutToShow(int id)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("AboutToShow")));
    return aboutToShow(id);
}

QList<int> DBusMenu::AboutToShowGroup(const QList<int> &ids, QList<int> &idErrors)
{
    logging::CallScope callScope(callContextFor(*this, QStringLiteral("AboutToShowGroup")));
    idErrors = unknownIds(ids);
    return QList<int>();
}

QList<int> DBusMenu::AboutToShowGroup(const QList<int> &ids,
                                      const QList<int> &updatesNeeded,
                                      QList<int> &idErrors)
{
    Q_UNUSED(updatesNeeded)
    return AboutToShowGroup(ids, idErrors);
}

} // namespace pomotray

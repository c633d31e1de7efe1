#include "menu/menu_model.hpp"

#include <stdexcept>
#include <string>

#include "common/enum_strings.hpp"

namespace pomotray {

namespace {

struct PropertyAccessor {
    const char *name;
    QVariant (*read)(const MenuEntry &entry);
};

// Wire name -> value projection of a MenuEntry.
const PropertyAccessor kAccessors[] = {
    {"children-display",
     [](const MenuEntry &e) { return QVariant(toChildrenDisplayString(e.childrenDisplay)); }},
    {"disposition",
     [](const MenuEntry &e) { return QVariant(toDispositionString(e.disposition)); }},
    {"enabled", [](const MenuEntry &e) { return QVariant(e.enabled); }},
    {"icon-name", [](const MenuEntry &e) { return QVariant(e.iconName); }},
    {"label", [](const MenuEntry &e) { return QVariant(e.label); }},
    {"toggle-state",
     [](const MenuEntry &e) { return QVariant(toToggleStateValue(e.toggleState)); }},
    {"toggle-type",
     [](const MenuEntry &e) { return QVariant(toToggleTypeString(e.toggleType)); }},
    {"type", [](const MenuEntry &e) { return QVariant(toEntryTypeString(e.type)); }},
    {"visible", [](const MenuEntry &e) { return QVariant(e.visible); }},
};

const PropertyAccessor *findAccessor(const QString &name)
{
    for (const auto &accessor : kAccessors) {
        if (name == QLatin1String(accessor.name)) {
            return &accessor;
        }
    }
    return nullptr;
}

MenuEntry makeActionEntry(int id, const QString &label, bool visible, MenuAction action)
{
    MenuEntry entry;
    entry.id = id;
    entry.label = label;
    entry.visible = visible;
    entry.action = action;
    return entry;
}

} // namespace

MenuModel::MenuModel()
{
    MenuEntry root;
    root.id = kRootId;
    root.childrenDisplay = ChildrenDisplay::Submenu;
    m_entries.insert(root.id, root);

    // The host window starts shown, so only "Hide" is offered.
    addEntry(makeActionEntry(kShowId, QStringLiteral("Show"), false, MenuAction::ShowWindow), kRootId);
    addEntry(makeActionEntry(kHideId, QStringLiteral("Hide"), true, MenuAction::HideWindow), kRootId);
}

void MenuModel::addEntry(const MenuEntry &entry, int parentId)
{
    auto parent = m_entries.find(parentId);
    if (parent == m_entries.end() || m_entries.contains(entry.id)) {
        throw std::invalid_argument("menu entry wiring is inconsistent");
    }
    parent->children.append(entry.id);
    parent->childrenDisplay = ChildrenDisplay::Submenu;
    m_entries.insert(entry.id, entry);
}

quint32 MenuModel::revision() const
{
    return m_revision;
}

bool MenuModel::contains(int id) const
{
    return m_entries.contains(id);
}

const MenuEntry *MenuModel::entry(int id) const
{
    auto it = m_entries.constFind(id);
    if (it == m_entries.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

QList<int> MenuModel::ids() const
{
    return m_entries.keys();
}

bool MenuModel::setVisible(int id, bool visible)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        throw std::out_of_range("unknown menu entry " + std::to_string(id));
    }
    if (it->visible == visible) {
        return false;
    }
    it->visible = visible;
    return true;
}

QVariantMap MenuModel::renderProperties(int id, const QStringList &names) const
{
    const MenuEntry *found = entry(id);
    if (!found) {
        throw std::out_of_range("unknown menu entry " + std::to_string(id));
    }
    return render(*found, names);
}

QVariant MenuModel::property(int id, const QString &name) const
{
    const MenuEntry *found = entry(id);
    if (!found) {
        throw std::out_of_range("unknown menu entry " + std::to_string(id));
    }
    const PropertyAccessor *accessor = findAccessor(name);
    if (!accessor) {
        throw std::out_of_range("unknown menu property " + name.toStdString());
    }
    return accessor->read(*found);
}

DBusMenuLayoutItem MenuModel::layout(int parentId, int recursionDepth, const QStringList &names) const
{
    const MenuEntry *parent = entry(parentId);
    if (!parent) {
        throw std::invalid_argument("unknown parent id " + std::to_string(parentId));
    }
    return renderLayout(*parent, recursionDepth, names);
}

QStringList MenuModel::propertyNames()
{
    QStringList names;
    for (const auto &accessor : kAccessors) {
        names << QString::fromLatin1(accessor.name);
    }
    return names;
}

QVariantMap MenuModel::render(const MenuEntry &entry, const QStringList &names) const
{
    QVariantMap properties;
    if (names.isEmpty()) {
        for (const auto &accessor : kAccessors) {
            properties.insert(QString::fromLatin1(accessor.name), accessor.read(entry));
        }
        return properties;
    }

    for (const QString &name : names) {
        if (const PropertyAccessor *accessor = findAccessor(name)) {
            properties.insert(name, accessor->read(entry));
        }
    }
    return properties;
}

DBusMenuLayoutItem MenuModel::renderLayout(const MenuEntry &entry,
                                           int recursionDepth,
                                           const QStringList &names) const
{
    DBusMenuLayoutItem item;
    item.id = entry.id;
    item.properties = render(entry, names);

    if (recursionDepth == 0) {
        return item;
    }

    const int childDepth = recursionDepth < 0 ? -1 : recursionDepth - 1;
    for (int childId : entry.children) {
        item.children.append(renderLayout(m_entries.value(childId), childDepth, names));
    }
    return item;
}

} // namespace pomotray

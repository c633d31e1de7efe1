#pragma once

#include <QList>
#include <QMap>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

#include "common/models.hpp"
#include "dbus/dbus_types.hpp"

namespace pomotray {

/**
 * MenuModel is the fixed two-level menu published over com.canonical.dbusmenu:
 * the root (id 0) with a "Show" and a "Hide" entry. The structure is wired in
 * the constructor and never changes; only visibility flags are mutable.
 */
class MenuModel
{
public:
    static constexpr int kRootId = 0;
    static constexpr int kShowId = 1;
    static constexpr int kHideId = 2;

    MenuModel();

    quint32 revision() const;

    bool contains(int id) const;
    // Returns nullptr for unknown ids.
    const MenuEntry *entry(int id) const;
    // All entry ids in ascending order.
    QList<int> ids() const;

    // Returns true when the flag actually changed. Throws std::out_of_range.
    bool setVisible(int id, bool visible);

    // Empty names selects every property; unknown names are skipped.
    // Throws std::out_of_range for unknown ids.
    QVariantMap renderProperties(int id, const QStringList &names = {}) const;

    // Throws std::out_of_range when the id or the property is unknown.
    QVariant property(int id, const QString &name) const;

    // recursionDepth: negative = unbounded, 0 = no children, n = n levels.
    // Throws std::invalid_argument when parentId is unknown.
    DBusMenuLayoutItem layout(int parentId, int recursionDepth, const QStringList &names = {}) const;

    static QStringList propertyNames();

private:
    void addEntry(const MenuEntry &entry, int parentId);
    QVariantMap render(const MenuEntry &entry, const QStringList &names) const;
    DBusMenuLayoutItem renderLayout(const MenuEntry &entry,
                                    int recursionDepth,
                                    const QStringList &names) const;

    QMap<int, MenuEntry> m_entries;
    quint32 m_revision = 0;
};

} // namespace pomotray

#pragma once

#include <QString>

#include "common/enums.hpp"

namespace pomotray {

inline constexpr char kItemInterface[] = "org.kde.StatusNotifierItem";
inline constexpr char kMenuInterface[] = "com.canonical.dbusmenu";
inline constexpr char kPropertiesInterface[] = "org.freedesktop.DBus.Properties";

/**
 * TrayConfig holds the process-wide constants of the tray services.
 * It is built once at startup and passed by value into the services.
 */
struct TrayConfig {
    QString itemId = QStringLiteral("pomotray");
    QString title = QStringLiteral("Pomotray");
    ItemCategory category = ItemCategory::ApplicationStatus;

    // Icon names are "<iconPrefix>idle", "<iconPrefix>attention", "<iconPrefix>NN".
    QString iconPrefix = QStringLiteral("pomotray-");

    QString itemObjectPath = QStringLiteral("/StatusNotifierItem");
    QString menuObjectPath = QStringLiteral("/MenuBar");

    QString watcherService = QStringLiteral("org.kde.StatusNotifierWatcher");
    QString watcherPath = QStringLiteral("/StatusNotifierWatcher");
    QString watcherInterface = QStringLiteral("org.kde.StatusNotifierWatcher");

    QString idleIconName() const;
    QString attentionIconName() const;
};

// Defaults overridden by POMOTRAY_ITEM_ID, POMOTRAY_ITEM_TITLE,
// POMOTRAY_ITEM_CATEGORY and POMOTRAY_ICON_PREFIX.
TrayConfig loadTrayConfig();

} // namespace pomotray

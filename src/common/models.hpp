#pragma once

#include <QString>
#include <QVector>

#include "common/enums.hpp"

namespace pomotray {

struct MenuEntry {
    int id = 0;
    MenuEntryType type = MenuEntryType::Standard;
    QString label;
    QString iconName;
    bool enabled = true;
    bool visible = true;
    ToggleType toggleType = ToggleType::None;
    ToggleState toggleState = ToggleState::Indeterminate;
    ChildrenDisplay childrenDisplay = ChildrenDisplay::None;
    Disposition disposition = Disposition::Normal;
    // Display order. Wired once when the model is built.
    QVector<int> children;
    MenuAction action = MenuAction::None;
};

struct ItemState {
    ItemStatus status = ItemStatus::Passive;
    QString iconName;

    // Fixed at construction.
    QString id;
    QString title;
    ItemCategory category = ItemCategory::ApplicationStatus;
    QString attentionIconName;
    QString overlayIconName;
    int windowId = 0;
    bool itemIsMenu = false;
    QString menuPath;
};

} // namespace pomotray

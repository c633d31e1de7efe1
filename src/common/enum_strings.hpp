#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

// Wire encodings of the protocol enums (StatusNotifierItem and dbusmenu).
namespace pomotray {

inline QString toStatusString(ItemStatus status)
{
    switch (status) {
    case ItemStatus::Passive:
        return QStringLiteral("Passive");
    case ItemStatus::Active:
        return QStringLiteral("Active");
    case ItemStatus::NeedsAttention:
        return QStringLiteral("NeedsAttention");
    }
    return QStringLiteral("Passive");
}

inline QString toCategoryString(ItemCategory category)
{
    switch (category) {
    case ItemCategory::ApplicationStatus:
        return QStringLiteral("ApplicationStatus");
    case ItemCategory::Communications:
        return QStringLiteral("Communications");
    case ItemCategory::SystemServices:
        return QStringLiteral("SystemServices");
    case ItemCategory::Hardware:
        return QStringLiteral("Hardware");
    }
    return QStringLiteral("ApplicationStatus");
}

inline std::optional<ItemCategory> parseCategoryString(const QString &value)
{
    if (value == QLatin1String("ApplicationStatus")) {
        return ItemCategory::ApplicationStatus;
    }
    if (value == QLatin1String("Communications")) {
        return ItemCategory::Communications;
    }
    if (value == QLatin1String("SystemServices")) {
        return ItemCategory::SystemServices;
    }
    if (value == QLatin1String("Hardware")) {
        return ItemCategory::Hardware;
    }
    return std::nullopt;
}

inline QString toEntryTypeString(MenuEntryType type)
{
    switch (type) {
    case MenuEntryType::Standard:
        return QStringLiteral("standard");
    case MenuEntryType::Separator:
        return QStringLiteral("separator");
    }
    return QStringLiteral("standard");
}

inline QString toToggleTypeString(ToggleType type)
{
    switch (type) {
    case ToggleType::None:
        return QString();
    case ToggleType::Checkmark:
        return QStringLiteral("checkmark");
    case ToggleType::Radio:
        return QStringLiteral("radio");
    }
    return QString();
}

inline int toToggleStateValue(ToggleState state)
{
    switch (state) {
    case ToggleState::Off:
        return 0;
    case ToggleState::On:
        return 1;
    case ToggleState::Indeterminate:
        return -1;
    }
    return -1;
}

inline QString toChildrenDisplayString(ChildrenDisplay display)
{
    return display == ChildrenDisplay::Submenu ? QStringLiteral("submenu") : QString();
}

inline QString toDispositionString(Disposition disposition)
{
    switch (disposition) {
    case Disposition::Normal:
        return QStringLiteral("normal");
    case Disposition::Informative:
        return QStringLiteral("informative");
    case Disposition::Warning:
        return QStringLiteral("warning");
    case Disposition::Alert:
        return QStringLiteral("alert");
    }
    return QStringLiteral("normal");
}

inline QString toActionString(MenuAction action)
{
    switch (action) {
    case MenuAction::None:
        return QStringLiteral("none");
    case MenuAction::ShowWindow:
        return QStringLiteral("show_window");
    case MenuAction::HideWindow:
        return QStringLiteral("hide_window");
    }
    return QStringLiteral("none");
}

inline QString toPhaseString(SessionPhase phase)
{
    switch (phase) {
    case SessionPhase::Idle:
        return QStringLiteral("idle");
    case SessionPhase::Running:
        return QStringLiteral("running");
    case SessionPhase::Interrupted:
        return QStringLiteral("interrupted");
    }
    return QStringLiteral("idle");
}

inline void to_json(nlohmann::json &j, const ItemStatus &status)
{
    j = toStatusString(status).toStdString();
}

inline void to_json(nlohmann::json &j, const MenuAction &action)
{
    j = toActionString(action).toStdString();
}

inline void to_json(nlohmann::json &j, const SessionPhase &phase)
{
    j = toPhaseString(phase).toStdString();
}

} // namespace pomotray

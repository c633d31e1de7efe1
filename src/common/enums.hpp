#pragma once

namespace pomotray {

enum class ItemStatus {
    Passive,
    Active,
    NeedsAttention
};

enum class ItemCategory {
    ApplicationStatus,
    Communications,
    SystemServices,
    Hardware
};

enum class MenuEntryType {
    Standard,
    Separator
};

enum class ToggleType {
    None,
    Checkmark,
    Radio
};

enum class ToggleState {
    Off,
    On,
    Indeterminate
};

enum class ChildrenDisplay {
    None,
    Submenu
};

enum class Disposition {
    Normal,
    Informative,
    Warning,
    Alert
};

// Action bound to a menu entry, resolved by TrayController on "clicked".
enum class MenuAction {
    None,
    ShowWindow,
    HideWindow
};

enum class SessionPhase {
    Idle,
    Running,
    Interrupted
};

} // namespace pomotray

#pragma once

namespace pomotray {

// Capability to show or hide the host application's main window.
class WindowControl
{
public:
    virtual ~WindowControl() = default;

    virtual void showWindow() = 0;
    virtual void hideWindow() = 0;
};

} // namespace pomotray

#pragma once

#include <QObject>

#include "tray/window_control.hpp"

namespace pomotray {

// Stands in for the host window: records the request and reports the new
// visibility back as if the window had been shown or hidden.
class LoggingWindowControl : public QObject, public WindowControl
{
    Q_OBJECT
public:
    explicit LoggingWindowControl(QObject *parent = nullptr);

    bool isVisible() const;

    void showWindow() override;
    void hideWindow() override;

signals:
    void windowShown();
    void windowHidden();

private:
    bool m_visible = true;
};

} // namespace pomotray

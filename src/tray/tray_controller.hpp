#pragma once

#include <memory>

#include <QObject>
#include <QString>

#include "common/config.hpp"
#include "common/enums.hpp"
#include "dbus/bus_connection.hpp"
#include "item/status_notifier_item.hpp"
#include "menu/dbus_menu.hpp"
#include "tray/window_control.hpp"

namespace pomotray {

/**
 * TrayController translates host lifecycle and session events into calls on
 * StatusNotifierItem and DBusMenu, and menu clicks into WindowControl calls.
 *
 * It is the only writer of both services. No handler lets an exception
 * escape: failures are logged and the host carries on without a tray icon.
 */
class TrayController : public QObject
{
    Q_OBJECT
public:
    explicit TrayController(WindowControl &windowControl, QObject *parent = nullptr);
    ~TrayController() override;

    // Creates and registers both services. Returns false when registration
    // failed; the controller then stays inert.
    bool configure(BusConnection &bus, const TrayConfig &config);

    bool isConfigured() const;
    bool isActivated() const;
    SessionPhase phase() const;

    StatusNotifierItem *item() const;
    DBusMenu *menu() const;

    // "<prefix>NN": percent rounded half-to-even, at least two digits.
    static QString iconNameForPercent(const QString &prefix, double percent);

public slots:
    void activate();
    void deactivate();

    void onSessionStarted();
    void onSessionInterrupted();
    void onSessionEnded();
    void onTimerUpdated(double elapsedPercent);

    void onWindowShown();
    void onWindowHidden();

private:
    void handleMenuAction(MenuAction action);

    void changeStatus(ItemStatus status);
    void changeIcon(const QString &iconName);
    void changeVisibility(bool windowVisible);

    WindowControl &m_windowControl;
    std::unique_ptr<DBusMenu> m_menu;
    std::unique_ptr<StatusNotifierItem> m_item;
    QString m_iconPrefix;
    SessionPhase m_phase = SessionPhase::Idle;
    bool m_activated = false;
};

} // namespace pomotray

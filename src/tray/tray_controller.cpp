#include "tray/tray_controller.hpp"

#include <cmath>
#include <exception>

#include <nlohmann/json.hpp>

#include "common/enum_strings.hpp"
#include "common/logging.hpp"

namespace pomotray {

namespace {

void logHandlerFailure(const QString &where, const std::exception &error)
{
    PLOG_ERROR(QStringLiteral("TrayController"),
               where,
               QStringLiteral("tray_update_failed"),
               QStringLiteral("service_error"),
               QStringLiteral("suppressed"),
               (nlohmann::json{{"error", error.what()}}));
}

void logSessionEvent(const QString &where, const QString &what, const nlohmann::json &context)
{
    PLOG_DEBUG(QStringLiteral("TrayController"),
               where,
               what,
               QStringLiteral("host_event"),
               QStringLiteral("tray_update"),
               context);
}

} // namespace

TrayController::TrayController(WindowControl &windowControl, QObject *parent)
    : QObject(parent)
    , m_windowControl(windowControl)
{
}

TrayController::~TrayController() = default;

bool TrayController::configure(BusConnection &bus, const TrayConfig &config)
{
    m_iconPrefix = config.iconPrefix;

    try {
        // The menu goes first: the watcher may read the item's Menu property
        // as soon as the item is registered.
        m_menu = std::make_unique<DBusMenu>(bus, config);
        m_item = std::make_unique<StatusNotifierItem>(bus, config);
    } catch (const std::exception &e) {
        logHandlerFailure(QStringLiteral("configure"), e);
        m_item.reset();
        m_menu.reset();
        return false;
    }

    connect(m_menu.get(), &DBusMenu::actionRequested,
            this, &TrayController::handleMenuAction);

    PLOG_INFO(QStringLiteral("TrayController"),
              QStringLiteral("configure"),
              QStringLiteral("tray_configured"),
              QStringLiteral("service_start"),
              QStringLiteral("status_notifier_item"),
              (nlohmann::json{{"service", m_item->serviceName().toStdString()}}));
    return true;
}

bool TrayController::isConfigured() const
{
    return m_item && m_menu;
}

bool TrayController::isActivated() const
{
    return m_activated;
}

SessionPhase TrayController::phase() const
{
    return m_phase;
}

StatusNotifierItem *TrayController::item() const
{
    return m_item.get();
}

DBusMenu *TrayController::menu() const
{
    return m_menu.get();
}

QString TrayController::iconNameForPercent(const QString &prefix, double percent)
{
    // nearbyint rounds ties to even under the default rounding mode.
    const auto rounded = static_cast<qint64>(std::nearbyint(percent));
    return prefix + QStringLiteral("%1").arg(rounded, 2, 10, QLatin1Char('0'));
}

void TrayController::activate()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("activate")));
    logSessionEvent(QStringLiteral("activate"), QStringLiteral("activate"),
                    nlohmann::json{{"phase", m_phase}});
    m_activated = true;

    if (m_phase == SessionPhase::Running) {
        changeStatus(ItemStatus::Active);
    }
}

void TrayController::deactivate()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("deactivate")));
    logSessionEvent(QStringLiteral("deactivate"), QStringLiteral("deactivate"),
                    nlohmann::json{{"phase", m_phase}});
    changeStatus(ItemStatus::Passive);
    m_activated = false;
}

void TrayController::onSessionStarted()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("onSessionStarted")));
    logSessionEvent(QStringLiteral("onSessionStarted"), QStringLiteral("session_start"),
                    nlohmann::json::object());
    m_phase = SessionPhase::Running;
    changeStatus(ItemStatus::Active);
    changeVisibility(true);
}

void TrayController::onSessionInterrupted()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("onSessionInterrupted")));
    logSessionEvent(QStringLiteral("onSessionInterrupted"), QStringLiteral("session_stop"),
                    nlohmann::json{{"reason", "interrupt"}});
    m_phase = SessionPhase::Interrupted;
    changeStatus(ItemStatus::Passive);
}

void TrayController::onSessionEnded()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("onSessionEnded")));
    logSessionEvent(QStringLiteral("onSessionEnded"), QStringLiteral("session_stop"),
                    nlohmann::json{{"reason", "end"}});
    m_phase = SessionPhase::Idle;
    changeStatus(ItemStatus::Passive);
}

void TrayController::onTimerUpdated(double elapsedPercent)
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("onTimerUpdated")));
    logSessionEvent(QStringLiteral("onTimerUpdated"), QStringLiteral("timer_update"),
                    nlohmann::json{{"elapsedPercent", elapsedPercent}});
    changeIcon(iconNameForPercent(m_iconPrefix, elapsedPercent));
}

void TrayController::onWindowShown()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("onWindowShown")));
    logSessionEvent(QStringLiteral("onWindowShown"), QStringLiteral("window_show"),
                    nlohmann::json::object());
    changeVisibility(true);
}

void TrayController::onWindowHidden()
{
    logging::CallScope callScope(logging::localCallContext(QStringLiteral("onWindowHidden")));
    logSessionEvent(QStringLiteral("onWindowHidden"), QStringLiteral("window_hide"),
                    nlohmann::json::object());
    changeVisibility(false);
}

void TrayController::handleMenuAction(MenuAction action)
{
    PLOG_INFO(QStringLiteral("TrayController"),
              QStringLiteral("handleMenuAction"),
              QStringLiteral("menu_action"),
              QStringLiteral("menu_clicked"),
              QStringLiteral("window_control"),
              (nlohmann::json{{"action", action}}));

    try {
        switch (action) {
        case MenuAction::ShowWindow:
            m_windowControl.showWindow();
            break;
        case MenuAction::HideWindow:
            m_windowControl.hideWindow();
            break;
        case MenuAction::None:
            break;
        }
    } catch (const std::exception &e) {
        logHandlerFailure(QStringLiteral("handleMenuAction"), e);
    }
}

void TrayController::changeStatus(ItemStatus status)
{
    if (!m_activated || !m_item) {
        return;
    }
    try {
        m_item->changeStatus(status);
    } catch (const std::exception &e) {
        logHandlerFailure(QStringLiteral("changeStatus"), e);
    }
}

void TrayController::changeIcon(const QString &iconName)
{
    if (!m_activated || !m_item) {
        return;
    }
    try {
        m_item->changeIcon(iconName);
    } catch (const std::exception &e) {
        logHandlerFailure(QStringLiteral("changeIcon"), e);
    }
}

void TrayController::changeVisibility(bool windowVisible)
{
    if (!m_activated || !m_menu) {
        return;
    }
    try {
        m_menu->updateMenuVisibility(windowVisible);
    } catch (const std::exception &e) {
        logHandlerFailure(QStringLiteral("changeVisibility"), e);
    }
}

} // namespace pomotray

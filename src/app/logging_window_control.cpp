#include "app/logging_window_control.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace pomotray {

LoggingWindowControl::LoggingWindowControl(QObject *parent)
    : QObject(parent)
{
}

bool LoggingWindowControl::isVisible() const
{
    return m_visible;
}

void LoggingWindowControl::showWindow()
{
    PLOG_INFO(QStringLiteral("LoggingWindowControl"),
              QStringLiteral("showWindow"),
              QStringLiteral("window_show"),
              QStringLiteral("menu_action"),
              QStringLiteral("log_only"),
              (nlohmann::json{{"wasVisible", m_visible}}));
    m_visible = true;
    emit windowShown();
}

void LoggingWindowControl::hideWindow()
{
    PLOG_INFO(QStringLiteral("LoggingWindowControl"),
              QStringLiteral("hideWindow"),
              QStringLiteral("window_hide"),
              QStringLiteral("menu_action"),
              QStringLiteral("log_only"),
              (nlohmann::json{{"wasVisible", m_visible}}));
    m_visible = false;
    emit windowHidden();
}

} // namespace pomotray

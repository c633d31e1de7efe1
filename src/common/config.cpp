#include "common/config.hpp"

#include <nlohmann/json.hpp>

#include "common/enum_strings.hpp"
#include "common/logging.hpp"

namespace pomotray {

QString TrayConfig::idleIconName() const
{
    return iconPrefix + QStringLiteral("idle");
}

QString TrayConfig::attentionIconName() const
{
    return iconPrefix + QStringLiteral("attention");
}

TrayConfig loadTrayConfig()
{
    TrayConfig config;

    const QString itemId = qEnvironmentVariable("POMOTRAY_ITEM_ID");
    if (!itemId.isEmpty()) {
        config.itemId = itemId;
    }

    const QString title = qEnvironmentVariable("POMOTRAY_ITEM_TITLE");
    if (!title.isEmpty()) {
        config.title = title;
    }

    const QString category = qEnvironmentVariable("POMOTRAY_ITEM_CATEGORY");
    if (!category.isEmpty()) {
        const auto parsed = parseCategoryString(category);
        if (parsed) {
            config.category = *parsed;
        } else {
            PLOG_WARN(QStringLiteral("TrayConfig"),
                      QStringLiteral("loadTrayConfig"),
                      QStringLiteral("invalid_category"),
                      QStringLiteral("environment_override"),
                      QStringLiteral("fallback_default"),
                      (nlohmann::json{{"value", category.toStdString()}}));
        }
    }

    if (qEnvironmentVariableIsSet("POMOTRAY_ICON_PREFIX")) {
        config.iconPrefix = qEnvironmentVariable("POMOTRAY_ICON_PREFIX");
    }

    return config;
}

} // namespace pomotray

#include "core/coordinator_config.hpp"

#include <QSettings>
#include <QString>

namespace viewport_coordinator::core {

namespace {
constexpr const char* SETTINGS_GROUP = "ViewportCoordinator";

std::chrono::milliseconds readDuration(const QSettings& settings, const char* key,
                                       std::chrono::milliseconds fallback,
                                       std::chrono::milliseconds minimum) {
    bool ok = false;
    const int value = settings.value(key, static_cast<int>(fallback.count())).toInt(&ok);
    if (!ok || value < minimum.count()) {
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

int readInt(const QSettings& settings, const char* key, int fallback, int minimum) {
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value < minimum) {
        return fallback;
    }
    return value;
}
} // namespace

bool CoordinatorConfig::isValid() const {
    return stateRestoreDelay.count() >= 0
        && annotationRestoreDelay.count() >= 0
        && restorePollInterval.count() > 0
        && maxRestoreAttempts > 0
        && annotationGracePeriod.count() >= 0
        && autoCleanupInterval.count() > 0
        && minimumSurfaceExtent > 0
        && layoutHistoryLimit > 0
        && maxStoredLayouts > 0
        && !defaultLayout.empty();
}

std::string to_string(AnnotationRemapPolicy policy) {
    switch (policy) {
        case AnnotationRemapPolicy::FirstAvailable: return "FirstAvailable";
        case AnnotationRemapPolicy::DropUnmatched:  return "DropUnmatched";
    }
    return "FirstAvailable";
}

AnnotationRemapPolicy remap_policy_from_string(const std::string& str) {
    if (str == "DropUnmatched") return AnnotationRemapPolicy::DropUnmatched;
    return AnnotationRemapPolicy::FirstAvailable;
}

CoordinatorConfig loadCoordinatorConfig(QSettings& settings) {
    const CoordinatorConfig defaults;
    CoordinatorConfig config;

    settings.beginGroup(SETTINGS_GROUP);

    using std::chrono::milliseconds;
    config.stateRestoreDelay =
        readDuration(settings, "stateRestoreDelayMs", defaults.stateRestoreDelay, milliseconds{0});
    config.annotationRestoreDelay =
        readDuration(settings, "annotationRestoreDelayMs", defaults.annotationRestoreDelay,
                     milliseconds{0});
    config.restorePollInterval =
        readDuration(settings, "restorePollIntervalMs", defaults.restorePollInterval,
                     milliseconds{1});
    config.maxRestoreAttempts =
        readInt(settings, "maxRestoreAttempts", defaults.maxRestoreAttempts, 1);
    config.annotationGracePeriod =
        readDuration(settings, "annotationGracePeriodMs", defaults.annotationGracePeriod,
                     milliseconds{0});
    config.autoCleanupInterval =
        readDuration(settings, "autoCleanupIntervalMs", defaults.autoCleanupInterval,
                     milliseconds{1});
    config.minimumSurfaceExtent =
        readInt(settings, "minimumSurfaceExtent", defaults.minimumSurfaceExtent, 1);
    config.layoutHistoryLimit = static_cast<std::size_t>(
        readInt(settings, "layoutHistoryLimit", static_cast<int>(defaults.layoutHistoryLimit), 1));
    config.maxStoredLayouts = static_cast<std::size_t>(
        readInt(settings, "maxStoredLayouts", static_cast<int>(defaults.maxStoredLayouts), 1));

    QString layout = settings.value("defaultLayout",
                                    QString::fromStdString(defaults.defaultLayout)).toString();
    if (!layout.isEmpty()) {
        config.defaultLayout = layout.toStdString();
    }

    config.remapPolicy = remap_policy_from_string(
        settings.value("annotationRemapPolicy",
                       QString::fromStdString(to_string(defaults.remapPolicy)))
            .toString().toStdString());

    config.logLevel = from_settings_value(
        settings.value("logLevel", to_settings_value(defaults.logLevel)).toInt());

    settings.endGroup();
    return config;
}

void saveCoordinatorConfig(QSettings& settings, const CoordinatorConfig& config) {
    settings.beginGroup(SETTINGS_GROUP);

    settings.setValue("stateRestoreDelayMs", static_cast<int>(config.stateRestoreDelay.count()));
    settings.setValue("annotationRestoreDelayMs",
                      static_cast<int>(config.annotationRestoreDelay.count()));
    settings.setValue("restorePollIntervalMs",
                      static_cast<int>(config.restorePollInterval.count()));
    settings.setValue("maxRestoreAttempts", config.maxRestoreAttempts);
    settings.setValue("annotationGracePeriodMs",
                      static_cast<int>(config.annotationGracePeriod.count()));
    settings.setValue("autoCleanupIntervalMs",
                      static_cast<int>(config.autoCleanupInterval.count()));
    settings.setValue("minimumSurfaceExtent", config.minimumSurfaceExtent);
    settings.setValue("layoutHistoryLimit", static_cast<int>(config.layoutHistoryLimit));
    settings.setValue("maxStoredLayouts", static_cast<int>(config.maxStoredLayouts));
    settings.setValue("defaultLayout", QString::fromStdString(config.defaultLayout));
    settings.setValue("annotationRemapPolicy", QString::fromStdString(to_string(config.remapPolicy)));
    settings.setValue("logLevel", to_settings_value(config.logLevel));

    settings.endGroup();
    settings.sync();
}

}  // namespace viewport_coordinator::core

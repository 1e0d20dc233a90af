#include "services/persistence/persistence_service.hpp"

#include <QSettings>

#include "core/logging.hpp"

namespace {

constexpr const char* SETTINGS_GROUP = "Persistence";
constexpr const char* VALUE_KEY = "value";
constexpr const char* PURPOSE_KEY = "purpose";

auto& getLogger() {
    static auto logger =
        viewport_coordinator::logging::LoggerFactory::create("SettingsPersistence");
    return logger;
}

}  // anonymous namespace

namespace viewport_coordinator::services {

class SettingsPersistenceService::Impl {
public:
    QString organization;
    QString application;

    Impl(const QString& org, const QString& app)
        : organization(org), application(app) {}

    [[nodiscard]] std::unique_ptr<QSettings> open() const {
        auto settings = std::make_unique<QSettings>(organization, application);
        settings->beginGroup(SETTINGS_GROUP);
        return settings;
    }
};

SettingsPersistenceService::SettingsPersistenceService(const QString& organization,
                                                       const QString& application)
    : impl_(std::make_unique<Impl>(organization, application))
{
}

SettingsPersistenceService::~SettingsPersistenceService() = default;

bool SettingsPersistenceService::store(const std::string& key, const std::string& value,
                                       const std::string& purpose)
{
    if (key.empty()) {
        getLogger()->warn("Refusing to store value with empty key");
        return false;
    }

    auto settings = impl_->open();
    settings->beginGroup(QString::fromStdString(key));
    settings->setValue(VALUE_KEY, QString::fromStdString(value));
    settings->setValue(PURPOSE_KEY, QString::fromStdString(purpose));
    settings->endGroup();
    settings->endGroup();
    settings->sync();

    if (settings->status() != QSettings::NoError) {
        getLogger()->error("Failed to write '{}' to settings (status={})",
                           key, static_cast<int>(settings->status()));
        return false;
    }

    getLogger()->debug("Stored '{}' ({} bytes, purpose={})", key, value.size(), purpose);
    return true;
}

std::optional<std::string> SettingsPersistenceService::retrieve(const std::string& key) const
{
    auto settings = impl_->open();
    settings->beginGroup(QString::fromStdString(key));
    if (!settings->contains(VALUE_KEY)) {
        return std::nullopt;
    }
    return settings->value(VALUE_KEY).toString().toStdString();
}

bool SettingsPersistenceService::remove(const std::string& key)
{
    auto settings = impl_->open();
    const QString group = QString::fromStdString(key);
    if (!settings->childGroups().contains(group)) {
        return false;
    }
    settings->remove(group);
    settings->sync();
    getLogger()->debug("Removed '{}'", key);
    return true;
}

std::optional<std::string> SettingsPersistenceService::purposeOf(const std::string& key) const
{
    auto settings = impl_->open();
    settings->beginGroup(QString::fromStdString(key));
    if (!settings->contains(PURPOSE_KEY)) {
        return std::nullopt;
    }
    return settings->value(PURPOSE_KEY).toString().toStdString();
}

void SettingsPersistenceService::clear()
{
    auto settings = impl_->open();
    // Removes every key within the current group
    settings->remove("");
    settings->sync();
}

}  // namespace viewport_coordinator::services

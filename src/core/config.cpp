#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"

namespace braid {

namespace {

constexpr const char* kDeviceId = "sync/device_id";
constexpr const char* kDeviceName = "sync/device_name";
constexpr const char* kConflictStrategy = "sync/conflict_strategy";
constexpr const char* kDatabasePath = "sync/database_path";
constexpr const char* kSyncInterval = "sync/interval_seconds";
constexpr const char* kMaxAttempts = "sync/max_attempts";

std::string get_or_create_device_id(QSettings& settings) {
    const QString key = QString::fromLatin1(kDeviceId);
    const QString stored = settings.value(key).toString();
    if (!stored.isEmpty() && Uuid::parse(stored.toStdString())) {
        return stored.toStdString();
    }
    const auto id = Uuid::generate().to_string();
    settings.setValue(key, QString::fromStdString(id));
    return id;
}

uint32_t positive_or(const QVariant& value, uint32_t fallback) {
    bool ok = false;
    const auto parsed = value.toUInt(&ok);
    return ok && parsed > 0 ? parsed : fallback;
}

} // namespace

SyncConfig load_sync_config(QSettings& settings) {
    SyncConfig config;
    config.device_id = get_or_create_device_id(settings);
    config.device_name = settings.value(QString::fromLatin1(kDeviceName),
                                        QString::fromStdString(config.device_name))
                             .toString().toStdString();

    const auto strategy_name = settings.value(QString::fromLatin1(kConflictStrategy)).toString();
    if (!strategy_name.isEmpty()) {
        if (auto strategy = sync::parse_strategy(strategy_name.toStdString())) {
            config.conflict_strategy = *strategy;
        } else {
            qCWarning(braidSyncLog) << "Unknown conflict strategy" << strategy_name
                                    << "- using last_write_wins";
        }
    }

    config.database_path = settings.value(QString::fromLatin1(kDatabasePath)).toString().toStdString();
    config.sync_interval_seconds = positive_or(settings.value(QString::fromLatin1(kSyncInterval)),
                                               config.sync_interval_seconds);
    config.max_attempts = positive_or(settings.value(QString::fromLatin1(kMaxAttempts)),
                                      config.max_attempts);
    return config;
}

void save_sync_config(QSettings& settings, const SyncConfig& config) {
    settings.setValue(QString::fromLatin1(kDeviceId), QString::fromStdString(config.device_id));
    settings.setValue(QString::fromLatin1(kDeviceName), QString::fromStdString(config.device_name));
    settings.setValue(QString::fromLatin1(kConflictStrategy),
                      QString::fromStdString(sync::to_string(config.conflict_strategy)));
    settings.setValue(QString::fromLatin1(kDatabasePath), QString::fromStdString(config.database_path));
    settings.setValue(QString::fromLatin1(kSyncInterval), config.sync_interval_seconds);
    settings.setValue(QString::fromLatin1(kMaxAttempts), config.max_attempts);
}

} // namespace braid

#include "sync/account.hpp"

namespace braid::sync {

DeviceSettings DeviceSettings::for_device(std::string device_id, std::string device_name) {
    DeviceSettings settings;
    settings.device_id = std::move(device_id);
    settings.device_name = std::move(device_name);
    settings.registered_at = Timestamp::now();
    for (auto type : all_data_types()) {
        settings.enabled_types.insert(type);
    }
    return settings;
}

SyncAccount SyncAccount::create(std::string email,
                                std::string sync_server,
                                DeviceSettings settings) {
    const auto now = Timestamp::now();
    SyncAccount account;
    account.id = Uuid::generate().to_string();
    account.email = std::move(email);
    account.created_at = now;
    account.last_authenticated = now;
    account.sync_server = std::move(sync_server);
    account.device_settings = std::move(settings);
    return account;
}

} // namespace braid::sync

#pragma once

#include "core/types.hpp"
#include "sync/data_type.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace braid::sync {

/**
 * DeviceSettings - what this device syncs and how often.
 */
struct DeviceSettings {
    std::string device_id;
    std::string device_name;
    Timestamp registered_at;
    std::set<SyncDataType> enabled_types;
    bool sync_on_metered{false};
    uint32_t sync_interval_seconds{300};

    /**
     * Settings for a newly registered device: every type enabled.
     */
    [[nodiscard]] static DeviceSettings for_device(std::string device_id,
                                                   std::string device_name);

    bool operator==(const DeviceSettings&) const = default;
};

/**
 * SyncAccount - the identity a device syncs under.
 */
struct SyncAccount {
    std::string id;
    std::string email;
    std::optional<std::string> display_name;
    Timestamp created_at;
    Timestamp last_authenticated;
    bool is_verified{false};
    std::string sync_server;
    DeviceSettings device_settings;

    [[nodiscard]] static SyncAccount create(std::string email,
                                            std::string sync_server,
                                            DeviceSettings settings);

    [[nodiscard]] bool is_type_enabled(SyncDataType type) const {
        return device_settings.enabled_types.contains(type);
    }

    void enable_type(SyncDataType type) { device_settings.enabled_types.insert(type); }
    void disable_type(SyncDataType type) { device_settings.enabled_types.erase(type); }

    void update_authenticated() { last_authenticated = Timestamp::now(); }

    bool operator==(const SyncAccount&) const = default;
};

/**
 * SyncAccountCredentials - bearer credentials for the sync server.
 */
struct SyncAccountCredentials {
    // Refresh this long before expiry.
    static constexpr std::chrono::minutes REFRESH_MARGIN{5};

    std::string email;
    std::string auth_token;
    std::optional<std::string> refresh_token;
    std::optional<Timestamp> expires_at;

    [[nodiscard]] bool is_expired() const { return is_expired_at(Timestamp::now()); }
    [[nodiscard]] bool needs_refresh() const { return needs_refresh_at(Timestamp::now()); }

    // Clock-explicit forms of the checks above.
    [[nodiscard]] bool is_expired_at(Timestamp now) const {
        return expires_at && *expires_at < now;
    }
    [[nodiscard]] bool needs_refresh_at(Timestamp now) const {
        return expires_at && *expires_at <= now + REFRESH_MARGIN;
    }
};

} // namespace braid::sync

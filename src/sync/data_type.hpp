#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace braid::sync {

/**
 * SyncDataType - the kinds of user data the sync core carries.
 *
 * Wire names are snake_case: "bookmarks", "history", "settings",
 * "passwords", "open_tabs".
 */
enum class SyncDataType {
    Bookmarks,
    History,
    Settings,
    Passwords,
    OpenTabs
};

/**
 * All data types in declaration order.
 */
[[nodiscard]] std::vector<SyncDataType> all_data_types();

/**
 * Sync priority; lower values are synchronized first within a cycle.
 * Settings=1, Passwords=2, Bookmarks=3, OpenTabs=4, History=5.
 */
[[nodiscard]] constexpr uint8_t priority(SyncDataType type) noexcept {
    switch (type) {
        case SyncDataType::Settings: return 1;
        case SyncDataType::Passwords: return 2;
        case SyncDataType::Bookmarks: return 3;
        case SyncDataType::OpenTabs: return 4;
        case SyncDataType::History: return 5;
    }
    return 255;
}

/**
 * Settings and passwords never leave the device unencrypted.
 */
[[nodiscard]] constexpr bool requires_encryption(SyncDataType type) noexcept {
    return type == SyncDataType::Settings || type == SyncDataType::Passwords;
}

[[nodiscard]] std::string to_string(SyncDataType type);
[[nodiscard]] std::optional<SyncDataType> parse_data_type(std::string_view name);

/**
 * Sort types by ascending priority and drop duplicates.
 */
[[nodiscard]] std::vector<SyncDataType> sorted_by_priority(std::vector<SyncDataType> types);

} // namespace braid::sync

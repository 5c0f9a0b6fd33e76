#include "sync/data_type.hpp"

#include <algorithm>

namespace braid::sync {

std::vector<SyncDataType> all_data_types() {
    return {
        SyncDataType::Bookmarks,
        SyncDataType::History,
        SyncDataType::Settings,
        SyncDataType::Passwords,
        SyncDataType::OpenTabs
    };
}

std::string to_string(SyncDataType type) {
    switch (type) {
        case SyncDataType::Bookmarks: return "bookmarks";
        case SyncDataType::History: return "history";
        case SyncDataType::Settings: return "settings";
        case SyncDataType::Passwords: return "passwords";
        case SyncDataType::OpenTabs: return "open_tabs";
    }
    return "unknown";
}

std::optional<SyncDataType> parse_data_type(std::string_view name) {
    for (auto type : all_data_types()) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::vector<SyncDataType> sorted_by_priority(std::vector<SyncDataType> types) {
    std::sort(types.begin(), types.end(), [](SyncDataType a, SyncDataType b) {
        return priority(a) < priority(b);
    });
    types.erase(std::unique(types.begin(), types.end()), types.end());
    return types;
}

} // namespace braid::sync

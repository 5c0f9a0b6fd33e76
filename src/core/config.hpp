#pragma once

#include "sync/conflict.hpp"
#include <QSettings>
#include <cstdint>
#include <string>

namespace braid {

/**
 * SyncConfig - per-profile sync settings persisted with QSettings under the
 * `sync/` group.
 */
struct SyncConfig {
    std::string device_id;
    std::string device_name{"This Device"};
    sync::ConflictStrategy conflict_strategy{sync::ConflictStrategy::LastWriteWins};
    // Empty keeps sync state in memory.
    std::string database_path;
    uint32_t sync_interval_seconds{300};
    uint32_t max_attempts{5};
};

/**
 * Read the `sync/` group. A missing or malformed device id is replaced by a
 * freshly generated one, which is written back so the id is stable across
 * runs. Unknown strategy names fall back to last_write_wins.
 */
[[nodiscard]] SyncConfig load_sync_config(QSettings& settings);

void save_sync_config(QSettings& settings, const SyncConfig& config);

} // namespace braid

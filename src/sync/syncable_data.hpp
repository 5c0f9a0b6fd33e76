#pragma once

#include "core/types.hpp"
#include "sync/change.hpp"
#include "sync/data_type.hpp"
#include "sync/error.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace braid::sync {

/**
 * SyncableData - a store of one data type that the sync core can read
 * changes from and apply remote changes to.
 *
 * Calls block the thread running the sync cycle. Implementations must
 * tolerate apply_changes() being called again with changes they have
 * already applied.
 */
class SyncableData {
public:
    virtual ~SyncableData() = default;

    /**
     * Changes made strictly after `since`, oldest first. Changes applied
     * through apply_changes() are not reported back.
     */
    [[nodiscard]] virtual SyncResult<std::vector<Change>> get_changes_since(Timestamp since) = 0;

    /**
     * Apply remote or resolved changes. Returns how many were applied.
     */
    [[nodiscard]] virtual SyncResult<size_t> apply_changes(const std::vector<Change>& changes) = 0;

    /**
     * Stable key naming this source, e.g. "bookmarks:profile-1".
     */
    [[nodiscard]] virtual std::string get_sync_key() const = 0;

    [[nodiscard]] virtual SyncDataType data_type() const = 0;

    /**
     * One change per live entity describing its current state, used for
     * the first sync of a type.
     */
    [[nodiscard]] virtual SyncResult<std::vector<Change>> get_all_data() = 0;

    /**
     * Drop all synced data (logout).
     */
    [[nodiscard]] virtual SyncResult<void> clear_sync_data() = 0;
};

} // namespace braid::sync

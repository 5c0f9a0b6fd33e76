#pragma once

#include "sync/syncable_data.hpp"
#include <QJsonValue>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace braid::sync {

/**
 * MemoryDataSource - SyncableData kept entirely in memory.
 *
 * Local edits go through put()/remove() and are recorded in a change log;
 * changes applied by the sync core update the entities without touching the
 * log. Used by the development tool and by tests.
 */
class MemoryDataSource : public SyncableData {
public:
    MemoryDataSource(SyncDataType type, std::string device_id, std::string sync_key = {});

    /**
     * Create or update `entity_id` locally and return the recorded change.
     */
    Change put(const std::string& entity_id, QJsonValue data);
    Change put(const std::string& entity_id, QJsonValue data, Timestamp at);

    /**
     * Delete `entity_id` locally and return the recorded change.
     */
    Change remove(const std::string& entity_id);

    [[nodiscard]] std::optional<QJsonValue> get(const std::string& entity_id) const;
    [[nodiscard]] size_t size() const;

    /**
     * Make the next apply_changes() call fail with `error`.
     */
    void fail_next_apply(SyncError error);

    SyncResult<std::vector<Change>> get_changes_since(Timestamp since) override;
    SyncResult<size_t> apply_changes(const std::vector<Change>& changes) override;
    std::string get_sync_key() const override;
    SyncDataType data_type() const override { return type_; }

    // The snapshot is the latest change of every live entity, so its ids
    // match what was uploaded or downloaded before.
    SyncResult<std::vector<Change>> get_all_data() override;
    SyncResult<void> clear_sync_data() override;

private:
    struct Entity {
        QJsonValue data;
        Timestamp modified;
        uint64_t version{0};
        bool deleted{false};
        // Latest change recorded or applied for the entity.
        std::optional<Change> last;
    };

    Change record_locked(const std::string& entity_id,
                         ChangeOperation op,
                         QJsonValue data,
                         Timestamp at);

    SyncDataType type_;
    std::string device_id_;
    std::string sync_key_;

    mutable std::mutex mutex_;
    std::map<std::string, Entity> entities_;
    std::vector<Change> log_;
    std::optional<SyncError> apply_failure_;
};

} // namespace braid::sync

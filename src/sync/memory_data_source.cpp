#include "sync/memory_data_source.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace braid::sync {

MemoryDataSource::MemoryDataSource(SyncDataType type, std::string device_id, std::string sync_key)
    : type_(type)
    , device_id_(std::move(device_id))
    , sync_key_(sync_key.empty() ? sync::to_string(type) + ":" + device_id_ : std::move(sync_key))
{
}

Change MemoryDataSource::record_locked(const std::string& entity_id,
                                       ChangeOperation op,
                                       QJsonValue data,
                                       Timestamp at) {
    auto& entity = entities_[entity_id];
    entity.version += 1;
    entity.modified = at;
    entity.deleted = op == ChangeOperation::Delete;
    entity.data = entity.deleted ? QJsonValue() : data;

    auto change = Change(type_, entity_id, op, std::move(data), device_id_)
                      .with_timestamp(at)
                      .with_version(entity.version);
    entity.last = change;
    log_.push_back(change);
    return change;
}

Change MemoryDataSource::put(const std::string& entity_id, QJsonValue data) {
    return put(entity_id, std::move(data), Timestamp::now());
}

Change MemoryDataSource::put(const std::string& entity_id, QJsonValue data, Timestamp at) {
    std::lock_guard lock(mutex_);
    auto it = entities_.find(entity_id);
    const bool exists = it != entities_.end() && !it->second.deleted;
    return record_locked(entity_id,
                         exists ? ChangeOperation::Update : ChangeOperation::Create,
                         std::move(data), at);
}

Change MemoryDataSource::remove(const std::string& entity_id) {
    std::lock_guard lock(mutex_);
    return record_locked(entity_id, ChangeOperation::Delete, QJsonValue(), Timestamp::now());
}

std::optional<QJsonValue> MemoryDataSource::get(const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto it = entities_.find(entity_id);
    if (it == entities_.end() || it->second.deleted) {
        return std::nullopt;
    }
    return it->second.data;
}

size_t MemoryDataSource::size() const {
    std::lock_guard lock(mutex_);
    size_t live = 0;
    for (const auto& [id, entity] : entities_) {
        if (!entity.deleted) ++live;
    }
    return live;
}

void MemoryDataSource::fail_next_apply(SyncError error) {
    std::lock_guard lock(mutex_);
    apply_failure_ = std::move(error);
}

SyncResult<std::vector<Change>> MemoryDataSource::get_changes_since(Timestamp since) {
    std::lock_guard lock(mutex_);
    std::vector<Change> changes;
    for (const auto& change : log_) {
        if (change.timestamp() > since) {
            changes.push_back(change);
        }
    }
    return SyncResult<std::vector<Change>>::ok(std::move(changes));
}

SyncResult<size_t> MemoryDataSource::apply_changes(const std::vector<Change>& changes) {
    std::lock_guard lock(mutex_);
    if (apply_failure_) {
        auto error = std::move(*apply_failure_);
        apply_failure_.reset();
        return SyncResult<size_t>::err(std::move(error));
    }

    size_t applied = 0;
    for (const auto& change : changes) {
        if (change.data_type() != type_) {
            qCWarning(braidSyncLog) << "Ignoring" << sync::to_string(change.data_type()).c_str()
                                    << "change sent to" << sync_key_.c_str();
            continue;
        }
        auto& entity = entities_[change.entity_id()];
        entity.deleted = change.is_delete();
        entity.data = entity.deleted ? QJsonValue() : change.data();
        entity.modified = change.timestamp();
        entity.version = std::max(entity.version, change.version());
        entity.last = change;
        ++applied;
    }
    return SyncResult<size_t>::ok(applied);
}

std::string MemoryDataSource::get_sync_key() const {
    return sync_key_;
}

SyncResult<std::vector<Change>> MemoryDataSource::get_all_data() {
    std::lock_guard lock(mutex_);
    std::vector<Change> snapshot;
    for (const auto& [id, entity] : entities_) {
        if (entity.deleted || !entity.last) continue;
        snapshot.push_back(*entity.last);
    }
    return SyncResult<std::vector<Change>>::ok(std::move(snapshot));
}

SyncResult<void> MemoryDataSource::clear_sync_data() {
    std::lock_guard lock(mutex_);
    entities_.clear();
    log_.clear();
    return SyncResult<void>::ok();
}

} // namespace braid::sync

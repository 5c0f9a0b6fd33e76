#include "sync/offline_queue.hpp"
#include "core/logging.hpp"
#include "storage/offline_queue_repository.hpp"

namespace braid::sync {

namespace {

SyncError storage_error(const char* what, const Error& error) {
    return SyncError::storage(std::string(what) + ": " + error.message);
}

} // namespace

OfflineQueue::OfflineQueue(uint32_t max_attempts)
    : max_attempts_(max_attempts)
{
}

OfflineQueue::~OfflineQueue() = default;

SyncResult<void> OfflineQueue::attach(storage::Database& db) {
    auto store = std::make_unique<storage::OfflineQueueRepository>(db);
    auto loaded = store->load_all();
    if (loaded.is_err()) {
        return SyncResult<void>::err(storage_error("loading offline queue", loaded.unwrap_err()));
    }

    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
        auto result = store->append(entry);
        if (result.is_err()) {
            return SyncResult<void>::err(storage_error("persisting offline queue", result.unwrap_err()));
        }
    }

    auto& persisted = loaded.unwrap();
    entries_.insert(entries_.begin(),
                    std::make_move_iterator(persisted.begin()),
                    std::make_move_iterator(persisted.end()));
    store_ = std::move(store);
    qCDebug(braidSyncLog) << "Offline queue attached with" << entries_.size() << "entries";
    return SyncResult<void>::ok();
}

SyncResult<void> OfflineQueue::enqueue(Change change) {
    QueuedChange entry(std::move(change));
    std::lock_guard lock(mutex_);
    if (store_) {
        auto result = store_->append(entry);
        if (result.is_err()) {
            return SyncResult<void>::err(storage_error("enqueue", result.unwrap_err()));
        }
    }
    entries_.push_back(std::move(entry));
    return SyncResult<void>::ok();
}

SyncResult<std::vector<QueuedChange>> OfflineQueue::drain() {
    std::lock_guard lock(mutex_);
    std::vector<QueuedChange> drained(std::make_move_iterator(entries_.begin()),
                                      std::make_move_iterator(entries_.end()));
    entries_.clear();
    return SyncResult<std::vector<QueuedChange>>::ok(std::move(drained));
}

SyncResult<void> OfflineQueue::restore(std::vector<QueuedChange> entries) {
    if (entries.empty()) {
        return SyncResult<void>::ok();
    }
    std::lock_guard lock(mutex_);
    std::optional<Error> store_error;
    if (store_) {
        auto result = store_->prepend(entries);
        if (result.is_err()) {
            store_error = result.unwrap_err();
        }
    }
    entries_.insert(entries_.begin(),
                    std::make_move_iterator(entries.begin()),
                    std::make_move_iterator(entries.end()));
    if (store_error) {
        return SyncResult<void>::err(storage_error("restore", *store_error));
    }
    return SyncResult<void>::ok();
}

SyncResult<void> OfflineQueue::acknowledge(const std::vector<QueuedChange>& entries) {
    std::lock_guard lock(mutex_);
    if (store_) {
        auto result = store_->remove(entries);
        if (result.is_err()) {
            return SyncResult<void>::err(storage_error("acknowledge", result.unwrap_err()));
        }
    }
    return SyncResult<void>::ok();
}

SyncResult<void> OfflineQueue::clear() {
    std::lock_guard lock(mutex_);
    if (store_) {
        auto result = store_->remove_all();
        if (result.is_err()) {
            return SyncResult<void>::err(storage_error("clear", result.unwrap_err()));
        }
    }
    entries_.clear();
    return SyncResult<void>::ok();
}

size_t OfflineQueue::len() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool OfflineQueue::is_empty() const {
    std::lock_guard lock(mutex_);
    return entries_.empty();
}

std::map<SyncDataType, size_t> OfflineQueue::count_by_type() const {
    std::lock_guard lock(mutex_);
    std::map<SyncDataType, size_t> counts;
    for (const auto& entry : entries_) {
        ++counts[entry.change.data_type()];
    }
    return counts;
}

} // namespace braid::sync

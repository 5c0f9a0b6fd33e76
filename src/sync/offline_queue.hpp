#pragma once

#include "sync/error.hpp"
#include "sync/queued_change.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace braid::storage {
class Database;
class OfflineQueueRepository;
}

namespace braid::sync {

/**
 * OfflineQueue - FIFO of changes made while a cycle could not deliver them.
 *
 * Entries are never reordered or deduplicated. All operations take the
 * same mutex, so enqueue() is safe from any thread while the orchestrator
 * drains. When attached to a database enqueue(), restore() and clear() are
 * written through before they become visible in memory; drained entries
 * leave the database only through acknowledge().
 */
class OfflineQueue {
public:
    static constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 5;

    explicit OfflineQueue(uint32_t max_attempts = DEFAULT_MAX_ATTEMPTS);
    ~OfflineQueue();

    OfflineQueue(const OfflineQueue&) = delete;
    OfflineQueue& operator=(const OfflineQueue&) = delete;

    /**
     * Load persisted entries from `db` and write through from now on.
     * Entries already in memory are kept behind the loaded ones.
     */
    [[nodiscard]] SyncResult<void> attach(storage::Database& db);

    [[nodiscard]] SyncResult<void> enqueue(Change change);

    /**
     * Remove and return every entry, oldest first. Persisted rows stay on
     * disk until the entries are acknowledged, so a cycle that never
     * finishes replays them after a restart.
     */
    [[nodiscard]] SyncResult<std::vector<QueuedChange>> drain();

    /**
     * Put undelivered entries back ahead of anything enqueued since they
     * were drained, preserving their relative order. The entries are back
     * in memory even when writing them through fails.
     */
    [[nodiscard]] SyncResult<void> restore(std::vector<QueuedChange> entries);

    /**
     * Forget drained entries for good: delivered, or out of attempts.
     */
    [[nodiscard]] SyncResult<void> acknowledge(const std::vector<QueuedChange>& entries);

    [[nodiscard]] SyncResult<void> clear();

    [[nodiscard]] size_t len() const;
    [[nodiscard]] bool is_empty() const;
    [[nodiscard]] std::map<SyncDataType, size_t> count_by_type() const;

    [[nodiscard]] uint32_t max_attempts() const noexcept { return max_attempts_; }

private:
    mutable std::mutex mutex_;
    std::deque<QueuedChange> entries_;
    uint32_t max_attempts_;
    std::unique_ptr<storage::OfflineQueueRepository> store_;
};

} // namespace braid::sync

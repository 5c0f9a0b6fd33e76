#pragma once

#include "storage/database.hpp"
#include "sync/queued_change.hpp"
#include "core/result.hpp"
#include <vector>

namespace braid::storage {

/**
 * OfflineQueueRepository - durable backing for the offline queue.
 *
 * Rows are ordered by `position`; append() goes after the tail and
 * prepend() goes before the head, keeping the given order. Every write holds
 * the database write lock.
 */
class OfflineQueueRepository {
public:
    explicit OfflineQueueRepository(Database& db) : db_(db) {}

    /**
     * All entries in FIFO order. Rows whose change no longer decodes are
     * skipped with a warning.
     */
    [[nodiscard]] Result<std::vector<sync::QueuedChange>, Error> load_all();

    [[nodiscard]] Result<void, Error> append(const sync::QueuedChange& entry);

    /**
     * Insert or replace `entries` ahead of the current head.
     */
    [[nodiscard]] Result<void, Error> prepend(const std::vector<sync::QueuedChange>& entries);

    /**
     * Delete the rows of `entries`, matched by entry id.
     */
    [[nodiscard]] Result<void, Error> remove(const std::vector<sync::QueuedChange>& entries);

    [[nodiscard]] Result<void, Error> remove_all();

    [[nodiscard]] Result<int, Error> count();

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> insert(const sync::QueuedChange& entry, int64_t position);
    [[nodiscard]] Result<int64_t, Error> edge_position(const char* aggregate);
};

} // namespace braid::storage

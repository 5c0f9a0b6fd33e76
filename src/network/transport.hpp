#pragma once

#include "sync/account.hpp"
#include "sync/data_type.hpp"
#include "sync/error.hpp"
#include "sync/record.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace braid::network {

/**
 * DownloadBatch - records stored on the remote after a cursor.
 *
 * `cursor` is passed back on the next download to receive only newer
 * records. Records the transport could not decode are reported in
 * `rejected`, one error per record, and still advance the cursor.
 */
struct DownloadBatch {
    std::vector<sync::SyncRecord> records;
    std::vector<sync::SyncError> rejected;
    uint64_t cursor{0};
};

/**
 * SyncTransport - the one logical remote an account syncs with.
 *
 * Calls block until the remote answers. Timeouts and connection problems
 * are Network errors, a throttling remote answers RateLimited and an
 * invalid token is AuthFailed.
 */
class SyncTransport {
public:
    virtual ~SyncTransport() = default;

    [[nodiscard]] virtual sync::SyncResult<void> authenticate(
        const sync::SyncAccount& account,
        const sync::SyncAccountCredentials& credentials) = 0;

    /**
     * Store records for `type`. Records the remote already holds are
     * ignored; returns how many were new.
     */
    [[nodiscard]] virtual sync::SyncResult<size_t> upload(
        sync::SyncDataType type,
        const std::vector<sync::SyncRecord>& records) = 0;

    [[nodiscard]] virtual sync::SyncResult<DownloadBatch> download(
        sync::SyncDataType type,
        uint64_t after_cursor) = 0;
};

} // namespace braid::network

#pragma once

#include "core/types.hpp"
#include "sync/data_type.hpp"
#include "sync/error.hpp"
#include <QMetaType>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace braid::sync {

/**
 * SyncState - where the orchestrator is in a cycle.
 *
 * Idle -> Checking -> Uploading -> Downloading -> ResolvingConflicts -> Idle,
 * with Paused reachable from the in-progress states and Error from any.
 */
enum class SyncState {
    Idle,
    Checking,
    Uploading,
    Downloading,
    ResolvingConflicts,
    Paused,
    Error
};

[[nodiscard]] std::string to_string(SyncState state);

/**
 * TypeSyncStatus - outcome and bookkeeping for one data type.
 */
struct TypeSyncStatus {
    SyncDataType data_type{SyncDataType::Bookmarks};
    std::optional<Timestamp> last_sync;
    uint64_t pending_changes{0};
    bool is_enabled{true};
    uint64_t items_count{0};

    // Last cycle
    uint64_t changes_uploaded{0};
    uint64_t changes_downloaded{0};
    uint64_t conflicts_resolved{0};
    std::optional<SyncError> error;
    // Remote entities that could not be decrypted, decoded or validated.
    std::vector<SyncError> entity_errors;

    [[nodiscard]] bool succeeded() const noexcept { return !error.has_value(); }

    // Forget the previous cycle's counters and errors.
    void reset_cycle();
};

/**
 * SyncStatus - snapshot of the orchestrator for the UI.
 */
struct SyncStatus {
    SyncState state{SyncState::Idle};
    std::optional<Timestamp> last_sync;
    uint64_t pending_changes{0};
    uint64_t conflicts_detected{0};
    std::vector<TypeSyncStatus> type_status;
    std::optional<std::string> error_message;
    bool is_enabled{true};
    // 0..100 while a cycle is running.
    std::optional<uint8_t> progress;

    [[nodiscard]] bool is_syncing() const noexcept;
    [[nodiscard]] bool has_pending_changes() const noexcept { return pending_changes > 0; }

    /**
     * Entering any state but Error clears the error message.
     */
    void set_state(SyncState next);

    /**
     * Finish a cycle successfully.
     */
    void complete(Timestamp at);

    [[nodiscard]] TypeSyncStatus* find_type(SyncDataType type);
    [[nodiscard]] const TypeSyncStatus* find_type(SyncDataType type) const;
};

/**
 * SyncOperationResult - totals of one sync() call.
 */
struct SyncOperationResult {
    bool success{false};
    uint64_t changes_uploaded{0};
    uint64_t changes_downloaded{0};
    uint64_t conflicts_resolved{0};
    uint64_t duration_ms{0};
    std::optional<std::string> error_message;
    std::vector<TypeSyncStatus> type_results;
    // Set when the remote rate-limited the cycle.
    std::optional<uint64_t> retry_after_seconds;

    [[nodiscard]] static SyncOperationResult succeeded(uint64_t uploaded,
                                                       uint64_t downloaded,
                                                       uint64_t conflicts,
                                                       uint64_t duration_ms);
    [[nodiscard]] static SyncOperationResult failure(std::string message);

    [[nodiscard]] const TypeSyncStatus* find_type(SyncDataType type) const;
};

} // namespace braid::sync

Q_DECLARE_METATYPE(braid::sync::SyncState)
Q_DECLARE_METATYPE(braid::sync::SyncOperationResult)

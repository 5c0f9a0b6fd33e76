#include "sync/status.hpp"

#include <algorithm>

namespace braid::sync {

std::string to_string(SyncState state) {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::Checking: return "checking";
        case SyncState::Uploading: return "uploading";
        case SyncState::Downloading: return "downloading";
        case SyncState::ResolvingConflicts: return "resolving_conflicts";
        case SyncState::Paused: return "paused";
        case SyncState::Error: return "error";
    }
    return "unknown";
}

void TypeSyncStatus::reset_cycle() {
    changes_uploaded = 0;
    changes_downloaded = 0;
    conflicts_resolved = 0;
    error.reset();
    entity_errors.clear();
}

bool SyncStatus::is_syncing() const noexcept {
    switch (state) {
        case SyncState::Checking:
        case SyncState::Uploading:
        case SyncState::Downloading:
        case SyncState::ResolvingConflicts:
            return true;
        case SyncState::Idle:
        case SyncState::Paused:
        case SyncState::Error:
            break;
    }
    return false;
}

void SyncStatus::set_state(SyncState next) {
    state = next;
    if (next != SyncState::Error) {
        error_message.reset();
    }
}

void SyncStatus::complete(Timestamp at) {
    set_state(SyncState::Idle);
    last_sync = at;
    progress.reset();
}

TypeSyncStatus* SyncStatus::find_type(SyncDataType type) {
    auto it = std::find_if(type_status.begin(), type_status.end(),
                           [type](const TypeSyncStatus& s) { return s.data_type == type; });
    return it == type_status.end() ? nullptr : &*it;
}

const TypeSyncStatus* SyncStatus::find_type(SyncDataType type) const {
    auto it = std::find_if(type_status.begin(), type_status.end(),
                           [type](const TypeSyncStatus& s) { return s.data_type == type; });
    return it == type_status.end() ? nullptr : &*it;
}

SyncOperationResult SyncOperationResult::succeeded(uint64_t uploaded,
                                                   uint64_t downloaded,
                                                   uint64_t conflicts,
                                                   uint64_t duration_ms) {
    SyncOperationResult result;
    result.success = true;
    result.changes_uploaded = uploaded;
    result.changes_downloaded = downloaded;
    result.conflicts_resolved = conflicts;
    result.duration_ms = duration_ms;
    return result;
}

SyncOperationResult SyncOperationResult::failure(std::string message) {
    SyncOperationResult result;
    result.error_message = std::move(message);
    return result;
}

const TypeSyncStatus* SyncOperationResult::find_type(SyncDataType type) const {
    auto it = std::find_if(type_results.begin(), type_results.end(),
                           [type](const TypeSyncStatus& s) { return s.data_type == type; });
    return it == type_results.end() ? nullptr : &*it;
}

} // namespace braid::sync

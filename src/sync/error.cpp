#include "sync/error.hpp"

namespace braid::sync {

namespace {
SyncError make(SyncError::Kind kind, std::string message) {
    SyncError e;
    e.kind = kind;
    e.message = std::move(message);
    return e;
}
} // namespace

SyncError SyncError::not_logged_in() {
    return make(Kind::NotLoggedIn, "Not logged in to sync account");
}

SyncError SyncError::network(std::string message) {
    return make(Kind::Network, std::move(message));
}

SyncError SyncError::server(std::string message) {
    return make(Kind::ServerError, std::move(message));
}

SyncError SyncError::auth_failed(std::string message) {
    return make(Kind::AuthFailed, std::move(message));
}

SyncError SyncError::conflict(std::string entity_id, std::string reason) {
    auto e = make(Kind::ConflictError, std::move(reason));
    e.entity_id = std::move(entity_id);
    return e;
}

SyncError SyncError::encryption(std::string message) {
    return make(Kind::EncryptionError, std::move(message));
}

SyncError SyncError::serialization(std::string message) {
    return make(Kind::SerializationError, std::move(message));
}

SyncError SyncError::invalid_data(std::string message) {
    return make(Kind::InvalidData, std::move(message));
}

SyncError SyncError::rate_limited(uint64_t retry_after_seconds) {
    auto e = make(Kind::RateLimited, "Rate limited");
    e.retry_after_seconds = retry_after_seconds;
    return e;
}

SyncError SyncError::sync_in_progress() {
    return make(Kind::SyncInProgress, "Sync already in progress");
}

SyncError SyncError::type_not_enabled(SyncDataType type) {
    return make(Kind::TypeNotEnabled,
                "Data type " + sync::to_string(type) + " is not enabled for sync");
}

SyncError SyncError::storage(std::string message) {
    return make(Kind::StorageError, std::move(message));
}

SyncError SyncError::internal(std::string message) {
    return make(Kind::Internal, std::move(message));
}

SyncError SyncError::for_entity(std::string id) const {
    auto copy = *this;
    copy.entity_id = std::move(id);
    return copy;
}

bool SyncError::is_retryable() const noexcept {
    return kind == Kind::Network || kind == Kind::ServerError || kind == Kind::RateLimited;
}

bool SyncError::aborts_cycle() const noexcept {
    return kind == Kind::NotLoggedIn || kind == Kind::AuthFailed ||
           kind == Kind::SyncInProgress;
}

std::string SyncError::to_string() const {
    switch (kind) {
        case Kind::NotLoggedIn:
        case Kind::SyncInProgress:
        case Kind::TypeNotEnabled:
            return message;
        case Kind::Network: return "Network error: " + message;
        case Kind::ServerError: return "Server error: " + message;
        case Kind::AuthFailed: return "Authentication failed: " + message;
        case Kind::ConflictError:
            return "Unresolvable conflict for entity " + entity_id + ": " + message;
        case Kind::EncryptionError: return "Encryption error: " + message;
        case Kind::SerializationError: return "Serialization error: " + message;
        case Kind::InvalidData: return "Invalid data: " + message;
        case Kind::RateLimited:
            return "Rate limited, retry after " + std::to_string(retry_after_seconds) + " seconds";
        case Kind::StorageError: return "Storage error: " + message;
        case Kind::Internal: return "Internal error: " + message;
    }
    return message;
}

const char* kind_name(SyncError::Kind kind) {
    switch (kind) {
        case SyncError::Kind::NotLoggedIn: return "not_logged_in";
        case SyncError::Kind::Network: return "network";
        case SyncError::Kind::ServerError: return "server_error";
        case SyncError::Kind::AuthFailed: return "auth_failed";
        case SyncError::Kind::ConflictError: return "conflict_error";
        case SyncError::Kind::EncryptionError: return "encryption_error";
        case SyncError::Kind::SerializationError: return "serialization_error";
        case SyncError::Kind::InvalidData: return "invalid_data";
        case SyncError::Kind::RateLimited: return "rate_limited";
        case SyncError::Kind::SyncInProgress: return "sync_in_progress";
        case SyncError::Kind::TypeNotEnabled: return "type_not_enabled";
        case SyncError::Kind::StorageError: return "storage_error";
        case SyncError::Kind::Internal: return "internal";
    }
    return "unknown";
}

} // namespace braid::sync

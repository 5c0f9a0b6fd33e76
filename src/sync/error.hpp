#pragma once

#include "core/result.hpp"
#include "sync/data_type.hpp"
#include <cstdint>
#include <string>

namespace braid::sync {

/**
 * SyncError - typed failure reported by the sync core.
 *
 * Kinds fall into three groups:
 * - cycle level (NotLoggedIn, AuthFailed, SyncInProgress) abort a whole cycle;
 * - retryable (Network, ServerError, RateLimited) may be retried by the caller;
 * - everything else is scoped to one data type or one entity.
 */
struct SyncError {
    enum class Kind {
        NotLoggedIn,
        Network,
        ServerError,
        AuthFailed,
        ConflictError,
        EncryptionError,
        SerializationError,
        InvalidData,
        RateLimited,
        SyncInProgress,
        TypeNotEnabled,
        StorageError,
        Internal
    };

    Kind kind{Kind::Internal};
    std::string message;
    // Set for ConflictError and for per-entity corruption reports.
    std::string entity_id;
    uint64_t retry_after_seconds{0};

    [[nodiscard]] static SyncError not_logged_in();
    [[nodiscard]] static SyncError network(std::string message);
    [[nodiscard]] static SyncError server(std::string message);
    [[nodiscard]] static SyncError auth_failed(std::string message);
    [[nodiscard]] static SyncError conflict(std::string entity_id, std::string reason);
    [[nodiscard]] static SyncError encryption(std::string message);
    [[nodiscard]] static SyncError serialization(std::string message);
    [[nodiscard]] static SyncError invalid_data(std::string message);
    [[nodiscard]] static SyncError rate_limited(uint64_t retry_after_seconds);
    [[nodiscard]] static SyncError sync_in_progress();
    [[nodiscard]] static SyncError type_not_enabled(SyncDataType type);
    [[nodiscard]] static SyncError storage(std::string message);
    [[nodiscard]] static SyncError internal(std::string message);

    /**
     * Returns a copy tagged with the entity it concerns.
     */
    [[nodiscard]] SyncError for_entity(std::string id) const;

    [[nodiscard]] bool is_retryable() const noexcept;

    // Kinds that stop the whole cycle rather than a single type.
    [[nodiscard]] bool aborts_cycle() const noexcept;

    /**
     * Human readable description, suitable for status messages.
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SyncError&) const = default;
};

[[nodiscard]] const char* kind_name(SyncError::Kind kind);

template<typename T>
using SyncResult = Result<T, SyncError>;

} // namespace braid::sync

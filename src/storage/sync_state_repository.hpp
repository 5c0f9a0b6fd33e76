#pragma once

#include "storage/database.hpp"
#include "sync/change.hpp"
#include "sync/data_type.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace braid::storage {

/**
 * TypeState - how far one data type has synchronized.
 */
struct TypeState {
    std::optional<Timestamp> last_sync;
    // Position in the remote log after the last applied download.
    uint64_t remote_cursor{0};

    bool operator==(const TypeState&) const = default;
};

/**
 * SyncStateRepository - per-type progress and entity heads.
 *
 * An entity head is the last change known for an entity, whether it was
 * made here or downloaded; incoming changes are ordered against it.
 */
class SyncStateRepository {
public:
    explicit SyncStateRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<TypeState, Error> load_type_state(sync::SyncDataType type);

    [[nodiscard]] Result<std::map<std::string, sync::Change>, Error> load_heads(
        sync::SyncDataType type);

    /**
     * Store the outcome of one type's cycle atomically: the new progress
     * and every head that changed.
     */
    [[nodiscard]] Result<void, Error> commit_cycle(sync::SyncDataType type,
                                                   const TypeState& state,
                                                   const std::vector<sync::Change>& heads);

    /**
     * Forget all progress and heads (logout).
     */
    [[nodiscard]] Result<void, Error> clear_all();

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> save_type_state(sync::SyncDataType type,
                                                      const TypeState& state);
    [[nodiscard]] Result<void, Error> save_head(const sync::Change& head);
};

} // namespace braid::storage

#include "storage/sync_state_repository.hpp"
#include "core/logging.hpp"

#include <QByteArray>

namespace braid::storage {

Result<TypeState, Error> SyncStateRepository::load_type_state(sync::SyncDataType type) {
    auto stmt_result = db_.prepare(
        "SELECT last_sync, remote_cursor FROM sync_type_state WHERE data_type = ?;");
    if (stmt_result.is_err()) {
        return Result<TypeState, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, sync::to_string(type));
    if (bound.is_err()) {
        return Result<TypeState, Error>::err(bound.unwrap_err());
    }

    auto step = stmt.step();
    if (step.is_err()) {
        return Result<TypeState, Error>::err(step.unwrap_err());
    }

    TypeState state;
    if (step.unwrap()) {
        if (auto millis = stmt.column_optional_int64(0)) {
            state.last_sync = Timestamp(*millis);
        }
        state.remote_cursor = static_cast<uint64_t>(stmt.column_int64(1));
    }
    return Result<TypeState, Error>::ok(state);
}

Result<std::map<std::string, sync::Change>, Error> SyncStateRepository::load_heads(
    sync::SyncDataType type) {
    using R = Result<std::map<std::string, sync::Change>, Error>;

    auto stmt_result = db_.prepare(
        "SELECT entity_id, change_json FROM sync_entity_heads WHERE data_type = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, sync::to_string(type));
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    std::map<std::string, sync::Change> heads;
    while (true) {
        auto step = stmt.step();
        if (step.is_err()) {
            return R::err(step.unwrap_err());
        }
        if (!step.unwrap()) break;

        const auto entity_id = stmt.column_text(0);
        auto change = sync::deserialize_change(QByteArray::fromStdString(stmt.column_text(1)));
        if (change.is_err()) {
            // The head is only a comparison point; the next change rewrites it.
            qCWarning(braidStorageLog) << "Dropping unreadable head for" << entity_id.c_str()
                                       << ":" << change.unwrap_err().to_string().c_str();
            continue;
        }
        heads.emplace(entity_id, std::move(change).unwrap());
    }
    return R::ok(std::move(heads));
}

Result<void, Error> SyncStateRepository::save_type_state(sync::SyncDataType type,
                                                         const TypeState& state) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO sync_type_state (data_type, last_sync, remote_cursor)
        VALUES (?, ?, ?)
        ON CONFLICT(data_type) DO UPDATE SET
            last_sync = excluded.last_sync,
            remote_cursor = excluded.remote_cursor;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    std::optional<int64_t> last_sync;
    if (state.last_sync) {
        last_sync = state.last_sync->millis();
    }
    auto bound = stmt.bind_text(1, sync::to_string(type))
        .and_then([&] { return stmt.bind_optional_int64(2, last_sync); })
        .and_then([&] { return stmt.bind_int64(3, static_cast<int64_t>(state.remote_cursor)); });
    if (bound.is_err()) {
        return bound;
    }

    auto step = stmt.step();
    if (step.is_err()) {
        return Result<void, Error>::err(step.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SyncStateRepository::save_head(const sync::Change& head) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO sync_entity_heads (data_type, entity_id, change_json)
        VALUES (?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto json = sync::serialize_change(head).toStdString();
    auto bound = stmt.bind_text(1, sync::to_string(head.data_type()))
        .and_then([&] { return stmt.bind_text(2, head.entity_id()); })
        .and_then([&] { return stmt.bind_text(3, json); });
    if (bound.is_err()) {
        return bound;
    }

    auto step = stmt.step();
    if (step.is_err()) {
        return Result<void, Error>::err(step.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SyncStateRepository::commit_cycle(sync::SyncDataType type,
                                                      const TypeState& state,
                                                      const std::vector<sync::Change>& heads) {
    TransactionGuard guard(db_);
    if (!guard.is_active()) {
        return guard.begin_result();
    }

    for (const auto& head : heads) {
        auto result = save_head(head);
        if (result.is_err()) {
            return result;
        }
    }
    auto result = save_type_state(type, state);
    if (result.is_err()) {
        return result;
    }
    return guard.commit();
}

Result<void, Error> SyncStateRepository::clear_all() {
    return db_.transaction([&]() -> Result<void, Error> {
        auto result = db_.execute("DELETE FROM sync_entity_heads;");
        if (result.is_err()) {
            return result;
        }
        return db_.execute("DELETE FROM sync_type_state;");
    });
}

} // namespace braid::storage

#include "storage/offline_queue_repository.hpp"
#include "core/logging.hpp"

#include <QByteArray>

namespace braid::storage {

Result<std::vector<sync::QueuedChange>, Error> OfflineQueueRepository::load_all() {
    using R = Result<std::vector<sync::QueuedChange>, Error>;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, change_json, queued_at, attempts, last_error
        FROM offline_queue ORDER BY position ASC;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    std::vector<sync::QueuedChange> entries;
    while (true) {
        auto step = stmt.step();
        if (step.is_err()) {
            return R::err(step.unwrap_err());
        }
        if (!step.unwrap()) break;

        const auto id_text = stmt.column_text(0);
        const auto json = stmt.column_text(1);
        auto change = sync::deserialize_change(QByteArray::fromStdString(json));
        const auto id = Uuid::parse(id_text);
        if (change.is_err() || !id) {
            qCWarning(braidStorageLog) << "Skipping unreadable offline queue row" << id_text.c_str();
            continue;
        }

        sync::QueuedChange entry(std::move(change).unwrap());
        entry.id = *id;
        entry.queued_at = Timestamp(stmt.column_int64(2));
        entry.attempts = static_cast<uint32_t>(stmt.column_int64(3));
        entry.last_error = stmt.column_optional_text(4);
        entries.push_back(std::move(entry));
    }
    return R::ok(std::move(entries));
}

Result<int64_t, Error> OfflineQueueRepository::edge_position(const char* aggregate) {
    auto stmt_result = db_.prepare(
        std::string("SELECT COALESCE(") + aggregate + "(position), 0) FROM offline_queue;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step = stmt.step();
    if (step.is_err()) {
        return Result<int64_t, Error>::err(step.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

Result<void, Error> OfflineQueueRepository::insert(const sync::QueuedChange& entry,
                                                   int64_t position) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO offline_queue
            (id, position, data_type, change_json, queued_at, attempts, last_error)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    const auto json = sync::serialize_change(entry.change).toStdString();
    auto bound = stmt.bind_text(1, entry.id.to_string())
        .and_then([&] { return stmt.bind_int64(2, position); })
        .and_then([&] { return stmt.bind_text(3, sync::to_string(entry.change.data_type())); })
        .and_then([&] { return stmt.bind_text(4, json); })
        .and_then([&] { return stmt.bind_int64(5, entry.queued_at.millis()); })
        .and_then([&] { return stmt.bind_int64(6, entry.attempts); })
        .and_then([&] { return stmt.bind_optional_text(7, entry.last_error); });
    if (bound.is_err()) {
        return bound;
    }

    auto step = stmt.step();
    if (step.is_err()) {
        return Result<void, Error>::err(step.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> OfflineQueueRepository::append(const sync::QueuedChange& entry) {
    auto lock = db_.lock_writes();
    auto tail = edge_position("MAX");
    if (tail.is_err()) {
        return Result<void, Error>::err(tail.unwrap_err());
    }
    return insert(entry, tail.unwrap() + 1);
}

Result<void, Error> OfflineQueueRepository::prepend(
    const std::vector<sync::QueuedChange>& entries) {
    if (entries.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        auto head = edge_position("MIN");
        if (head.is_err()) {
            return Result<void, Error>::err(head.unwrap_err());
        }
        int64_t position = head.unwrap() - static_cast<int64_t>(entries.size());
        for (const auto& entry : entries) {
            auto result = insert(entry, position++);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> OfflineQueueRepository::remove(
    const std::vector<sync::QueuedChange>& entries) {
    if (entries.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& entry : entries) {
            auto stmt_result = db_.prepare("DELETE FROM offline_queue WHERE id = ?;");
            if (stmt_result.is_err()) {
                return Result<void, Error>::err(stmt_result.unwrap_err());
            }
            auto stmt = std::move(stmt_result).unwrap();
            auto bound = stmt.bind_text(1, entry.id.to_string());
            if (bound.is_err()) {
                return bound;
            }
            auto step = stmt.step();
            if (step.is_err()) {
                return Result<void, Error>::err(step.unwrap_err());
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> OfflineQueueRepository::remove_all() {
    auto lock = db_.lock_writes();
    return db_.execute("DELETE FROM offline_queue;");
}

Result<int, Error> OfflineQueueRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM offline_queue;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step = stmt.step();
    if (step.is_err()) {
        return Result<int, Error>::err(step.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

} // namespace braid::storage

#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "sync/offline_queue.hpp"

#include <QJsonObject>
#include <QTemporaryDir>
#include <atomic>
#include <thread>

using namespace braid;
using namespace braid::sync;

namespace {

Change change_for(SyncDataType type, const std::string& entity) {
    return Change(type, entity, ChangeOperation::Update, QJsonObject{{"entity", QString::fromStdString(entity)}},
                  "device-a");
}

std::vector<std::string> entity_ids(const std::vector<QueuedChange>& entries) {
    std::vector<std::string> ids;
    for (const auto& entry : entries) {
        ids.push_back(entry.change.entity_id());
    }
    return ids;
}

} // namespace

TEST_CASE("QueuedChange bookkeeping", "[offline_queue]") {
    QueuedChange entry(change_for(SyncDataType::Bookmarks, "a"));
    REQUIRE(entry.attempts == 0);
    REQUIRE(entry.should_retry(3));

    entry.mark_failed("timeout");
    entry.mark_failed("timeout again");
    REQUIRE(entry.attempts == 2);
    REQUIRE(entry.last_error == std::optional<std::string>("timeout again"));
    REQUIRE(entry.should_retry(3));

    entry.mark_failed("gone");
    REQUIRE_FALSE(entry.should_retry(3));
}

TEST_CASE("OfflineQueue in memory", "[offline_queue]") {
    OfflineQueue queue;
    REQUIRE(queue.is_empty());
    REQUIRE(queue.max_attempts() == OfflineQueue::DEFAULT_MAX_ATTEMPTS);

    REQUIRE(queue.enqueue(change_for(SyncDataType::Bookmarks, "a")).is_ok());
    REQUIRE(queue.enqueue(change_for(SyncDataType::History, "b")).is_ok());
    REQUIRE(queue.enqueue(change_for(SyncDataType::Bookmarks, "c")).is_ok());

    REQUIRE(queue.len() == 3);
    auto counts = queue.count_by_type();
    REQUIRE(counts[SyncDataType::Bookmarks] == 2);
    REQUIRE(counts[SyncDataType::History] == 1);
    REQUIRE_FALSE(counts.contains(SyncDataType::Passwords));

    SECTION("Drain returns everything in FIFO order and empties the queue") {
        auto drained = queue.drain().unwrap();
        REQUIRE(entity_ids(drained) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(queue.is_empty());
        REQUIRE(queue.drain().unwrap().empty());
    }

    SECTION("Restore goes ahead of newer entries") {
        auto drained = queue.drain().unwrap();
        REQUIRE(queue.enqueue(change_for(SyncDataType::Bookmarks, "d")).is_ok());
        REQUIRE(queue.restore(std::move(drained)).is_ok());
        REQUIRE(entity_ids(queue.drain().unwrap()) ==
                std::vector<std::string>{"a", "b", "c", "d"});
    }

    SECTION("Duplicates are kept") {
        const auto change = change_for(SyncDataType::Bookmarks, "a");
        REQUIRE(queue.enqueue(change).is_ok());
        REQUIRE(queue.enqueue(change).is_ok());
        REQUIRE(queue.len() == 5);
    }

    SECTION("Clear") {
        REQUIRE(queue.clear().is_ok());
        REQUIRE(queue.len() == 0);
    }
}

TEST_CASE("OfflineQueue accepts changes from several threads", "[offline_queue]") {
    OfflineQueue queue;
    std::atomic<int> failures{0};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&queue, &failures, t] {
            for (int i = 0; i < 50; ++i) {
                auto result = queue.enqueue(change_for(SyncDataType::History,
                                                       std::to_string(t) + "-" + std::to_string(i)));
                if (result.is_err()) ++failures;
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    REQUIRE(failures == 0);
    REQUIRE(queue.len() == 200);
}

TEST_CASE("OfflineQueue persists through the database", "[offline_queue]") {
    auto db = storage::Database::open_memory().unwrap();
    REQUIRE(storage::initialize_database(db).is_ok());

    {
        OfflineQueue queue;
        REQUIRE(queue.attach(db).is_ok());
        REQUIRE(queue.enqueue(change_for(SyncDataType::Bookmarks, "a")).is_ok());
        REQUIRE(queue.enqueue(change_for(SyncDataType::Passwords, "b")).is_ok());

        auto drained = queue.drain().unwrap();
        drained[0].mark_failed("server error");
        REQUIRE(queue.enqueue(change_for(SyncDataType::Bookmarks, "c")).is_ok());
        REQUIRE(queue.restore(std::move(drained)).is_ok());
    }

    SECTION("A new queue sees the same entries") {
        OfflineQueue reopened;
        REQUIRE(reopened.enqueue(change_for(SyncDataType::History, "pending")).is_ok());
        REQUIRE(reopened.attach(db).is_ok());

        auto entries = reopened.drain().unwrap();
        REQUIRE(entity_ids(entries) == std::vector<std::string>{"a", "b", "c", "pending"});
        REQUIRE(entries[0].attempts == 1);
        REQUIRE(entries[0].last_error == std::optional<std::string>("server error"));
    }

    SECTION("Drained entries stay persisted until acknowledged") {
        OfflineQueue reopened;
        REQUIRE(reopened.attach(db).is_ok());
        auto drained = reopened.drain().unwrap();
        REQUIRE(drained.size() == 3);

        OfflineQueue before_ack;
        REQUIRE(before_ack.attach(db).is_ok());
        REQUIRE(before_ack.len() == 3);

        REQUIRE(reopened.acknowledge({drained[0], drained[2]}).is_ok());
        OfflineQueue after_ack;
        REQUIRE(after_ack.attach(db).is_ok());
        REQUIRE(entity_ids(after_ack.drain().unwrap()) == std::vector<std::string>{"b"});
    }
}

TEST_CASE("Drained entries survive a restart before restore", "[offline_queue]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("queue.db")).toStdString();

    std::vector<QueuedChange> drained;
    {
        auto db = storage::Database::open(path).unwrap();
        REQUIRE(storage::initialize_database(db).is_ok());
        OfflineQueue queue;
        REQUIRE(queue.attach(db).is_ok());
        REQUIRE(queue.enqueue(change_for(SyncDataType::Bookmarks, "a")).is_ok());
        REQUIRE(queue.enqueue(change_for(SyncDataType::History, "b")).is_ok());
        drained = queue.drain().unwrap();
        REQUIRE(queue.is_empty());
    }

    auto db = storage::Database::open(path).unwrap();
    REQUIRE(storage::initialize_database(db).is_ok());
    OfflineQueue queue;
    REQUIRE(queue.attach(db).is_ok());
    REQUIRE(queue.len() == 2);

    SECTION("Restoring the same entries does not duplicate them") {
        auto again = queue.drain().unwrap();
        REQUIRE(entity_ids(again) == std::vector<std::string>{"a", "b"});
        again[0].mark_failed("offline");
        REQUIRE(queue.restore(std::move(again)).is_ok());

        OfflineQueue reopened;
        REQUIRE(reopened.attach(db).is_ok());
        auto entries = reopened.drain().unwrap();
        REQUIRE(entity_ids(entries) == std::vector<std::string>{"a", "b"});
        REQUIRE(entries[0].id == drained[0].id);
        REQUIRE(entries[0].attempts == 1);
    }

    SECTION("Acknowledged entries are gone") {
        REQUIRE(queue.acknowledge(queue.drain().unwrap()).is_ok());
        OfflineQueue reopened;
        REQUIRE(reopened.attach(db).is_ok());
        REQUIRE(reopened.is_empty());
    }
}

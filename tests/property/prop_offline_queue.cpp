#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/offline_queue.hpp"

#include <QJsonObject>

using namespace braid;
using namespace braid::sync;

namespace {

Change numbered_change(int n) {
    return Change(SyncDataType::History, "h-" + std::to_string(n), ChangeOperation::Create,
                  QJsonObject{{"n", n}}, "device-a");
}

std::vector<std::string> entity_ids(const std::vector<QueuedChange>& entries) {
    std::vector<std::string> ids;
    for (const auto& entry : entries) {
        ids.push_back(entry.change.entity_id());
    }
    return ids;
}

std::vector<std::string> numbered_ids(int from, int to) {
    std::vector<std::string> ids;
    for (int n = from; n < to; ++n) {
        ids.push_back("h-" + std::to_string(n));
    }
    return ids;
}

} // namespace

TEST_CASE("Property: the queue is first in first out", "[property][offline_queue]") {
    REQUIRE(rc::check("drain returns entries in enqueue order",
        [] {
            const auto count = *rc::gen::inRange(0, 40);
            OfflineQueue queue;
            for (int n = 0; n < count; ++n) {
                RC_ASSERT(queue.enqueue(numbered_change(n)).is_ok());
            }
            RC_ASSERT(queue.len() == static_cast<size_t>(count));

            auto drained = queue.drain();
            RC_ASSERT(drained.is_ok());
            RC_ASSERT(entity_ids(drained.unwrap()) == numbered_ids(0, count));
            RC_ASSERT(queue.is_empty());
        }));
}

TEST_CASE("Property: restored entries go ahead of newer ones", "[property][offline_queue]") {
    REQUIRE(rc::check("restore keeps order and precedes later enqueues",
        [] {
            const auto drained_count = *rc::gen::inRange(1, 20);
            const auto later_count = *rc::gen::inRange(0, 20);
            OfflineQueue queue;
            for (int n = 0; n < drained_count; ++n) {
                RC_ASSERT(queue.enqueue(numbered_change(n)).is_ok());
            }
            auto drained = queue.drain().unwrap();

            for (int n = drained_count; n < drained_count + later_count; ++n) {
                RC_ASSERT(queue.enqueue(numbered_change(n)).is_ok());
            }
            for (auto& entry : drained) {
                entry.mark_failed("offline");
            }
            RC_ASSERT(queue.restore(std::move(drained)).is_ok());

            auto all = queue.drain().unwrap();
            RC_ASSERT(entity_ids(all) == numbered_ids(0, drained_count + later_count));
            for (int n = 0; n < drained_count; ++n) {
                RC_ASSERT(all[n].attempts == 1u);
            }
            for (int n = drained_count; n < drained_count + later_count; ++n) {
                RC_ASSERT(all[n].attempts == 0u);
            }
        }));
}

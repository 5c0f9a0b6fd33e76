#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/conflict.hpp"

#include <QJsonObject>
#include <map>

using namespace braid;
using namespace braid::sync;

namespace {

const std::vector<std::string> kFields{"title", "url", "folder", "tags", "position"};

rc::Gen<Change> gen_change(std::string entity_id, std::string device_id) {
    return rc::gen::apply(
        [entity_id, device_id](int64_t ms, uint64_t version, std::map<std::string, int> fields) {
            QJsonObject data;
            for (const auto& [key, value] : fields) {
                data.insert(QString::fromStdString(key), value);
            }
            return Change(SyncDataType::Bookmarks, entity_id, ChangeOperation::Update, data, device_id)
                .with_timestamp(Timestamp(ms))
                .with_version(version);
        },
        rc::gen::inRange<int64_t>(1'600'000'000'000, 1'600'000'100'000),
        rc::gen::inRange<uint64_t>(1, 20),
        rc::gen::container<std::map<std::string, int>>(rc::gen::elementOf(kFields),
                                                       rc::gen::arbitrary<int>()));
}

} // namespace

TEST_CASE("Property: last write wins picks the greater sort key", "[property][conflict]") {
    REQUIRE(rc::check("last_write_wins(a, b) is the later change on either side",
        [] {
            const auto a = *gen_change("bm-1", "device-a");
            const auto b = *gen_change("bm-1", "device-b");
            RC_PRE(a.sort_key() != b.sort_key());

            const auto& expected = a.sort_key() > b.sort_key() ? a : b;
            RC_ASSERT(last_write_wins(a, b) == expected);
            RC_ASSERT(last_write_wins(b, a) == expected);
        }));
}

TEST_CASE("Property: resolution is deterministic", "[property][conflict]") {
    REQUIRE(rc::check("resolving the same pair twice gives the same change",
        [] {
            const auto strategy = *rc::gen::element(ConflictStrategy::LastWriteWins,
                                                    ConflictStrategy::LocalWins,
                                                    ConflictStrategy::RemoteWins,
                                                    ConflictStrategy::Merge,
                                                    ConflictStrategy::KeepBoth);
            const ConflictResolution resolver(strategy);
            const auto local = *gen_change("bm-1", "device-a");
            const auto remote = *gen_change("bm-1", "device-b");

            RC_ASSERT(resolver.resolve(local, remote) == resolver.resolve(local, remote));

            Conflict conflict(local, remote);
            const auto first = conflict.resolve(resolver);
            RC_ASSERT(conflict.resolve(ConflictResolution(ConflictStrategy::RemoteWins)) == first);
        }));
}

TEST_CASE("Property: merge keeps every field", "[property][conflict]") {
    REQUIRE(rc::check("merged data is the union with the newer side winning shared fields",
        [] {
            const auto a = *gen_change("bm-1", "device-a");
            const auto b = *gen_change("bm-1", "device-b");
            RC_PRE(a.timestamp() != b.timestamp());

            const auto merged = merge_changes(a, b).data().toObject();
            const auto& newer = a.timestamp() > b.timestamp() ? a : b;
            const auto& older = a.timestamp() > b.timestamp() ? b : a;

            for (const auto& key : older.data().toObject().keys()) {
                RC_ASSERT(merged.contains(key));
            }
            const auto overlay = newer.data().toObject();
            for (auto it = overlay.begin(); it != overlay.end(); ++it) {
                RC_ASSERT(merged.value(it.key()) == it.value());
            }
        }));
}

TEST_CASE("Property: both sides of a merge agree", "[property][conflict]") {
    REQUIRE(rc::check("merge_changes(a, b) and merge_changes(b, a) describe the same change",
        [] {
            const auto a = *gen_change("bm-1", "device-a");
            const auto b = *gen_change("bm-1", "device-b");
            RC_PRE(a.timestamp() != b.timestamp());

            const auto ab = merge_changes(a, b);
            const auto ba = merge_changes(b, a);
            RC_ASSERT(ab.id() == ba.id());
            RC_ASSERT(ab.data() == ba.data());
            RC_ASSERT(ab.timestamp() == ba.timestamp());
            RC_ASSERT(ab.version() == ba.version());
            RC_ASSERT(ab.id() != a.id());
            RC_ASSERT(ab.id() != b.id());
        }));
}

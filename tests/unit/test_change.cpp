#include <catch2/catch_test_macros.hpp>
#include "sync/change.hpp"
#include "sync/data_type.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace braid;
using namespace braid::sync;

namespace {

Change sample() {
    return Change(SyncDataType::Bookmarks, "bm-1", ChangeOperation::Create,
                  QJsonObject{{"title", "Docs"}, {"url", "https://example.com"}}, "device-a")
        .with_timestamp(Timestamp(1'714'566'600'125))
        .with_version(3);
}

} // namespace

TEST_CASE("Uuid parse and format", "[types]") {
    auto id = Uuid::generate();
    REQUIRE_FALSE(id.is_nil());
    REQUIRE(Uuid::parse(id.to_string()) == id);

    auto parsed = Uuid::parse("6F9619FF8B86D011B42D00C04FC964FF");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->to_string() == "6f9619ff-8b86-d011-b42d-00c04fc964ff");

    REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
    REQUIRE_FALSE(Uuid::parse("6f9619ff-8b86-d011-b42d-00c04fc964f").has_value());
}

TEST_CASE("Timestamp ISO form", "[types]") {
    const Timestamp ts(1'714'566'600'125);
    REQUIRE(ts.to_iso_string() == "2024-05-01T12:30:00.125Z");
    REQUIRE(Timestamp::parse_iso("2024-05-01T12:30:00.125Z") == ts);
    REQUIRE_FALSE(Timestamp::parse_iso("yesterday").has_value());
    REQUIRE(ts + std::chrono::seconds(1) - ts == std::chrono::milliseconds(1000));
}

TEST_CASE("Data type names and priorities", "[data_type]") {
    REQUIRE(all_data_types().size() == 5);
    for (auto type : all_data_types()) {
        REQUIRE(parse_data_type(to_string(type)) == type);
    }
    REQUIRE(to_string(SyncDataType::OpenTabs) == "open_tabs");
    REQUIRE_FALSE(parse_data_type("OpenTabs").has_value());

    REQUIRE(requires_encryption(SyncDataType::Passwords));
    REQUIRE(requires_encryption(SyncDataType::Settings));
    REQUIRE_FALSE(requires_encryption(SyncDataType::History));

    auto ordered = sorted_by_priority({SyncDataType::History, SyncDataType::Bookmarks,
                                       SyncDataType::Settings, SyncDataType::Bookmarks,
                                       SyncDataType::Passwords});
    REQUIRE(ordered == std::vector<SyncDataType>{SyncDataType::Settings, SyncDataType::Passwords,
                                                 SyncDataType::Bookmarks, SyncDataType::History});
}

TEST_CASE("Change construction", "[change]") {
    const auto before = Timestamp::now();
    Change change(SyncDataType::History, "h-1", ChangeOperation::Update,
                  QJsonObject{{"visits", 2}}, "device-b");

    REQUIRE(change.version() == 1);
    REQUIRE(change.timestamp() >= before);
    REQUIRE_FALSE(change.previous_hash().has_value());
    REQUIRE(change.is_update());
    REQUIRE_FALSE(change.is_create());

    Change other(SyncDataType::History, "h-1", ChangeOperation::Update,
                 QJsonObject{{"visits", 2}}, "device-b");
    REQUIRE(change.id() != other.id());
}

TEST_CASE("Change builders leave the original untouched", "[change]") {
    const auto original = sample();
    const auto bumped = original.with_version(4).with_previous_hash("abc");

    REQUIRE(original.version() == 3);
    REQUIRE_FALSE(original.previous_hash().has_value());
    REQUIRE(bumped.version() == 4);
    REQUIRE(bumped.previous_hash() == std::optional<std::string>("abc"));
    REQUIRE(bumped.id() == original.id());
}

TEST_CASE("Change conflict detection", "[change]") {
    const auto a = sample();
    const auto b = Change(SyncDataType::Bookmarks, "bm-1", ChangeOperation::Update,
                          QJsonObject{{"title", "Other"}}, "device-b");
    const auto different_entity = Change(SyncDataType::Bookmarks, "bm-2", ChangeOperation::Update,
                                         QJsonObject{}, "device-b");
    const auto different_type = Change(SyncDataType::History, "bm-1", ChangeOperation::Update,
                                       QJsonObject{}, "device-b");

    REQUIRE(a.conflicts_with(b));
    REQUIRE(b.conflicts_with(a));
    REQUIRE_FALSE(a.conflicts_with(a));
    REQUIRE_FALSE(a.conflicts_with(different_entity));
    REQUIRE_FALSE(a.conflicts_with(different_type));
}

TEST_CASE("Change wire format", "[change]") {
    const auto change = sample();
    const auto json = change_to_json(change);

    REQUIRE(json.value("data_type").toString() == "bookmarks");
    REQUIRE(json.value("operation").toString() == "create");
    REQUIRE(json.value("timestamp").toString() == "2024-05-01T12:30:00.125Z");
    REQUIRE(json.value("version").toInteger() == 3);
    REQUIRE_FALSE(json.contains("previous_hash"));

    SECTION("Serialized bytes are stable") {
        const auto bytes = serialize_change(change);
        auto decoded = deserialize_change(bytes);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == change);
        REQUIRE(serialize_change(decoded.unwrap()) == bytes);
    }

    SECTION("Arrays and null payloads survive") {
        const auto with_array = change.with_data(QJsonArray{1, 2, 3});
        REQUIRE(deserialize_change(serialize_change(with_array)).unwrap() == with_array);

        const auto deleted = Change(SyncDataType::Bookmarks, "bm-1", ChangeOperation::Delete,
                                    QJsonValue(), "device-a");
        REQUIRE(deserialize_change(serialize_change(deleted)).unwrap().data().isNull());
    }
}

TEST_CASE("Change decoding rejects malformed input", "[change]") {
    auto json = change_to_json(sample());

    SECTION("Text that is not JSON") {
        auto result = deserialize_change("{not json");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == SyncError::Kind::SerializationError);
    }

    SECTION("JSON that is not an object") {
        auto result = deserialize_change("[1,2]");
        REQUIRE(result.unwrap_err().kind == SyncError::Kind::SerializationError);
    }

    SECTION("Unknown data type") {
        json.insert("data_type", "tabs");
        auto result = change_from_json(json);
        REQUIRE(result.unwrap_err().kind == SyncError::Kind::InvalidData);
    }

    SECTION("Missing field") {
        json.remove("device_id");
        REQUIRE(change_from_json(json).unwrap_err().kind == SyncError::Kind::InvalidData);
    }

    SECTION("Negative or fractional version") {
        json.insert("version", -1);
        REQUIRE(change_from_json(json).is_err());
        json.insert("version", 1.5);
        REQUIRE(change_from_json(json).is_err());
    }

    SECTION("Malformed id") {
        json.insert("id", "123");
        REQUIRE(change_from_json(json).unwrap_err().message.find("malformed id") != std::string::npos);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "network/loopback_server.hpp"

using namespace braid;
using namespace braid::network;
using namespace braid::sync;

namespace {

constexpr auto kEmail = "user@example.com";

SyncRecord history_record(const std::string& entity) {
    Change change(SyncDataType::History, entity, ChangeOperation::Create,
                  QJsonObject{{"url", "https://example.com"}}, "device-a");
    return encode_record(change, nullptr).unwrap();
}

SyncAccount account() {
    return SyncAccount::create(kEmail, "loopback://test", DeviceSettings::for_device("device-a", "A"));
}

SyncAccountCredentials credentials(const std::string& token) {
    SyncAccountCredentials creds;
    creds.email = kEmail;
    creds.auth_token = token;
    return creds;
}

} // namespace

TEST_CASE("Loopback server authentication", "[loopback]") {
    LoopbackSyncServer server;
    server.register_account(kEmail, "good");

    REQUIRE(server.authenticate(kEmail, "good").is_ok());
    REQUIRE(server.authenticate(kEmail, "bad").unwrap_err().kind == SyncError::Kind::AuthFailed);
    REQUIRE(server.authenticate("nobody@example.com", "good").is_err());
}

TEST_CASE("Loopback server log", "[loopback]") {
    LoopbackSyncServer server;
    const auto first = history_record("h-1");
    const auto second = history_record("h-2");

    REQUIRE(server.upload(kEmail, SyncDataType::History, {first, second}).unwrap() == 2);

    SECTION("Uploads are idempotent per record id") {
        REQUIRE(server.upload(kEmail, SyncDataType::History, {first}).unwrap() == 0);
        REQUIRE(server.record_count(kEmail, SyncDataType::History) == 2);
    }

    SECTION("Download honours the cursor") {
        auto all = server.download(kEmail, SyncDataType::History, 0).unwrap();
        REQUIRE(all.records.size() == 2);
        REQUIRE(all.records[0] == first);
        REQUIRE(all.cursor == 2);

        auto none = server.download(kEmail, SyncDataType::History, all.cursor).unwrap();
        REQUIRE(none.records.empty());
        REQUIRE(none.cursor == 2);
    }

    SECTION("Logs are separate per type") {
        REQUIRE(server.download(kEmail, SyncDataType::Bookmarks, 0).unwrap().records.empty());
        REQUIRE(server.record_count(kEmail, SyncDataType::Bookmarks) == 0);
    }

    SECTION("A record for another type is refused") {
        auto result = server.upload(kEmail, SyncDataType::Bookmarks, {first});
        REQUIRE(result.unwrap_err().kind == SyncError::Kind::ServerError);
    }

    SECTION("Corrupt entries are rejected and still advance the cursor") {
        server.store_raw(kEmail, SyncDataType::History, QJsonObject{{"id", "garbage"}});
        auto batch = server.download(kEmail, SyncDataType::History, 0).unwrap();
        REQUIRE(batch.records.size() == 2);
        REQUIRE(batch.rejected.size() == 1);
        REQUIRE(batch.rejected[0].kind == SyncError::Kind::InvalidData);
        REQUIRE(batch.cursor == 3);
    }
}

TEST_CASE("Loopback server injected failures fire once", "[loopback]") {
    LoopbackSyncServer server;
    server.inject_failure(LoopbackSyncServer::Operation::Download, SyncError::rate_limited(30),
                          SyncDataType::Passwords);

    REQUIRE(server.download(kEmail, SyncDataType::History, 0).is_ok());

    auto limited = server.download(kEmail, SyncDataType::Passwords, 0);
    REQUIRE(limited.unwrap_err().kind == SyncError::Kind::RateLimited);
    REQUIRE(limited.unwrap_err().retry_after_seconds == 30);

    REQUIRE(server.download(kEmail, SyncDataType::Passwords, 0).is_ok());
}

TEST_CASE("Loopback transport requires authentication", "[loopback]") {
    auto server = std::make_shared<LoopbackSyncServer>();
    server->register_account(kEmail, "good");
    LoopbackTransport transport(server);

    REQUIRE(transport.download(SyncDataType::History, 0).unwrap_err().kind ==
            SyncError::Kind::AuthFailed);

    REQUIRE(transport.authenticate(account(), credentials("good")).is_ok());
    REQUIRE(transport.upload(SyncDataType::History, {history_record("h-1")}).unwrap() == 1);
    REQUIRE(server->record_count(kEmail, SyncDataType::History) == 1);

    REQUIRE(transport.authenticate(account(), credentials("bad")).is_err());
    REQUIRE(transport.upload(SyncDataType::History, {history_record("h-2")}).is_err());
}

#include <catch2/catch_test_macros.hpp>
#include "sync/account.hpp"

using namespace braid;
using namespace braid::sync;

TEST_CASE("New device settings enable every type", "[account]") {
    auto settings = DeviceSettings::for_device("dev-1", "Laptop");
    REQUIRE(settings.device_id == "dev-1");
    REQUIRE(settings.device_name == "Laptop");
    REQUIRE(settings.enabled_types.size() == all_data_types().size());
    REQUIRE_FALSE(settings.sync_on_metered);
    REQUIRE(settings.sync_interval_seconds == 300);
}

TEST_CASE("Account type toggles", "[account]") {
    auto account = SyncAccount::create("user@example.com", "https://sync.example.com",
                                       DeviceSettings::for_device("dev-1", "Laptop"));
    REQUIRE_FALSE(account.id.empty());
    REQUIRE_FALSE(account.is_verified);
    REQUIRE(account.is_type_enabled(SyncDataType::History));

    account.disable_type(SyncDataType::History);
    REQUIRE_FALSE(account.is_type_enabled(SyncDataType::History));
    REQUIRE(account.is_type_enabled(SyncDataType::Bookmarks));

    account.enable_type(SyncDataType::History);
    account.enable_type(SyncDataType::History);
    REQUIRE(account.is_type_enabled(SyncDataType::History));
    REQUIRE(account.device_settings.enabled_types.size() == all_data_types().size());

    const auto before = account.last_authenticated;
    account.update_authenticated();
    REQUIRE(account.last_authenticated >= before);
}

TEST_CASE("Credential expiry", "[account]") {
    const Timestamp now(1'700'000'000'000);
    SyncAccountCredentials credentials;
    credentials.email = "user@example.com";
    credentials.auth_token = "token";

    SECTION("No expiry never expires") {
        REQUIRE_FALSE(credentials.is_expired_at(now));
        REQUIRE_FALSE(credentials.needs_refresh_at(now));
    }

    SECTION("Expiry in the past") {
        credentials.expires_at = now - std::chrono::seconds(1);
        REQUIRE(credentials.is_expired_at(now));
        REQUIRE(credentials.needs_refresh_at(now));
    }

    SECTION("Expiry exactly now is not yet expired") {
        credentials.expires_at = now;
        REQUIRE_FALSE(credentials.is_expired_at(now));
        REQUIRE(credentials.needs_refresh_at(now));
    }

    SECTION("Inside the refresh margin") {
        credentials.expires_at = now + std::chrono::minutes(4);
        REQUIRE_FALSE(credentials.is_expired_at(now));
        REQUIRE(credentials.needs_refresh_at(now));
    }

    SECTION("Exactly at the refresh margin") {
        credentials.expires_at = now + std::chrono::minutes(5);
        REQUIRE(credentials.needs_refresh_at(now));
    }

    SECTION("Well ahead of expiry") {
        credentials.expires_at = now + std::chrono::hours(1);
        REQUIRE_FALSE(credentials.is_expired_at(now));
        REQUIRE_FALSE(credentials.needs_refresh_at(now));
    }
}

#include <catch2/catch_test_macros.hpp>
#include "crypto/encryption.hpp"
#include "crypto/keys.hpp"

#include <QJsonArray>
#include <QString>
#include <sodium.h>

using namespace braid;
using namespace braid::crypto;
using braid::sync::SyncError;

namespace {

std::vector<uint8_t> bytes_of(const std::string& text) {
    return {text.begin(), text.end()};
}

EncryptionKey test_key(uint8_t fill = 0x42) {
    std::vector<uint8_t> raw(KEY_SIZE, fill);
    return EncryptionKey::from_bytes(raw).unwrap();
}

bool aes_available() {
    REQUIRE(crypto::init().is_ok());
    return crypto_aead_aes256gcm_is_available() != 0;
}

} // namespace

TEST_CASE("Key derivation", "[crypto]") {
    REQUIRE(crypto::init().is_ok());

    auto a = EncryptionKey::derive_from_password("hunter2", "user@example.com").unwrap();
    auto b = EncryptionKey::derive_from_password("hunter2", "user@example.com").unwrap();
    auto other_password = EncryptionKey::derive_from_password("hunter3", "user@example.com").unwrap();
    auto other_email = EncryptionKey::derive_from_password("hunter2", "someone@example.com").unwrap();

    REQUIRE(a == b);
    REQUIRE_FALSE(a == other_password);
    REQUIRE_FALSE(a == other_email);
    REQUIRE(a.as_bytes().size() == KEY_SIZE);
}

TEST_CASE("Key from raw bytes", "[crypto]") {
    std::vector<uint8_t> short_key(16, 1);
    auto result = EncryptionKey::from_bytes(short_key);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == SyncError::Kind::EncryptionError);
    REQUIRE(result.unwrap_err().message == "Invalid key length: expected 32, got 16");

    auto key = test_key();
    REQUIRE(key.as_bytes()[0] == 0x42);
}

TEST_CASE("Key debug output is redacted", "[crypto]") {
    auto key = test_key(0xAB);
    REQUIRE(key.debug_string() == "EncryptionKey { key_bytes: [REDACTED] }");

    QString text;
    QDebug(&text) << key;
    REQUIRE(text.contains(QStringLiteral("REDACTED")));
    REQUIRE_FALSE(text.contains(QStringLiteral("171")));
    REQUIRE_FALSE(text.contains(QStringLiteral("ab"), Qt::CaseInsensitive));
}

TEST_CASE("Base64 helpers", "[crypto]") {
    REQUIRE(to_base64(bytes_of("hello")) == "aGVsbG8=");
    REQUIRE(from_base64("aGVsbG8=").unwrap() == bytes_of("hello"));
    REQUIRE(from_base64("aGVs bG8=").is_err());
    REQUIRE(from_base64("%%%").unwrap_err().message == "Invalid Base64");
    REQUIRE(to_base64({}).empty());
}

TEST_CASE("Hash output length", "[crypto]") {
    REQUIRE(crypto::init().is_ok());
    const auto data = bytes_of("payload");
    REQUIRE(hash(data).size() == 32);
    REQUIRE(hash(data, 16).size() == 16);
    REQUIRE(hash(data) == hash(data));
    REQUIRE(hash(data) != hash(bytes_of("payload!")));
}

TEST_CASE("Encrypt and decrypt", "[crypto]") {
    if (!aes_available()) {
        SKIP("AES-256-GCM is not available on this CPU");
    }
    SyncEncryption enc(test_key());
    const auto plaintext = bytes_of("{\"site\":\"example.com\"}");

    auto sealed = enc.encrypt(plaintext).unwrap();
    REQUIRE(sealed.version == ENCRYPTION_VERSION);
    REQUIRE(from_base64(sealed.nonce).unwrap().size() == NONCE_SIZE);
    REQUIRE(from_base64(sealed.ciphertext).unwrap().size() == plaintext.size() + TAG_SIZE);
    REQUIRE(enc.decrypt(sealed).unwrap() == plaintext);

    SECTION("Fresh nonce every time") {
        auto again = enc.encrypt(plaintext).unwrap();
        REQUIRE(again.nonce != sealed.nonce);
        REQUIRE(again.ciphertext != sealed.ciphertext);
    }

    SECTION("Empty plaintext") {
        auto empty = enc.encrypt({}).unwrap();
        REQUIRE(enc.decrypt(empty).unwrap().empty());
    }

    SECTION("Wrong key fails opaquely") {
        SyncEncryption other(test_key(0x01));
        auto result = other.decrypt(sealed);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == SyncError::Kind::EncryptionError);
        REQUIRE(result.unwrap_err().message == "Decryption failed");
    }

    SECTION("Tampered ciphertext fails") {
        auto raw = from_base64(sealed.ciphertext).unwrap();
        raw[0] ^= 0x01;
        auto tampered = sealed;
        tampered.ciphertext = to_base64(raw);
        REQUIRE(enc.decrypt(tampered).unwrap_err().message == "Decryption failed");
    }

    SECTION("Unknown version is rejected before decrypting") {
        auto future = sealed;
        future.version = 2;
        REQUIRE(enc.decrypt(future).unwrap_err().message == "Unsupported encryption version: 2");
    }

    SECTION("Short nonce is rejected") {
        auto bad = sealed;
        bad.nonce = to_base64(bytes_of("short"));
        REQUIRE(enc.decrypt(bad).is_err());
    }
}

TEST_CASE("Encrypt JSON values", "[crypto]") {
    if (!aes_available()) {
        SKIP("AES-256-GCM is not available on this CPU");
    }
    SyncEncryption enc(test_key());

    const QJsonObject obj{{"user", "alice"}, {"tags", QJsonArray{"a", "b"}}};
    auto sealed = enc.encrypt_json(obj).unwrap();
    REQUIRE(enc.decrypt_json(sealed).unwrap() == QJsonValue(obj));

    const QJsonArray arr{1, 2, 3};
    REQUIRE(enc.decrypt_json(enc.encrypt_json(arr).unwrap()).unwrap() == QJsonValue(arr));

    auto scalar = enc.encrypt_json(QJsonValue(5));
    REQUIRE(scalar.unwrap_err().kind == SyncError::Kind::SerializationError);

    auto not_json = enc.encrypt(bytes_of("plain words")).unwrap();
    REQUIRE(enc.decrypt_json(not_json).unwrap_err().kind == SyncError::Kind::SerializationError);
}

TEST_CASE("Envelope JSON", "[crypto]") {
    EncryptedData data{"Y2lwaGVy", "bm9uY2U=", 1};
    auto json = encrypted_data_to_json(data);
    REQUIRE(json.value("version").toInt() == 1);
    REQUIRE(encrypted_data_from_json(json).unwrap() == data);

    json.insert("version", 300);
    REQUIRE(encrypted_data_from_json(json).unwrap_err().kind == SyncError::Kind::InvalidData);

    json.remove("nonce");
    REQUIRE(encrypted_data_from_json(json).is_err());
}

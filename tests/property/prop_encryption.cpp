#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "crypto/encryption.hpp"

#include <sodium.h>

using namespace braid::crypto;

namespace {

SyncEncryption fresh_encryption() {
    return SyncEncryption(EncryptionKey::from_bytes(random_bytes(KEY_SIZE)).unwrap());
}

bool aes_available() {
    REQUIRE(init().is_ok());
    return crypto_aead_aes256gcm_is_available() != 0;
}

} // namespace

TEST_CASE("Property: decrypt inverts encrypt", "[property][crypto]") {
    if (!aes_available()) {
        SKIP("AES-256-GCM is not available on this CPU");
    }
    const auto enc = fresh_encryption();

    REQUIRE(rc::check("decrypt(encrypt(p)) == p",
        [&enc](const std::vector<uint8_t>& plaintext) {
            auto sealed = enc.encrypt(plaintext);
            RC_ASSERT(sealed.is_ok());
            auto opened = enc.decrypt(sealed.unwrap());
            RC_ASSERT(opened.is_ok());
            RC_ASSERT(opened.unwrap() == plaintext);
        }));
}

TEST_CASE("Property: envelopes never repeat", "[property][crypto]") {
    if (!aes_available()) {
        SKIP("AES-256-GCM is not available on this CPU");
    }
    const auto enc = fresh_encryption();

    REQUIRE(rc::check("encrypting the same plaintext twice uses different nonces",
        [&enc](const std::vector<uint8_t>& plaintext) {
            const auto first = enc.encrypt(plaintext).unwrap();
            const auto second = enc.encrypt(plaintext).unwrap();
            RC_ASSERT(first.nonce != second.nonce);
            RC_ASSERT(first.ciphertext != second.ciphertext);
        }));
}

TEST_CASE("Property: another key cannot open an envelope", "[property][crypto]") {
    if (!aes_available()) {
        SKIP("AES-256-GCM is not available on this CPU");
    }
    const auto enc = fresh_encryption();
    const auto other = fresh_encryption();

    REQUIRE(rc::check("decrypting under a different key fails",
        [&enc, &other](const std::vector<uint8_t>& plaintext) {
            const auto sealed = enc.encrypt(plaintext).unwrap();
            RC_ASSERT(other.decrypt(sealed).is_err());
        }));
}

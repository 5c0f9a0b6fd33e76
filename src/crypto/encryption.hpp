#pragma once

#include "crypto/keys.hpp"
#include "sync/error.hpp"
#include <QJsonObject>
#include <QJsonValue>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace braid::crypto {

// Envelope version for AES-256-GCM with a 96-bit nonce.
constexpr uint8_t ENCRYPTION_VERSION = 1;

/**
 * EncryptedData - wire envelope for an encrypted payload.
 *
 * `ciphertext` is standard Base64 of ciphertext followed by the 16-byte tag,
 * `nonce` is standard Base64 of the 12-byte nonce.
 */
struct EncryptedData {
    std::string ciphertext;
    std::string nonce;
    uint8_t version{ENCRYPTION_VERSION};

    bool operator==(const EncryptedData&) const = default;
};

[[nodiscard]] QJsonObject encrypted_data_to_json(const EncryptedData& data);
[[nodiscard]] sync::SyncResult<EncryptedData> encrypted_data_from_json(const QJsonObject& obj);

/**
 * SyncEncryption - authenticated encryption of sync payloads with one key.
 *
 * Every call to encrypt() draws a fresh random nonce, so encrypting the same
 * plaintext twice never yields the same envelope. All decryption failures
 * after the version check are reported as a single opaque error.
 */
class SyncEncryption {
public:
    explicit SyncEncryption(EncryptionKey key) : key_(std::move(key)) {}

    [[nodiscard]] sync::SyncResult<EncryptedData> encrypt(
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] sync::SyncResult<std::vector<uint8_t>> decrypt(
        const EncryptedData& encrypted) const;

    /**
     * Serialize a JSON object or array to compact text and encrypt it.
     * Scalars and undefined values are a SerializationError.
     */
    [[nodiscard]] sync::SyncResult<EncryptedData> encrypt_json(const QJsonValue& value) const;

    /**
     * Decrypt and parse. Crypto failures are EncryptionError, plaintext that
     * is not JSON is SerializationError.
     */
    [[nodiscard]] sync::SyncResult<QJsonValue> decrypt_json(const EncryptedData& encrypted) const;

    [[nodiscard]] const EncryptionKey& key() const noexcept { return key_; }

private:
    EncryptionKey key_;
};

} // namespace braid::crypto

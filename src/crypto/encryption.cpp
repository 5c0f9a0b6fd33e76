#include "crypto/encryption.hpp"
#include "core/logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <sodium.h>

namespace braid::crypto {

using sync::SyncError;
using sync::SyncResult;

namespace {

SyncError decryption_failed() {
    return SyncError::encryption("Decryption failed");
}

} // namespace

QJsonObject encrypted_data_to_json(const EncryptedData& data) {
    QJsonObject obj;
    obj.insert(QStringLiteral("ciphertext"), QString::fromStdString(data.ciphertext));
    obj.insert(QStringLiteral("nonce"), QString::fromStdString(data.nonce));
    obj.insert(QStringLiteral("version"), static_cast<int>(data.version));
    return obj;
}

SyncResult<EncryptedData> encrypted_data_from_json(const QJsonObject& obj) {
    const auto ciphertext = obj.value(QStringLiteral("ciphertext"));
    const auto nonce = obj.value(QStringLiteral("nonce"));
    const auto version = obj.value(QStringLiteral("version"));
    if (!ciphertext.isString() || !nonce.isString()) {
        return SyncResult<EncryptedData>::err(
            SyncError::invalid_data("encrypted: ciphertext and nonce must be strings"));
    }
    if (!version.isDouble()) {
        return SyncResult<EncryptedData>::err(
            SyncError::invalid_data("encrypted: missing version"));
    }
    const double v = version.toDouble();
    if (v < 0 || v > 255 || static_cast<double>(static_cast<int>(v)) != v) {
        return SyncResult<EncryptedData>::err(
            SyncError::invalid_data("encrypted: version out of range"));
    }
    EncryptedData data;
    data.ciphertext = ciphertext.toString().toStdString();
    data.nonce = nonce.toString().toStdString();
    data.version = static_cast<uint8_t>(v);
    return SyncResult<EncryptedData>::ok(std::move(data));
}

SyncResult<EncryptedData> SyncEncryption::encrypt(std::span<const uint8_t> plaintext) const {
    if (crypto_aead_aes256gcm_is_available() == 0) {
        qCWarning(braidCryptoLog) << "AES-256-GCM is not available on this CPU";
        return SyncResult<EncryptedData>::err(
            SyncError::encryption("AES-256-GCM is not available on this CPU"));
    }

    const auto nonce = random_bytes(NONCE_SIZE);
    std::vector<uint8_t> ciphertext(plaintext.size() + crypto_aead_aes256gcm_ABYTES);
    unsigned long long ciphertext_len = 0;

    const auto key = key_.as_bytes();
    if (crypto_aead_aes256gcm_encrypt(
            ciphertext.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            nullptr, 0,
            nullptr,
            nonce.data(),
            key.data()) != 0) {
        return SyncResult<EncryptedData>::err(SyncError::encryption("Encryption failed"));
    }
    ciphertext.resize(static_cast<size_t>(ciphertext_len));

    EncryptedData out;
    out.ciphertext = to_base64(ciphertext);
    out.nonce = to_base64(nonce);
    out.version = ENCRYPTION_VERSION;
    return SyncResult<EncryptedData>::ok(std::move(out));
}

SyncResult<std::vector<uint8_t>> SyncEncryption::decrypt(const EncryptedData& encrypted) const {
    if (encrypted.version != ENCRYPTION_VERSION) {
        return SyncResult<std::vector<uint8_t>>::err(SyncError::encryption(
            "Unsupported encryption version: " + std::to_string(encrypted.version)));
    }
    if (crypto_aead_aes256gcm_is_available() == 0) {
        return SyncResult<std::vector<uint8_t>>::err(
            SyncError::encryption("AES-256-GCM is not available on this CPU"));
    }

    auto nonce = from_base64(encrypted.nonce);
    if (nonce.is_err()) {
        return SyncResult<std::vector<uint8_t>>::err(
            SyncError::encryption("Invalid nonce encoding"));
    }
    if (nonce.unwrap().size() != NONCE_SIZE) {
        return SyncResult<std::vector<uint8_t>>::err(SyncError::encryption(
            "Invalid nonce length: " + std::to_string(nonce.unwrap().size())));
    }
    auto ciphertext = from_base64(encrypted.ciphertext);
    if (ciphertext.is_err()) {
        return SyncResult<std::vector<uint8_t>>::err(
            SyncError::encryption("Invalid ciphertext encoding"));
    }
    const auto& ct = ciphertext.unwrap();
    if (ct.size() < crypto_aead_aes256gcm_ABYTES) {
        return SyncResult<std::vector<uint8_t>>::err(decryption_failed());
    }

    std::vector<uint8_t> plaintext(ct.size() - crypto_aead_aes256gcm_ABYTES);
    unsigned long long plaintext_len = 0;
    const auto key = key_.as_bytes();
    if (crypto_aead_aes256gcm_decrypt(
            plaintext.data(), &plaintext_len,
            nullptr,
            ct.data(), ct.size(),
            nullptr, 0,
            nonce.unwrap().data(),
            key.data()) != 0) {
        return SyncResult<std::vector<uint8_t>>::err(decryption_failed());
    }
    plaintext.resize(static_cast<size_t>(plaintext_len));
    return SyncResult<std::vector<uint8_t>>::ok(std::move(plaintext));
}

SyncResult<EncryptedData> SyncEncryption::encrypt_json(const QJsonValue& value) const {
    QJsonDocument doc;
    if (value.isObject()) {
        doc = QJsonDocument(value.toObject());
    } else if (value.isArray()) {
        doc = QJsonDocument(value.toArray());
    } else {
        return SyncResult<EncryptedData>::err(
            SyncError::serialization("only JSON objects and arrays can be encrypted"));
    }
    const QByteArray text = doc.toJson(QJsonDocument::Compact);
    return encrypt(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.constData()),
        static_cast<size_t>(text.size())));
}

SyncResult<QJsonValue> SyncEncryption::decrypt_json(const EncryptedData& encrypted) const {
    auto plaintext = decrypt(encrypted);
    if (plaintext.is_err()) {
        return SyncResult<QJsonValue>::err(plaintext.unwrap_err());
    }
    auto& bytes = plaintext.unwrap();
    const auto text = QByteArray(reinterpret_cast<const char*>(bytes.data()),
                                 static_cast<qsizetype>(bytes.size()));
    secure_zero(bytes.data(), bytes.size());

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text, &err);
    if (err.error != QJsonParseError::NoError) {
        return SyncResult<QJsonValue>::err(
            SyncError::serialization(err.errorString().toStdString()));
    }
    if (doc.isArray()) {
        return SyncResult<QJsonValue>::ok(QJsonValue(doc.array()));
    }
    return SyncResult<QJsonValue>::ok(QJsonValue(doc.object()));
}

} // namespace braid::crypto

#include "crypto/keys.hpp"
#include "core/logging.hpp"

#include <openssl/evp.h>
#include <sodium.h>

namespace braid::crypto {

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

sync::SyncResult<EncryptionKey> EncryptionKey::derive_from_password(
    std::string_view password,
    std::string_view email
) {
    Bytes bytes{};
    const int ok = PKCS5_PBKDF2_HMAC(
        password.data(), static_cast<int>(password.size()),
        reinterpret_cast<const unsigned char*>(email.data()), static_cast<int>(email.size()),
        static_cast<int>(PBKDF2_ITERATIONS),
        EVP_sha256(),
        static_cast<int>(bytes.size()), bytes.data());
    if (ok != 1) {
        qCWarning(braidCryptoLog) << "PBKDF2 key derivation failed";
        return sync::SyncResult<EncryptionKey>::err(
            sync::SyncError::encryption("Key derivation failed"));
    }
    EncryptionKey key(bytes);
    sodium_memzero(bytes.data(), bytes.size());
    return sync::SyncResult<EncryptionKey>::ok(std::move(key));
}

sync::SyncResult<EncryptionKey> EncryptionKey::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != KEY_SIZE) {
        return sync::SyncResult<EncryptionKey>::err(sync::SyncError::encryption(
            "Invalid key length: expected " + std::to_string(KEY_SIZE) +
            ", got " + std::to_string(bytes.size())));
    }
    Bytes raw{};
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    EncryptionKey key(raw);
    sodium_memzero(raw.data(), raw.size());
    return sync::SyncResult<EncryptionKey>::ok(std::move(key));
}

EncryptionKey::~EncryptionKey() {
    sodium_memzero(bytes_.data(), bytes_.size());
}

std::string EncryptionKey::debug_string() const {
    return "EncryptionKey { key_bytes: [REDACTED] }";
}

bool EncryptionKey::operator==(const EncryptionKey& other) const noexcept {
    return sodium_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}

QDebug operator<<(QDebug dbg, const EncryptionKey& key) {
    QDebugStateSaver saver(dbg);
    dbg.nospace() << key.debug_string().c_str();
    return dbg;
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

std::vector<uint8_t> hash(std::span<const uint8_t> data, size_t size) {
    std::vector<uint8_t> out(size);
    crypto_generichash(out.data(), out.size(), data.data(), data.size(), nullptr, 0);
    return out;
}

std::string to_base64(std::span<const uint8_t> data) {
    const size_t encoded_len =
        sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating NUL.
    out.resize(encoded_len - 1);
    return out;
}

Result<std::vector<uint8_t>, Error> from_base64(std::string_view b64) {
    std::vector<uint8_t> out(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return Result<std::vector<uint8_t>, Error>::err(Error{"Invalid Base64"});
    }
    out.resize(out_len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

} // namespace braid::crypto

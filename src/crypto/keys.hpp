#pragma once

#include "core/result.hpp"
#include "sync/error.hpp"
#include <QDebug>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace braid::crypto {

constexpr size_t KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 12;
constexpr size_t TAG_SIZE = 16;
constexpr uint32_t PBKDF2_ITERATIONS = 100'000;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * EncryptionKey - 256-bit symmetric key for sync payloads.
 *
 * The bytes are wiped on destruction and never printed: the debug form is
 * always redacted.
 */
class EncryptionKey {
public:
    using Bytes = std::array<uint8_t, KEY_SIZE>;

    /**
     * PBKDF2-HMAC-SHA256, 100,000 iterations, salt = UTF-8 bytes of `email`.
     * Equal inputs always yield equal keys.
     */
    [[nodiscard]] static sync::SyncResult<EncryptionKey> derive_from_password(
        std::string_view password,
        std::string_view email);

    /**
     * Wrap raw key material. Anything other than 32 bytes is rejected.
     */
    [[nodiscard]] static sync::SyncResult<EncryptionKey> from_bytes(
        std::span<const uint8_t> bytes);

    EncryptionKey(const EncryptionKey& other) = default;
    EncryptionKey& operator=(const EncryptionKey& other) = default;
    ~EncryptionKey();

    [[nodiscard]] std::span<const uint8_t> as_bytes() const noexcept { return bytes_; }

    /**
     * Redacted description for logs and assertions.
     */
    [[nodiscard]] std::string debug_string() const;

    // Constant-time comparison.
    bool operator==(const EncryptionKey& other) const noexcept;

private:
    explicit EncryptionKey(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_{};
};

QDebug operator<<(QDebug dbg, const EncryptionKey& key);

/**
 * Cryptographically random bytes.
 */
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t count);

/**
 * BLAKE2b digest of `data` with `size` bytes of output.
 */
[[nodiscard]] std::vector<uint8_t> hash(std::span<const uint8_t> data, size_t size = 32);

/**
 * Standard (not URL-safe) padded Base64.
 */
[[nodiscard]] std::string to_base64(std::span<const uint8_t> data);

/**
 * Decode standard padded Base64. Any stray character fails the decode.
 */
[[nodiscard]] Result<std::vector<uint8_t>, Error> from_base64(std::string_view b64);

/**
 * Securely zero memory.
 */
void secure_zero(void* ptr, size_t len);

} // namespace braid::crypto

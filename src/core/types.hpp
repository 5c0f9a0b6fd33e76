#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <functional>

namespace braid {

/**
 * Uuid - 128-bit identifier used for change ids and queue entry ids.
 *
 * Random (version 4) ids come from the libsodium CSPRNG so ids minted on
 * different devices do not collide.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate();

    /**
     * Build a version 4 shaped UUID from the first 16 bytes of a digest.
     * Used for ids that must be reproducible from their inputs.
     */
    [[nodiscard]] static Uuid from_digest(const uint8_t* digest, size_t len);

    /**
     * Parse a UUID from a string (hyphenated or bare, any case).
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - UTC instant with millisecond resolution.
 *
 * Stored as milliseconds since the Unix epoch, which is also how it is kept
 * in SQLite. On the wire it is ISO 8601 with milliseconds and a `Z` suffix.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}
    explicit Timestamp(TimePoint tp) noexcept
        : millis_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as 2024-05-01T12:30:00.125Z
     */
    [[nodiscard]] std::string to_iso_string() const;

    /**
     * Parse an ISO 8601 UTC instant. Returns nullopt for anything that is
     * not a valid date-time.
     */
    [[nodiscard]] static std::optional<Timestamp> parse_iso(std::string_view text);

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace braid

namespace std {
    template<>
    struct hash<braid::Uuid> {
        size_t operator()(const braid::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}

#include "core/types.hpp"

#include <QDateTime>
#include <QString>
#include <QTimeZone>
#include <sodium.h>
#include <type_traits>

namespace braid {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Uuid stamp_version4(Uuid::Bytes bytes) {
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return Uuid(bytes);
}

} // namespace

Uuid Uuid::generate() {
    Bytes bytes;
    randombytes_buf(bytes.data(), bytes.size());
    return stamp_version4(bytes);
}

Uuid Uuid::from_digest(const uint8_t* digest, size_t len) {
    Bytes bytes{};
    for (size_t i = 0; i < BYTE_SIZE && i < len; ++i) {
        bytes[i] = digest[i];
    }
    return stamp_version4(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    Bytes bytes{};
    size_t nibble = 0;
    for (char c : str) {
        if (c == '-') continue;
        const int v = hex_value(c);
        if (v < 0 || nibble >= BYTE_SIZE * 2) return std::nullopt;
        if (nibble % 2 == 0) {
            bytes[nibble / 2] = static_cast<uint8_t>(v << 4);
        } else {
            bytes[nibble / 2] |= static_cast<uint8_t>(v);
        }
        ++nibble;
    }
    if (nibble != BYTE_SIZE * 2) return std::nullopt;
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += digits[bytes_[i] >> 4];
        out += digits[bytes_[i] & 0x0F];
    }
    return out;
}

std::string Timestamp::to_iso_string() const {
    const auto dt = QDateTime::fromMSecsSinceEpoch(millis_, QTimeZone::utc());
    return dt.toString(Qt::ISODateWithMs).toStdString();
}

std::optional<Timestamp> Timestamp::parse_iso(std::string_view text) {
    const auto str = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
    auto dt = QDateTime::fromString(str, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return Timestamp(static_cast<int64_t>(dt.toMSecsSinceEpoch()));
}

} // namespace braid

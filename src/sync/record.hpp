#pragma once

#include "core/types.hpp"
#include "crypto/encryption.hpp"
#include "sync/change.hpp"
#include "sync/data_type.hpp"
#include "sync/error.hpp"
#include <QJsonObject>
#include <optional>
#include <string>

namespace braid::sync {

/**
 * SyncRecord - a change as it is stored on the remote.
 *
 * `id` is the id of the carried change and makes uploads idempotent.
 * Exactly one of `change` (plaintext types) and `encrypted` (types that
 * require encryption) is set.
 */
struct SyncRecord {
    Uuid id;
    SyncDataType data_type{SyncDataType::Bookmarks};
    std::string device_id;
    std::optional<Change> change;
    std::optional<crypto::EncryptedData> encrypted;

    bool operator==(const SyncRecord&) const = default;
};

[[nodiscard]] QJsonObject record_to_json(const SyncRecord& record);
[[nodiscard]] SyncResult<SyncRecord> record_from_json(const QJsonObject& obj);

/**
 * Wrap a local change for upload. `encryption` must be set when the
 * change's type requires encryption.
 */
[[nodiscard]] SyncResult<SyncRecord> encode_record(
    const Change& change,
    const crypto::SyncEncryption* encryption);

/**
 * Recover the change carried by a downloaded record. A record whose
 * payload does not match its envelope (type, id) is InvalidData.
 */
[[nodiscard]] SyncResult<Change> decode_record(
    const SyncRecord& record,
    const crypto::SyncEncryption* encryption);

} // namespace braid::sync

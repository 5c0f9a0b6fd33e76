#pragma once

#include "core/types.hpp"
#include "sync/data_type.hpp"
#include "sync/error.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <optional>
#include <string>
#include <utility>

namespace braid::sync {

/**
 * ChangeOperation - what happened to the entity.
 * Wire names: "create", "update", "delete".
 */
enum class ChangeOperation {
    Create,
    Update,
    Delete
};

[[nodiscard]] std::string to_string(ChangeOperation op);
[[nodiscard]] std::optional<ChangeOperation> parse_operation(std::string_view name);

/**
 * Change - one create/update/delete on one entity of one data type.
 *
 * A Change is a value: it is never modified after construction. The
 * `with_*` builders return a modified copy and are used when decoding wire
 * data or when a data source assigns its own versioning metadata.
 *
 * `version` is non-decreasing per (entity_id, data_type) on one device and
 * `id` is never reused. `previous_hash` is carried for future merge-base
 * detection; resolution does not look at it.
 */
class Change {
public:
    /**
     * Stamps a fresh id, timestamp = now, version = 1 and no previous hash.
     */
    Change(SyncDataType data_type,
           std::string entity_id,
           ChangeOperation operation,
           QJsonValue data,
           std::string device_id);

    [[nodiscard]] Change with_device_id(std::string device_id) const;
    [[nodiscard]] Change with_version(uint64_t version) const;
    [[nodiscard]] Change with_previous_hash(std::string hash) const;
    [[nodiscard]] Change with_timestamp(Timestamp timestamp) const;
    [[nodiscard]] Change with_id(Uuid id) const;
    [[nodiscard]] Change with_data(QJsonValue data) const;

    [[nodiscard]] const Uuid& id() const noexcept { return id_; }
    [[nodiscard]] SyncDataType data_type() const noexcept { return data_type_; }
    [[nodiscard]] const std::string& entity_id() const noexcept { return entity_id_; }
    [[nodiscard]] ChangeOperation operation() const noexcept { return operation_; }
    [[nodiscard]] const QJsonValue& data() const noexcept { return data_; }
    [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] const std::string& device_id() const noexcept { return device_id_; }
    [[nodiscard]] uint64_t version() const noexcept { return version_; }
    [[nodiscard]] const std::optional<std::string>& previous_hash() const noexcept {
        return previous_hash_;
    }

    /**
     * Same entity, same data type, different change. A change never
     * conflicts with itself.
     */
    [[nodiscard]] bool conflicts_with(const Change& other) const noexcept {
        return entity_id_ == other.entity_id_ &&
               data_type_ == other.data_type_ &&
               id_ != other.id_;
    }

    [[nodiscard]] bool is_create() const noexcept { return operation_ == ChangeOperation::Create; }
    [[nodiscard]] bool is_update() const noexcept { return operation_ == ChangeOperation::Update; }
    [[nodiscard]] bool is_delete() const noexcept { return operation_ == ChangeOperation::Delete; }

    /**
     * Canonical ordering key: (timestamp, version).
     */
    [[nodiscard]] std::pair<Timestamp, uint64_t> sort_key() const noexcept {
        return {timestamp_, version_};
    }

    bool operator==(const Change& other) const;

private:
    Uuid id_;
    SyncDataType data_type_;
    std::string entity_id_;
    ChangeOperation operation_;
    QJsonValue data_;
    Timestamp timestamp_;
    std::string device_id_;
    uint64_t version_{1};
    std::optional<std::string> previous_hash_;
};

// ---------------------------------------------------------------------------
// JSON codec
// ---------------------------------------------------------------------------

/**
 * Encode a change with the stable wire field names. `previous_hash` is
 * omitted when absent.
 */
[[nodiscard]] QJsonObject change_to_json(const Change& change);

/**
 * Decode and validate a change object. Structural problems (missing fields,
 * wrong types, unknown enum names, malformed ids) are InvalidData.
 */
[[nodiscard]] SyncResult<Change> change_from_json(const QJsonObject& obj);

/**
 * Compact UTF-8 JSON text. Key order is stable, so decoding and re-encoding
 * reproduces the same bytes.
 */
[[nodiscard]] QByteArray serialize_change(const Change& change);

/**
 * Parse JSON text into a change. Text that is not a JSON object is a
 * SerializationError; a well-formed object with bad fields is InvalidData.
 */
[[nodiscard]] SyncResult<Change> deserialize_change(const QByteArray& bytes);

} // namespace braid::sync

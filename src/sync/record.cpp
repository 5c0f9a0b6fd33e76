#include "sync/record.hpp"

namespace braid::sync {

namespace {

SyncResult<SyncRecord> invalid_record(const std::string& what) {
    return SyncResult<SyncRecord>::err(SyncError::invalid_data("record: " + what));
}

} // namespace

QJsonObject record_to_json(const SyncRecord& record) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), QString::fromStdString(record.id.to_string()));
    obj.insert(QStringLiteral("data_type"), QString::fromStdString(to_string(record.data_type)));
    obj.insert(QStringLiteral("device_id"), QString::fromStdString(record.device_id));
    if (record.change) {
        obj.insert(QStringLiteral("change"), change_to_json(*record.change));
    }
    if (record.encrypted) {
        obj.insert(QStringLiteral("encrypted"), crypto::encrypted_data_to_json(*record.encrypted));
    }
    return obj;
}

SyncResult<SyncRecord> record_from_json(const QJsonObject& obj) {
    const auto id = Uuid::parse(obj.value(QStringLiteral("id")).toString().toStdString());
    if (!id) return invalid_record("missing or malformed id");

    const auto type_name = obj.value(QStringLiteral("data_type")).toString().toStdString();
    const auto data_type = parse_data_type(type_name);
    if (!data_type) return invalid_record("unknown data_type '" + type_name + "'");

    const auto device_id = obj.value(QStringLiteral("device_id"));
    if (!device_id.isString()) return invalid_record("missing device_id");

    SyncRecord record;
    record.id = *id;
    record.data_type = *data_type;
    record.device_id = device_id.toString().toStdString();

    const auto change_value = obj.value(QStringLiteral("change"));
    const auto encrypted_value = obj.value(QStringLiteral("encrypted"));
    if (change_value.isObject() == encrypted_value.isObject()) {
        return invalid_record("exactly one of change and encrypted must be present");
    }

    if (change_value.isObject()) {
        auto change = change_from_json(change_value.toObject());
        if (change.is_err()) {
            return SyncResult<SyncRecord>::err(change.unwrap_err().for_entity(id->to_string()));
        }
        record.change = std::move(change).unwrap();
    } else {
        auto encrypted = crypto::encrypted_data_from_json(encrypted_value.toObject());
        if (encrypted.is_err()) {
            return SyncResult<SyncRecord>::err(encrypted.unwrap_err().for_entity(id->to_string()));
        }
        record.encrypted = std::move(encrypted).unwrap();
    }
    return SyncResult<SyncRecord>::ok(std::move(record));
}

SyncResult<SyncRecord> encode_record(const Change& change,
                                     const crypto::SyncEncryption* encryption) {
    SyncRecord record;
    record.id = change.id();
    record.data_type = change.data_type();
    record.device_id = change.device_id();

    if (!requires_encryption(change.data_type())) {
        record.change = change;
        return SyncResult<SyncRecord>::ok(std::move(record));
    }

    if (!encryption) {
        return SyncResult<SyncRecord>::err(
            SyncError::encryption("no encryption key for " + to_string(change.data_type())));
    }
    auto encrypted = encryption->encrypt_json(change_to_json(change));
    if (encrypted.is_err()) {
        return SyncResult<SyncRecord>::err(encrypted.unwrap_err().for_entity(change.entity_id()));
    }
    record.encrypted = std::move(encrypted).unwrap();
    return SyncResult<SyncRecord>::ok(std::move(record));
}

SyncResult<Change> decode_record(const SyncRecord& record,
                                 const crypto::SyncEncryption* encryption) {
    const auto record_id = record.id.to_string();
    auto fail = [&](SyncError error) {
        return SyncResult<Change>::err(error.for_entity(record_id));
    };

    std::optional<Change> change;
    if (record.encrypted) {
        if (!encryption) {
            return fail(SyncError::encryption("no encryption key for " + to_string(record.data_type)));
        }
        auto plaintext = encryption->decrypt_json(*record.encrypted);
        if (plaintext.is_err()) {
            return fail(plaintext.unwrap_err());
        }
        if (!plaintext.unwrap().isObject()) {
            return fail(SyncError::invalid_data("record: decrypted payload is not an object"));
        }
        auto decoded = change_from_json(plaintext.unwrap().toObject());
        if (decoded.is_err()) {
            return fail(decoded.unwrap_err());
        }
        change = std::move(decoded).unwrap();
    } else if (record.change) {
        if (requires_encryption(record.data_type)) {
            return fail(SyncError::invalid_data(
                "record: " + to_string(record.data_type) + " arrived unencrypted"));
        }
        change = *record.change;
    } else {
        return fail(SyncError::invalid_data("record: no payload"));
    }

    if (change->data_type() != record.data_type || change->id() != record.id) {
        return fail(SyncError::invalid_data("record: payload does not match envelope"));
    }
    return SyncResult<Change>::ok(std::move(*change));
}

} // namespace braid::sync

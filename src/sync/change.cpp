#include "sync/change.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>

namespace braid::sync {

namespace {

// Largest integer a JSON number (IEEE double) carries exactly.
constexpr double MAX_EXACT_VERSION = 9007199254740992.0;

std::optional<std::string> string_field(const QJsonObject& obj, const char* key) {
    const auto value = obj.value(QLatin1String(key));
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString().toStdString();
}

SyncResult<Change> invalid(const std::string& what) {
    return SyncResult<Change>::err(SyncError::invalid_data("change: " + what));
}

} // namespace

std::string to_string(ChangeOperation op) {
    switch (op) {
        case ChangeOperation::Create: return "create";
        case ChangeOperation::Update: return "update";
        case ChangeOperation::Delete: return "delete";
    }
    return "unknown";
}

std::optional<ChangeOperation> parse_operation(std::string_view name) {
    if (name == "create") return ChangeOperation::Create;
    if (name == "update") return ChangeOperation::Update;
    if (name == "delete") return ChangeOperation::Delete;
    return std::nullopt;
}

Change::Change(SyncDataType data_type,
               std::string entity_id,
               ChangeOperation operation,
               QJsonValue data,
               std::string device_id)
    : id_(Uuid::generate())
    , data_type_(data_type)
    , entity_id_(std::move(entity_id))
    , operation_(operation)
    , data_(std::move(data))
    , timestamp_(Timestamp::now())
    , device_id_(std::move(device_id))
{
}

Change Change::with_device_id(std::string device_id) const {
    auto copy = *this;
    copy.device_id_ = std::move(device_id);
    return copy;
}

Change Change::with_version(uint64_t version) const {
    auto copy = *this;
    copy.version_ = version;
    return copy;
}

Change Change::with_previous_hash(std::string hash) const {
    auto copy = *this;
    copy.previous_hash_ = std::move(hash);
    return copy;
}

Change Change::with_timestamp(Timestamp timestamp) const {
    auto copy = *this;
    copy.timestamp_ = timestamp;
    return copy;
}

Change Change::with_id(Uuid id) const {
    auto copy = *this;
    copy.id_ = id;
    return copy;
}

Change Change::with_data(QJsonValue data) const {
    auto copy = *this;
    copy.data_ = std::move(data);
    return copy;
}

bool Change::operator==(const Change& other) const {
    return id_ == other.id_ &&
           data_type_ == other.data_type_ &&
           entity_id_ == other.entity_id_ &&
           operation_ == other.operation_ &&
           data_ == other.data_ &&
           timestamp_ == other.timestamp_ &&
           device_id_ == other.device_id_ &&
           version_ == other.version_ &&
           previous_hash_ == other.previous_hash_;
}

QJsonObject change_to_json(const Change& change) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), QString::fromStdString(change.id().to_string()));
    obj.insert(QStringLiteral("data_type"), QString::fromStdString(to_string(change.data_type())));
    obj.insert(QStringLiteral("entity_id"), QString::fromStdString(change.entity_id()));
    obj.insert(QStringLiteral("operation"), QString::fromStdString(to_string(change.operation())));
    obj.insert(QStringLiteral("data"), change.data());
    obj.insert(QStringLiteral("timestamp"), QString::fromStdString(change.timestamp().to_iso_string()));
    obj.insert(QStringLiteral("device_id"), QString::fromStdString(change.device_id()));
    obj.insert(QStringLiteral("version"), static_cast<qint64>(change.version()));
    if (change.previous_hash()) {
        obj.insert(QStringLiteral("previous_hash"), QString::fromStdString(*change.previous_hash()));
    }
    return obj;
}

SyncResult<Change> change_from_json(const QJsonObject& obj) {
    const auto id_str = string_field(obj, "id");
    if (!id_str) return invalid("missing id");
    const auto id = Uuid::parse(*id_str);
    if (!id) return invalid("malformed id '" + *id_str + "'");

    const auto type_str = string_field(obj, "data_type");
    if (!type_str) return invalid("missing data_type");
    const auto data_type = parse_data_type(*type_str);
    if (!data_type) return invalid("unknown data_type '" + *type_str + "'");

    const auto entity_id = string_field(obj, "entity_id");
    if (!entity_id || entity_id->empty()) return invalid("missing entity_id");

    const auto op_str = string_field(obj, "operation");
    if (!op_str) return invalid("missing operation");
    const auto operation = parse_operation(*op_str);
    if (!operation) return invalid("unknown operation '" + *op_str + "'");

    if (!obj.contains(QStringLiteral("data"))) return invalid("missing data");

    const auto ts_str = string_field(obj, "timestamp");
    if (!ts_str) return invalid("missing timestamp");
    const auto timestamp = Timestamp::parse_iso(*ts_str);
    if (!timestamp) return invalid("malformed timestamp '" + *ts_str + "'");

    const auto device_id = string_field(obj, "device_id");
    if (!device_id) return invalid("missing device_id");

    const auto version_value = obj.value(QStringLiteral("version"));
    if (!version_value.isDouble()) return invalid("missing version");
    const double version = version_value.toDouble();
    if (version < 0 || version > MAX_EXACT_VERSION || std::floor(version) != version) {
        return invalid("version is not a non-negative integer");
    }

    auto change = Change(*data_type, *entity_id, *operation,
                         obj.value(QStringLiteral("data")), *device_id)
                      .with_id(*id)
                      .with_timestamp(*timestamp)
                      .with_version(static_cast<uint64_t>(version));

    if (obj.contains(QStringLiteral("previous_hash"))) {
        const auto hash = string_field(obj, "previous_hash");
        if (!hash) return invalid("previous_hash is not a string");
        change = change.with_previous_hash(*hash);
    }

    return SyncResult<Change>::ok(std::move(change));
}

QByteArray serialize_change(const Change& change) {
    return QJsonDocument(change_to_json(change)).toJson(QJsonDocument::Compact);
}

SyncResult<Change> deserialize_change(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError) {
        return SyncResult<Change>::err(
            SyncError::serialization(err.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return SyncResult<Change>::err(SyncError::serialization("change is not a JSON object"));
    }
    return change_from_json(doc.object());
}

} // namespace braid::sync

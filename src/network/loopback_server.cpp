#include "network/loopback_server.hpp"
#include "core/logging.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>

namespace braid::network {

using sync::SyncError;
using sync::SyncResult;

void LoopbackSyncServer::register_account(const std::string& email, const std::string& auth_token) {
    std::lock_guard lock(mutex_);
    tokens_[email] = auth_token;
}

void LoopbackSyncServer::inject_failure(Operation op,
                                        SyncError error,
                                        std::optional<sync::SyncDataType> type) {
    std::lock_guard lock(mutex_);
    failures_.push_back(Injected{op, std::move(error), type});
}

void LoopbackSyncServer::store_raw(const std::string& email,
                                   sync::SyncDataType type,
                                   const QJsonObject& record) {
    std::lock_guard lock(mutex_);
    logs_[{email, type}].entries.push_back(QJsonDocument(record).toJson(QJsonDocument::Compact));
}

size_t LoopbackSyncServer::record_count(const std::string& email, sync::SyncDataType type) const {
    std::lock_guard lock(mutex_);
    auto it = logs_.find({email, type});
    return it == logs_.end() ? 0 : it->second.entries.size();
}

std::optional<SyncError> LoopbackSyncServer::take_failure(Operation op,
                                                          std::optional<sync::SyncDataType> type) {
    for (auto it = failures_.begin(); it != failures_.end(); ++it) {
        if (it->op != op) continue;
        if (it->type && it->type != type) continue;
        auto error = std::move(it->error);
        failures_.erase(it);
        return error;
    }
    return std::nullopt;
}

SyncResult<void> LoopbackSyncServer::authenticate(const std::string& email,
                                                  const std::string& auth_token) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::Authenticate, std::nullopt)) {
        return SyncResult<void>::err(std::move(*failure));
    }
    auto it = tokens_.find(email);
    if (it == tokens_.end() || it->second != auth_token) {
        return SyncResult<void>::err(SyncError::auth_failed("invalid token for " + email));
    }
    return SyncResult<void>::ok();
}

SyncResult<size_t> LoopbackSyncServer::upload(const std::string& email,
                                              sync::SyncDataType type,
                                              const std::vector<sync::SyncRecord>& records) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::Upload, type)) {
        return SyncResult<size_t>::err(std::move(*failure));
    }

    auto& log = logs_[{email, type}];
    size_t stored = 0;
    for (const auto& record : records) {
        if (record.data_type != type) {
            return SyncResult<size_t>::err(SyncError::server(
                "record " + record.id.to_string() + " uploaded to the wrong type"));
        }
        const auto id = record.id.to_string();
        if (!log.ids.insert(id).second) {
            continue;
        }
        log.entries.push_back(
            QJsonDocument(sync::record_to_json(record)).toJson(QJsonDocument::Compact));
        ++stored;
    }
    qCDebug(braidNetworkLog) << "Stored" << stored << "of" << records.size()
                             << sync::to_string(type).c_str() << "records";
    return SyncResult<size_t>::ok(stored);
}

SyncResult<DownloadBatch> LoopbackSyncServer::download(const std::string& email,
                                                       sync::SyncDataType type,
                                                       uint64_t after_cursor) {
    std::lock_guard lock(mutex_);
    if (auto failure = take_failure(Operation::Download, type)) {
        return SyncResult<DownloadBatch>::err(std::move(*failure));
    }

    DownloadBatch batch;
    auto it = logs_.find({email, type});
    if (it == logs_.end()) {
        batch.cursor = after_cursor;
        return SyncResult<DownloadBatch>::ok(std::move(batch));
    }

    const auto& entries = it->second.entries;
    for (uint64_t i = after_cursor; i < entries.size(); ++i) {
        QJsonParseError err{};
        const auto doc = QJsonDocument::fromJson(entries[i], &err);
        if (err.error != QJsonParseError::NoError || !doc.isObject()) {
            batch.rejected.push_back(SyncError::serialization(
                "record " + std::to_string(i) + " is not a JSON object"));
            continue;
        }
        auto record = sync::record_from_json(doc.object());
        if (record.is_err()) {
            batch.rejected.push_back(record.unwrap_err());
            continue;
        }
        batch.records.push_back(std::move(record).unwrap());
    }
    batch.cursor = std::max<uint64_t>(after_cursor, entries.size());
    return SyncResult<DownloadBatch>::ok(std::move(batch));
}

// ============================================================================
// LoopbackTransport
// ============================================================================

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackSyncServer> server)
    : server_(std::move(server))
{
}

SyncResult<void> LoopbackTransport::authenticate(const sync::SyncAccount& account,
                                                 const sync::SyncAccountCredentials& credentials) {
    auto result = server_->authenticate(account.email, credentials.auth_token);
    if (result.is_ok()) {
        email_ = account.email;
    } else {
        email_.reset();
    }
    return result;
}

SyncResult<size_t> LoopbackTransport::upload(sync::SyncDataType type,
                                             const std::vector<sync::SyncRecord>& records) {
    if (!email_) {
        return SyncResult<size_t>::err(SyncError::auth_failed("transport is not authenticated"));
    }
    return server_->upload(*email_, type, records);
}

SyncResult<DownloadBatch> LoopbackTransport::download(sync::SyncDataType type,
                                                      uint64_t after_cursor) {
    if (!email_) {
        return SyncResult<DownloadBatch>::err(
            SyncError::auth_failed("transport is not authenticated"));
    }
    return server_->download(*email_, type, after_cursor);
}

} // namespace braid::network

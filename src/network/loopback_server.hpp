#pragma once

#include "network/transport.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace braid::network {

/**
 * LoopbackSyncServer - an in-process sync remote.
 *
 * Keeps an append-only log of serialized records per (account, type) and
 * ignores uploads of record ids it already holds. Failures can be queued
 * to exercise error paths; each injected failure fires once.
 */
class LoopbackSyncServer {
public:
    enum class Operation {
        Authenticate,
        Upload,
        Download
    };

    /**
     * Accept `auth_token` for `email`.
     */
    void register_account(const std::string& email, const std::string& auth_token);

    /**
     * Fail the next `op` (optionally only for `type`) with `error`.
     */
    void inject_failure(Operation op,
                        sync::SyncError error,
                        std::optional<sync::SyncDataType> type = std::nullopt);

    /**
     * Append raw JSON to a log, bypassing validation.
     */
    void store_raw(const std::string& email, sync::SyncDataType type, const QJsonObject& record);

    [[nodiscard]] size_t record_count(const std::string& email, sync::SyncDataType type) const;

    [[nodiscard]] sync::SyncResult<void> authenticate(const std::string& email,
                                                      const std::string& auth_token);
    [[nodiscard]] sync::SyncResult<size_t> upload(const std::string& email,
                                                  sync::SyncDataType type,
                                                  const std::vector<sync::SyncRecord>& records);
    [[nodiscard]] sync::SyncResult<DownloadBatch> download(const std::string& email,
                                                           sync::SyncDataType type,
                                                           uint64_t after_cursor);

private:
    struct Log {
        std::vector<QByteArray> entries;
        std::set<std::string> ids;
    };

    struct Injected {
        Operation op;
        sync::SyncError error;
        std::optional<sync::SyncDataType> type;
    };

    using LogKey = std::pair<std::string, sync::SyncDataType>;

    std::optional<sync::SyncError> take_failure(Operation op,
                                                std::optional<sync::SyncDataType> type);

    mutable std::mutex mutex_;
    std::map<std::string, std::string> tokens_;
    std::map<LogKey, Log> logs_;
    std::vector<Injected> failures_;
};

/**
 * LoopbackTransport - SyncTransport for one device talking to a
 * LoopbackSyncServer.
 */
class LoopbackTransport : public SyncTransport {
public:
    explicit LoopbackTransport(std::shared_ptr<LoopbackSyncServer> server);

    sync::SyncResult<void> authenticate(
        const sync::SyncAccount& account,
        const sync::SyncAccountCredentials& credentials) override;

    sync::SyncResult<size_t> upload(
        sync::SyncDataType type,
        const std::vector<sync::SyncRecord>& records) override;

    sync::SyncResult<DownloadBatch> download(
        sync::SyncDataType type,
        uint64_t after_cursor) override;

private:
    std::shared_ptr<LoopbackSyncServer> server_;
    std::optional<std::string> email_;
};

} // namespace braid::network

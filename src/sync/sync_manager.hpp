#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/encryption.hpp"
#include "network/transport.hpp"
#include "storage/database.hpp"
#include "storage/sync_state_repository.hpp"
#include "sync/account.hpp"
#include "sync/conflict.hpp"
#include "sync/offline_queue.hpp"
#include "sync/status.hpp"
#include "sync/syncable_data.hpp"
#include <QObject>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace braid::sync {

/**
 * SyncManager - runs sync cycles for one device and one account.
 *
 * A cycle authenticates, drains the offline queue and then, per data type
 * in priority order, uploads local changes, downloads remote ones, resolves
 * conflicts against the last known change of each entity and applies the
 * result through the type's SyncableData. A failing type never stops its
 * siblings; its queued changes are put back for the next cycle.
 *
 * sync() blocks on the data sources and the transport, so it may be called
 * from a worker thread. Only one cycle runs at a time; a second concurrent
 * call fails with SyncInProgress.
 */
class SyncManager : public QObject {
    Q_OBJECT

public:
    /**
     * Open the state database named in `config` (in memory when empty),
     * apply migrations and load the persisted offline queue.
     */
    [[nodiscard]] static SyncResult<std::unique_ptr<SyncManager>> create(
        SyncConfig config,
        std::shared_ptr<network::SyncTransport> transport,
        QObject* parent = nullptr);

    ~SyncManager() override;

    /**
     * Sign in and derive the encryption key from `password`.
     */
    [[nodiscard]] SyncResult<void> login(SyncAccount account,
                                         SyncAccountCredentials credentials,
                                         std::string_view password);

    /**
     * Forget the account, key, queued changes and sync progress, and clear
     * the synced data of every registered source.
     */
    [[nodiscard]] SyncResult<void> logout();

    [[nodiscard]] bool is_logged_in() const;
    [[nodiscard]] std::optional<SyncAccount> account() const;

    /**
     * Register the source for its data type, replacing any earlier one.
     */
    void register_data_source(std::shared_ptr<SyncableData> source);

    /**
     * Queue a change made while offline. Safe from any thread.
     */
    [[nodiscard]] SyncResult<void> queue_change(Change change);

    [[nodiscard]] size_t pending_changes() const { return queue_.len(); }

    void set_conflict_strategy(ConflictStrategy strategy);
    [[nodiscard]] ConflictStrategy conflict_strategy() const;

    [[nodiscard]] SyncResult<crypto::EncryptedData> encrypt(std::span<const uint8_t> data) const;
    [[nodiscard]] SyncResult<std::vector<uint8_t>> decrypt(const crypto::EncryptedData& data) const;

    /**
     * Run one cycle over `types`. Callers name every type they want
     * synchronized; an empty list does nothing and succeeds.
     *
     * Errors: NotLoggedIn (no account or expired credentials; state stays
     * Idle), SyncInProgress, RateLimited while an earlier rate limit has not
     * elapsed, AuthFailed, and failures to read or restore the queue.
     * Everything scoped to one type is reported in the result instead.
     */
    [[nodiscard]] SyncResult<SyncOperationResult> sync(std::vector<SyncDataType> types);

    /**
     * Stop starting cycles until resume(). A running cycle finishes.
     */
    void pause();
    void resume();

    [[nodiscard]] SyncResult<void> set_type_enabled(SyncDataType type, bool enabled);

    [[nodiscard]] SyncStatus status() const;
    [[nodiscard]] SyncResult<TypeSyncStatus> type_status(SyncDataType type) const;

    [[nodiscard]] const SyncConfig& config() const noexcept { return config_; }

signals:
    void stateChanged(braid::sync::SyncState state);
    void cycleFinished(const braid::sync::SyncOperationResult& result);

private:
    SyncManager(SyncConfig config,
                std::shared_ptr<network::SyncTransport> transport,
                storage::Database db,
                QObject* parent);

    // What a cycle reads, copied once so the cycle runs without holding mutex_.
    struct CycleContext {
        SyncAccount account;
        SyncAccountCredentials credentials;
        std::optional<crypto::SyncEncryption> encryption;
        std::map<SyncDataType, std::shared_ptr<SyncableData>> sources;
        ConflictResolution resolver;
    };

    struct TypeOutcome {
        TypeSyncStatus status;
        std::optional<SyncError> error;
    };

    TypeOutcome sync_type(const CycleContext& ctx,
                          SyncDataType type,
                          const std::vector<QueuedChange>& queued);

    void set_state(SyncState state, std::optional<std::string> error = std::nullopt);
    void set_progress(uint8_t percent);
    void refresh_pending_counts();
    TypeSyncStatus& type_entry_locked(SyncDataType type);

    SyncConfig config_;
    std::shared_ptr<network::SyncTransport> transport_;
    storage::Database db_;
    storage::SyncStateRepository state_repo_;
    OfflineQueue queue_;

    // Held for the whole of a cycle, and by calls that replace what a cycle reads.
    std::mutex cycle_mutex_;

    // Guards everything below.
    mutable std::mutex mutex_;
    std::optional<SyncAccount> account_;
    std::optional<SyncAccountCredentials> credentials_;
    std::optional<crypto::SyncEncryption> encryption_;
    std::map<SyncDataType, std::shared_ptr<SyncableData>> sources_;
    ConflictResolution resolver_;
    SyncStatus status_;
    bool user_paused_ = false;
    std::optional<Timestamp> rate_limited_until_;
};

} // namespace braid::sync

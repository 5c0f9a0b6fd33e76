#include "sync/sync_manager.hpp"
#include "core/logging.hpp"
#include "crypto/keys.hpp"
#include "storage/migrations.hpp"
#include "sync/record.hpp"

#include <algorithm>
#include <chrono>
#include <set>

namespace braid::sync {

namespace {

SyncError storage_error(const std::string& what, const Error& error) {
    return SyncError::storage(what + ": " + error.message);
}

bool same_content(const Change& a, const Change& b) {
    return a.operation() == b.operation() && a.data() == b.data();
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

} // namespace

SyncResult<std::unique_ptr<SyncManager>> SyncManager::create(
    SyncConfig config,
    std::shared_ptr<network::SyncTransport> transport,
    QObject* parent
) {
    using R = SyncResult<std::unique_ptr<SyncManager>>;

    apply_debug_environment();

    if (!transport) {
        return R::err(SyncError::internal("SyncManager needs a transport"));
    }
    if (config.device_id.empty()) {
        return R::err(SyncError::invalid_data("device id must not be empty"));
    }

    auto init = crypto::init();
    if (init.is_err()) {
        qCWarning(braidSyncLog) << "Crypto initialization failed:" << init.unwrap_err().message.c_str();
        return R::err(SyncError::internal(init.unwrap_err().message));
    }

    auto opened = config.database_path.empty()
        ? storage::Database::open_memory()
        : storage::Database::open(config.database_path);
    if (opened.is_err()) {
        return R::err(storage_error("opening sync state", opened.unwrap_err()));
    }
    auto db = std::move(opened).unwrap();

    auto migrated = storage::initialize_database(db);
    if (migrated.is_err()) {
        return R::err(storage_error("migrating sync state", migrated.unwrap_err()));
    }

    std::unique_ptr<SyncManager> manager(
        new SyncManager(std::move(config), std::move(transport), std::move(db), parent));

    auto attached = manager->queue_.attach(manager->db_);
    if (attached.is_err()) {
        return R::err(attached.unwrap_err());
    }
    manager->refresh_pending_counts();
    return R::ok(std::move(manager));
}

SyncManager::SyncManager(SyncConfig config,
                         std::shared_ptr<network::SyncTransport> transport,
                         storage::Database db,
                         QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , transport_(std::move(transport))
    , db_(std::move(db))
    , state_repo_(db_)
    , queue_(config_.max_attempts)
    , resolver_(config_.conflict_strategy)
{
    qRegisterMetaType<braid::sync::SyncState>();
    qRegisterMetaType<braid::sync::SyncOperationResult>();

    for (auto type : all_data_types()) {
        type_entry_locked(type);
    }
}

SyncManager::~SyncManager() = default;

// ============================================================================
// Account
// ============================================================================

SyncResult<void> SyncManager::login(SyncAccount account,
                                    SyncAccountCredentials credentials,
                                    std::string_view password) {
    if (credentials.email != account.email) {
        return SyncResult<void>::err(
            SyncError::auth_failed("credentials do not belong to " + account.email));
    }
    if (credentials.is_expired()) {
        return SyncResult<void>::err(SyncError::auth_failed("credentials have expired"));
    }

    auto key = crypto::EncryptionKey::derive_from_password(password, account.email);
    if (key.is_err()) {
        return SyncResult<void>::err(key.unwrap_err());
    }

    std::lock_guard cycle(cycle_mutex_);

    std::map<SyncDataType, storage::TypeState> progress;
    for (auto type : all_data_types()) {
        auto state = state_repo_.load_type_state(type);
        if (state.is_err()) {
            return SyncResult<void>::err(storage_error("loading sync progress", state.unwrap_err()));
        }
        progress.emplace(type, state.unwrap());
    }

    {
        std::lock_guard lock(mutex_);
        for (auto type : all_data_types()) {
            auto& entry = type_entry_locked(type);
            entry.is_enabled = account.is_type_enabled(type);
            entry.last_sync = progress.at(type).last_sync;
        }
        account_ = std::move(account);
        credentials_ = std::move(credentials);
        encryption_.emplace(std::move(key).unwrap());
        qCInfo(braidSyncLog) << "Logged in to sync account" << account_->id.c_str();
    }
    return SyncResult<void>::ok();
}

SyncResult<void> SyncManager::logout() {
    std::lock_guard cycle(cycle_mutex_);

    std::map<SyncDataType, std::shared_ptr<SyncableData>> sources;
    {
        std::lock_guard lock(mutex_);
        account_.reset();
        credentials_.reset();
        encryption_.reset();
        rate_limited_until_.reset();
        sources = sources_;
        status_ = SyncStatus{};
        status_.is_enabled = !user_paused_;
        for (auto type : all_data_types()) {
            type_entry_locked(type);
        }
    }

    std::optional<SyncError> first_error;
    auto remember = [&first_error](SyncError error) {
        qCWarning(braidSyncLog) << "Logout:" << error.to_string().c_str();
        if (!first_error) first_error = std::move(error);
    };

    auto cleared = queue_.clear();
    if (cleared.is_err()) {
        remember(cleared.unwrap_err());
    }
    auto state_cleared = state_repo_.clear_all();
    if (state_cleared.is_err()) {
        remember(storage_error("clearing sync progress", state_cleared.unwrap_err()));
    }
    for (const auto& [type, source] : sources) {
        auto result = source->clear_sync_data();
        if (result.is_err()) {
            remember(result.unwrap_err());
        }
    }

    emit stateChanged(SyncState::Idle);
    qCInfo(braidSyncLog) << "Logged out of sync account";

    if (first_error) {
        return SyncResult<void>::err(std::move(*first_error));
    }
    return SyncResult<void>::ok();
}

bool SyncManager::is_logged_in() const {
    std::lock_guard lock(mutex_);
    return account_.has_value() && credentials_.has_value();
}

std::optional<SyncAccount> SyncManager::account() const {
    std::lock_guard lock(mutex_);
    return account_;
}

void SyncManager::register_data_source(std::shared_ptr<SyncableData> source) {
    if (!source) return;
    const auto type = source->data_type();
    std::lock_guard cycle(cycle_mutex_);
    std::lock_guard lock(mutex_);
    qCDebug(braidSyncLog) << "Registered" << source->get_sync_key().c_str();
    sources_[type] = std::move(source);
}

SyncResult<void> SyncManager::queue_change(Change change) {
    auto result = queue_.enqueue(std::move(change));
    refresh_pending_counts();
    return result;
}

void SyncManager::set_conflict_strategy(ConflictStrategy strategy) {
    std::lock_guard lock(mutex_);
    resolver_ = ConflictResolution(strategy);
}

ConflictStrategy SyncManager::conflict_strategy() const {
    std::lock_guard lock(mutex_);
    return resolver_.strategy();
}

SyncResult<crypto::EncryptedData> SyncManager::encrypt(std::span<const uint8_t> data) const {
    std::lock_guard lock(mutex_);
    if (!encryption_) {
        return SyncResult<crypto::EncryptedData>::err(SyncError::not_logged_in());
    }
    return encryption_->encrypt(data);
}

SyncResult<std::vector<uint8_t>> SyncManager::decrypt(const crypto::EncryptedData& data) const {
    std::lock_guard lock(mutex_);
    if (!encryption_) {
        return SyncResult<std::vector<uint8_t>>::err(SyncError::not_logged_in());
    }
    return encryption_->decrypt(data);
}

void SyncManager::pause() {
    bool changed = false;
    {
        std::lock_guard lock(mutex_);
        user_paused_ = true;
        status_.is_enabled = false;
        if (!status_.is_syncing() && status_.state != SyncState::Paused) {
            status_.set_state(SyncState::Paused);
            changed = true;
        }
    }
    if (changed) {
        emit stateChanged(SyncState::Paused);
    }
}

void SyncManager::resume() {
    bool changed = false;
    {
        std::lock_guard lock(mutex_);
        user_paused_ = false;
        status_.is_enabled = true;
        if (status_.state == SyncState::Paused) {
            status_.set_state(SyncState::Idle);
            changed = true;
        }
    }
    if (changed) {
        emit stateChanged(SyncState::Idle);
    }
}

SyncResult<void> SyncManager::set_type_enabled(SyncDataType type, bool enabled) {
    std::lock_guard lock(mutex_);
    if (!account_) {
        return SyncResult<void>::err(SyncError::not_logged_in());
    }
    if (enabled) {
        account_->enable_type(type);
    } else {
        account_->disable_type(type);
    }
    type_entry_locked(type).is_enabled = enabled;
    return SyncResult<void>::ok();
}

SyncStatus SyncManager::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

SyncResult<TypeSyncStatus> SyncManager::type_status(SyncDataType type) const {
    std::lock_guard lock(mutex_);
    if (!account_) {
        return SyncResult<TypeSyncStatus>::err(SyncError::not_logged_in());
    }
    if (const auto* entry = status_.find_type(type)) {
        return SyncResult<TypeSyncStatus>::ok(*entry);
    }
    TypeSyncStatus fresh;
    fresh.data_type = type;
    fresh.is_enabled = account_->is_type_enabled(type);
    return SyncResult<TypeSyncStatus>::ok(fresh);
}

// ============================================================================
// Status helpers
// ============================================================================

TypeSyncStatus& SyncManager::type_entry_locked(SyncDataType type) {
    if (auto* entry = status_.find_type(type)) {
        return *entry;
    }
    TypeSyncStatus entry;
    entry.data_type = type;
    status_.type_status.push_back(entry);
    return status_.type_status.back();
}

void SyncManager::set_state(SyncState state, std::optional<std::string> error) {
    {
        std::lock_guard lock(mutex_);
        status_.set_state(state);
        if (error) {
            status_.error_message = std::move(error);
        }
    }
    qCDebug(braidSyncLog) << "State" << to_string(state).c_str();
    emit stateChanged(state);
}

void SyncManager::set_progress(uint8_t percent) {
    std::lock_guard lock(mutex_);
    status_.progress = percent;
}

void SyncManager::refresh_pending_counts() {
    const auto counts = queue_.count_by_type();
    std::lock_guard lock(mutex_);
    uint64_t total = 0;
    for (auto& entry : status_.type_status) {
        auto it = counts.find(entry.data_type);
        entry.pending_changes = it == counts.end() ? 0 : it->second;
        total += entry.pending_changes;
    }
    status_.pending_changes = total;
}

// ============================================================================
// Cycle
// ============================================================================

SyncResult<SyncOperationResult> SyncManager::sync(std::vector<SyncDataType> types) {
    using R = SyncResult<SyncOperationResult>;

    std::unique_lock cycle(cycle_mutex_, std::try_to_lock);
    if (!cycle.owns_lock()) {
        return R::err(SyncError::sync_in_progress());
    }

    CycleContext ctx;
    {
        std::lock_guard lock(mutex_);
        if (!account_ || !credentials_ || credentials_->is_expired()) {
            return R::err(SyncError::not_logged_in());
        }
        if (user_paused_) {
            return R::ok(SyncOperationResult::failure("sync is paused"));
        }
        if (rate_limited_until_) {
            const auto now = Timestamp::now();
            if (now < *rate_limited_until_) {
                const auto remaining = (*rate_limited_until_ - now).count();
                return R::err(SyncError::rate_limited(static_cast<uint64_t>((remaining + 999) / 1000)));
            }
            rate_limited_until_.reset();
        }
        ctx.account = *account_;
        ctx.credentials = *credentials_;
        ctx.encryption = encryption_;
        ctx.sources = sources_;
        ctx.resolver = resolver_;
    }

    if (types.empty()) {
        qCDebug(braidSyncLog) << "Sync requested for no data types";
        return R::ok(SyncOperationResult::succeeded(0, 0, 0, 0));
    }
    const auto ordered = sorted_by_priority(std::move(types));

    const auto started = std::chrono::steady_clock::now();
    qCInfo(braidSyncLog) << "Sync cycle started for" << ordered.size() << "data types";
    set_state(SyncState::Checking);

    auto auth = transport_->authenticate(ctx.account, ctx.credentials);
    if (auth.is_err()) {
        const auto error = auth.unwrap_err();
        if (error.kind == SyncError::Kind::RateLimited) {
            {
                std::lock_guard lock(mutex_);
                rate_limited_until_ = Timestamp::now() +
                    std::chrono::seconds(error.retry_after_seconds);
            }
            auto result = SyncOperationResult::failure(error.to_string());
            result.retry_after_seconds = error.retry_after_seconds;
            result.duration_ms = elapsed_ms(started);
            set_state(SyncState::Paused);
            emit cycleFinished(result);
            return R::ok(std::move(result));
        }
        qCWarning(braidSyncLog) << "Authentication failed:" << error.to_string().c_str();
        set_state(SyncState::Error, error.to_string());
        return R::err(error);
    }
    {
        std::lock_guard lock(mutex_);
        if (account_) {
            account_->update_authenticated();
        }
    }

    auto drained = queue_.drain();
    if (drained.is_err()) {
        set_state(SyncState::Error, drained.unwrap_err().to_string());
        return R::err(drained.unwrap_err());
    }
    auto queued = std::move(drained).unwrap();
    std::map<SyncDataType, std::vector<QueuedChange>> queued_by_type;
    for (const auto& entry : queued) {
        queued_by_type[entry.change.data_type()].push_back(entry);
    }

    SyncOperationResult result;
    result.success = true;
    std::set<SyncDataType> delivered;
    std::map<SyncDataType, std::string> attempted_failures;
    std::map<SyncDataType, size_t> result_index;
    std::optional<SyncError> abort_error;
    std::optional<uint64_t> retry_after;
    std::vector<std::string> failure_messages;

    for (size_t i = 0; i < ordered.size(); ++i) {
        const auto type = ordered[i];
        TypeOutcome outcome;
        outcome.status.data_type = type;
        outcome.status.is_enabled = ctx.account.is_type_enabled(type);

        if (retry_after) {
            outcome.error = SyncError::rate_limited(*retry_after);
        } else if (abort_error) {
            outcome.error = *abort_error;
        } else if (!outcome.status.is_enabled) {
            outcome.error = SyncError::type_not_enabled(type);
        } else {
            outcome = sync_type(ctx, type, queued_by_type[type]);
            if (outcome.error) {
                attempted_failures[type] = outcome.error->to_string();
                if (outcome.error->kind == SyncError::Kind::RateLimited) {
                    retry_after = outcome.error->retry_after_seconds;
                } else if (outcome.error->kind == SyncError::Kind::AuthFailed) {
                    abort_error = outcome.error;
                }
            }
        }

        if (outcome.error) {
            if (outcome.error->kind != SyncError::Kind::TypeNotEnabled) {
                result.success = false;
                failure_messages.push_back(to_string(type) + ": " + outcome.error->to_string());
            }
        } else {
            delivered.insert(type);
            result.changes_uploaded += outcome.status.changes_uploaded;
            result.changes_downloaded += outcome.status.changes_downloaded;
            result.conflicts_resolved += outcome.status.conflicts_resolved;
        }

        {
            std::lock_guard lock(mutex_);
            auto& entry = type_entry_locked(type);
            entry.is_enabled = outcome.status.is_enabled;
            entry.changes_uploaded = outcome.status.changes_uploaded;
            entry.changes_downloaded = outcome.status.changes_downloaded;
            entry.conflicts_resolved = outcome.status.conflicts_resolved;
            entry.error = outcome.error;
            entry.entity_errors = outcome.status.entity_errors;
            if (outcome.status.last_sync) {
                entry.last_sync = outcome.status.last_sync;
            }
            if (!outcome.error) {
                entry.items_count = outcome.status.items_count;
            }
        }

        outcome.status.error = outcome.error;
        result_index[type] = result.type_results.size();
        result.type_results.push_back(std::move(outcome.status));
        set_progress(static_cast<uint8_t>((i + 1) * 100 / ordered.size()));
    }

    // Undelivered queue entries go back in their original order.
    std::vector<QueuedChange> leftover;
    std::vector<QueuedChange> finished_entries;
    for (auto& entry : queued) {
        const auto type = entry.change.data_type();
        if (delivered.contains(type)) {
            finished_entries.push_back(std::move(entry));
            continue;
        }
        auto failed = attempted_failures.find(type);
        if (failed != attempted_failures.end()) {
            entry.mark_failed(failed->second);
            if (!entry.should_retry(queue_.max_attempts())) {
                auto error = SyncError::internal(
                    "gave up on queued change after " + std::to_string(entry.attempts) +
                    " attempts: " + failed->second).for_entity(entry.change.entity_id());
                qCWarning(braidSyncLog) << error.to_string().c_str();
                result.type_results[result_index.at(type)].entity_errors.push_back(error);
                {
                    std::lock_guard lock(mutex_);
                    type_entry_locked(type).entity_errors.push_back(error);
                }
                finished_entries.push_back(std::move(entry));
                continue;
            }
        }
        leftover.push_back(std::move(entry));
    }
    auto restored = queue_.restore(std::move(leftover));
    refresh_pending_counts();
    if (restored.is_err()) {
        qCWarning(braidSyncLog) << "Failed to persist restored queue:" << restored.unwrap_err().to_string().c_str();
        set_state(SyncState::Error, restored.unwrap_err().to_string());
        return R::err(restored.unwrap_err());
    }
    auto acknowledged = queue_.acknowledge(finished_entries);
    if (acknowledged.is_err()) {
        qCWarning(braidSyncLog) << "Failed to remove delivered queue entries:"
                                << acknowledged.unwrap_err().to_string().c_str();
        set_state(SyncState::Error, acknowledged.unwrap_err().to_string());
        return R::err(acknowledged.unwrap_err());
    }

    if (abort_error) {
        qCWarning(braidSyncLog) << "Sync cycle aborted:" << abort_error->to_string().c_str();
        set_state(SyncState::Error, abort_error->to_string());
        return R::err(*abort_error);
    }

    result.duration_ms = elapsed_ms(started);
    const auto finished = Timestamp::now();
    {
        std::lock_guard lock(mutex_);
        status_.conflicts_detected = result.conflicts_resolved;
        if (!delivered.empty()) {
            status_.last_sync = finished;
        }
    }

    if (retry_after) {
        {
            std::lock_guard lock(mutex_);
            rate_limited_until_ = finished + std::chrono::seconds(*retry_after);
        }
        result.retry_after_seconds = retry_after;
        result.error_message = SyncError::rate_limited(*retry_after).to_string();
        qCInfo(braidSyncLog) << "Sync paused by rate limit for" << *retry_after << "seconds";
        set_state(SyncState::Paused);
    } else if (!result.success) {
        std::string message;
        for (const auto& m : failure_messages) {
            if (!message.empty()) message += "; ";
            message += m;
        }
        result.error_message = message;
        qCWarning(braidSyncLog) << "Sync cycle finished with errors:" << message.c_str();
        set_state(SyncState::Error, message);
    } else {
        {
            std::lock_guard lock(mutex_);
            status_.complete(finished);
        }
        qCInfo(braidSyncLog) << "Sync cycle finished: uploaded" << result.changes_uploaded
                             << "downloaded" << result.changes_downloaded
                             << "conflicts" << result.conflicts_resolved
                             << "in" << result.duration_ms << "ms";
        emit stateChanged(SyncState::Idle);
    }

    {
        std::lock_guard lock(mutex_);
        status_.progress.reset();
    }
    emit cycleFinished(result);
    return R::ok(std::move(result));
}

SyncManager::TypeOutcome SyncManager::sync_type(const CycleContext& ctx,
                                                SyncDataType type,
                                                const std::vector<QueuedChange>& queued) {
    TypeOutcome outcome;
    auto& ts = outcome.status;
    ts.data_type = type;
    ts.is_enabled = true;

    auto fail = [&](SyncError error) {
        qCWarning(braidSyncLog) << "Sync of" << to_string(type).c_str() << "failed:"
                                << error.to_string().c_str();
        outcome.error = std::move(error);
        return std::move(outcome);
    };

    auto source_it = ctx.sources.find(type);
    if (source_it == ctx.sources.end()) {
        return fail(SyncError::internal("no data source registered for " + to_string(type)));
    }
    auto& source = *source_it->second;
    const crypto::SyncEncryption* encryption = ctx.encryption ? &*ctx.encryption : nullptr;

    auto state_result = state_repo_.load_type_state(type);
    if (state_result.is_err()) {
        return fail(storage_error("loading sync progress", state_result.unwrap_err()));
    }
    const auto state = state_result.unwrap();
    ts.last_sync = state.last_sync;

    auto heads_result = state_repo_.load_heads(type);
    if (heads_result.is_err()) {
        return fail(storage_error("loading entity heads", heads_result.unwrap_err()));
    }
    auto heads = std::move(heads_result).unwrap();
    std::map<std::string, Change> touched;
    auto set_head = [&](const Change& change) {
        heads.insert_or_assign(change.entity_id(), change);
        touched.insert_or_assign(change.entity_id(), change);
    };

    // ---- local changes ----
    // Edits stamped in the millisecond the last gather ran may not have been
    // read by it, so that millisecond is read again; a re-read change that
    // does not order after the entity's head already went out.
    const auto gathered_at = Timestamp::now();
    auto local_result = state.last_sync
        ? source.get_changes_since(*state.last_sync - std::chrono::milliseconds(1))
        : source.get_all_data();
    if (local_result.is_err()) {
        return fail(local_result.unwrap_err());
    }

    std::vector<Change> local;
    std::set<Uuid> seen;
    for (auto& change : local_result.unwrap()) {
        if (change.data_type() != type) {
            qCWarning(braidSyncLog) << source.get_sync_key().c_str() << "returned a"
                                    << to_string(change.data_type()).c_str() << "change";
            continue;
        }
        if (state.last_sync && change.timestamp() <= *state.last_sync) {
            auto head = heads.find(change.entity_id());
            if (head != heads.end() && (head->second.id() == change.id() ||
                                        change.sort_key() <= head->second.sort_key())) {
                continue;
            }
        }
        if (seen.insert(change.id()).second) {
            local.push_back(std::move(change));
        }
    }
    for (const auto& entry : queued) {
        if (seen.insert(entry.change.id()).second) {
            local.push_back(entry.change);
        }
    }

    // ---- upload ----
    set_state(SyncState::Uploading);
    std::vector<SyncRecord> records;
    records.reserve(local.size());
    for (const auto& change : local) {
        auto record = encode_record(change, encryption);
        if (record.is_err()) {
            return fail(record.unwrap_err());
        }
        records.push_back(std::move(record).unwrap());
    }
    if (!records.empty()) {
        auto uploaded = transport_->upload(type, records);
        if (uploaded.is_err()) {
            return fail(uploaded.unwrap_err());
        }
    }
    ts.changes_uploaded = records.size();
    for (const auto& change : local) {
        set_head(change);
    }

    // ---- download ----
    set_state(SyncState::Downloading);
    auto batch_result = transport_->download(type, state.remote_cursor);
    if (batch_result.is_err()) {
        return fail(batch_result.unwrap_err());
    }
    auto batch = std::move(batch_result).unwrap();
    for (auto& rejected : batch.rejected) {
        qCWarning(braidSyncLog) << "Rejected remote" << to_string(type).c_str() << "record:"
                                << rejected.to_string().c_str();
        ts.entity_errors.push_back(std::move(rejected));
    }

    std::vector<Change> incoming;
    for (const auto& record : batch.records) {
        // Our own uploads are skipped once the type has synced; on a first
        // sync (fresh install or after logout) they restore local data.
        if (state.last_sync && record.device_id == config_.device_id) {
            continue;
        }
        auto change = decode_record(record, encryption);
        if (change.is_err()) {
            qCWarning(braidSyncLog) << "Corrupt remote" << to_string(type).c_str() << "entity:"
                                    << change.unwrap_err().to_string().c_str();
            ts.entity_errors.push_back(change.unwrap_err());
            continue;
        }
        incoming.push_back(std::move(change).unwrap());
    }
    ts.changes_downloaded = incoming.size();

    // ---- resolve ----
    // Only entities with a change sent in this cycle can conflict. Every
    // other remote change is ordered against the entity's head.
    std::map<std::string, Change> pending;
    for (const auto& change : local) {
        pending.insert_or_assign(change.entity_id(), change);
    }

    set_state(SyncState::ResolvingConflicts);
    std::vector<Change> to_apply;
    std::vector<Change> to_upload;
    for (const auto& remote : incoming) {
        auto head = heads.find(remote.entity_id());
        if (head != heads.end() && head->second.id() == remote.id()) {
            continue;
        }

        auto mine = pending.find(remote.entity_id());
        if (mine == pending.end()) {
            if (head == heads.end() || remote.sort_key() > head->second.sort_key()) {
                to_apply.push_back(remote);
                set_head(remote);
            }
            continue;
        }

        const Change local_change = mine->second;
        Conflict conflict(local_change, remote);
        const Change resolved = conflict.resolve(ctx.resolver);
        ++ts.conflicts_resolved;
        qCDebug(braidSyncLog) << "Conflict on" << remote.entity_id().c_str() << "resolved by"
                              << to_string(ctx.resolver.strategy()).c_str();

        if (!same_content(resolved, local_change)) {
            to_apply.push_back(resolved);
        }
        if (resolved.id() == local_change.id()) {
            continue;
        }
        set_head(resolved);
        if (resolved.id() == remote.id()) {
            pending.erase(mine);
            continue;
        }
        if (!same_content(resolved, remote)) {
            to_upload.push_back(resolved);
        }
        mine->second = resolved;
    }

    // ---- apply ----
    if (!to_apply.empty()) {
        auto applied = source.apply_changes(to_apply);
        if (applied.is_err()) {
            return fail(applied.unwrap_err());
        }
        qCDebug(braidSyncLog) << "Applied" << applied.unwrap() << "of" << to_apply.size()
                              << to_string(type).c_str() << "changes";
    }

    if (!to_upload.empty()) {
        std::vector<SyncRecord> resolution_records;
        for (const auto& change : to_upload) {
            auto record = encode_record(change, encryption);
            if (record.is_err()) {
                return fail(record.unwrap_err());
            }
            resolution_records.push_back(std::move(record).unwrap());
        }
        auto uploaded = transport_->upload(type, resolution_records);
        if (uploaded.is_err()) {
            return fail(uploaded.unwrap_err());
        }
        ts.changes_uploaded += resolution_records.size();
    }

    // ---- commit ----
    std::vector<Change> changed_heads;
    changed_heads.reserve(touched.size());
    for (auto& [entity_id, change] : touched) {
        changed_heads.push_back(std::move(change));
    }
    storage::TypeState next;
    next.last_sync = gathered_at;
    next.remote_cursor = batch.cursor;
    auto committed = state_repo_.commit_cycle(type, next, changed_heads);
    if (committed.is_err()) {
        return fail(storage_error("saving sync progress", committed.unwrap_err()));
    }

    ts.last_sync = gathered_at;
    ts.items_count = heads.size();
    qCDebug(braidSyncLog) << to_string(type).c_str() << "synced: up" << ts.changes_uploaded
                          << "down" << ts.changes_downloaded
                          << "conflicts" << ts.conflicts_resolved;
    return outcome;
}

} // namespace braid::sync

#include "sync/conflict.hpp"
#include "crypto/keys.hpp"

#include <QJsonObject>
#include <algorithm>
#include <array>

namespace braid::sync {

namespace {

// Both devices of a conflict derive the same id, whichever side is local.
Uuid merged_id(const Uuid& a, const Uuid& b) {
    const auto& first = std::min(a, b);
    const auto& second = std::max(a, b);
    std::array<uint8_t, Uuid::BYTE_SIZE * 2> input{};
    std::copy(first.bytes().begin(), first.bytes().end(), input.begin());
    std::copy(second.bytes().begin(), second.bytes().end(), input.begin() + Uuid::BYTE_SIZE);
    const auto digest = crypto::hash(input, Uuid::BYTE_SIZE);
    return Uuid::from_digest(digest.data(), digest.size());
}

} // namespace

std::string to_string(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::LastWriteWins: return "last_write_wins";
        case ConflictStrategy::LocalWins: return "local_wins";
        case ConflictStrategy::RemoteWins: return "remote_wins";
        case ConflictStrategy::Merge: return "merge";
        case ConflictStrategy::KeepBoth: return "keep_both";
    }
    return "unknown";
}

std::optional<ConflictStrategy> parse_strategy(std::string_view name) {
    if (name == "last_write_wins") return ConflictStrategy::LastWriteWins;
    if (name == "local_wins") return ConflictStrategy::LocalWins;
    if (name == "remote_wins") return ConflictStrategy::RemoteWins;
    if (name == "merge") return ConflictStrategy::Merge;
    if (name == "keep_both") return ConflictStrategy::KeepBoth;
    return std::nullopt;
}

const Change& last_write_wins(const Change& local, const Change& remote) {
    return local.sort_key() >= remote.sort_key() ? local : remote;
}

Change merge_changes(const Change& local, const Change& remote) {
    if (!local.data().isObject() || !remote.data().isObject()) {
        return last_write_wins(local, remote);
    }

    // Remote wins a timestamp tie.
    const bool remote_newer = remote.timestamp() >= local.timestamp();
    const auto& older = remote_newer ? local : remote;
    const auto& newer = remote_newer ? remote : local;

    QJsonObject merged = older.data().toObject();
    const QJsonObject overlay = newer.data().toObject();
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        merged.insert(it.key(), it.value());
    }

    return local.with_data(merged)
        .with_id(merged_id(local.id(), remote.id()))
        .with_timestamp(std::max(local.timestamp(), remote.timestamp()))
        .with_version(std::max(local.version(), remote.version()) + 1);
}

Change ConflictResolution::resolve(const Change& local, const Change& remote) const {
    switch (strategy_) {
        case ConflictStrategy::LocalWins:
            return local;
        case ConflictStrategy::RemoteWins:
            return remote;
        case ConflictStrategy::Merge:
            return merge_changes(local, remote);
        case ConflictStrategy::KeepBoth:
            // Keeps the newer side only; versions are not consulted.
            return local.timestamp() >= remote.timestamp() ? local : remote;
        case ConflictStrategy::LastWriteWins:
            break;
    }
    return last_write_wins(local, remote);
}

const Change& Conflict::resolve(const ConflictResolution& resolver) {
    if (!resolved_) {
        resolved_ = resolver.resolve(local_, remote_);
        resolution_strategy_ = resolver.strategy();
    }
    return *resolved_;
}

} // namespace braid::sync

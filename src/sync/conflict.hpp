#pragma once

#include "sync/change.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace braid::sync {

/**
 * ConflictStrategy - how two changes to the same entity are reconciled.
 *
 * KeepBoth is degraded until data sources can hold sibling entities: it
 * keeps the side with the later timestamp, and local on a timestamp tie.
 */
enum class ConflictStrategy {
    LastWriteWins,
    LocalWins,
    RemoteWins,
    Merge,
    KeepBoth
};

// Snake_case names: "last_write_wins", "local_wins", ...
[[nodiscard]] std::string to_string(ConflictStrategy strategy);
[[nodiscard]] std::optional<ConflictStrategy> parse_strategy(std::string_view name);

/**
 * ConflictResolution - pure (local, remote) -> resolved change.
 *
 * resolve() is deterministic: the same inputs always produce an equal
 * Change, including the id of a merged change, which is derived from the
 * ids of both inputs.
 */
class ConflictResolution {
public:
    ConflictResolution() = default;
    explicit ConflictResolution(ConflictStrategy strategy) : strategy_(strategy) {}

    [[nodiscard]] ConflictStrategy strategy() const noexcept { return strategy_; }

    [[nodiscard]] Change resolve(const Change& local, const Change& remote) const;

private:
    ConflictStrategy strategy_{ConflictStrategy::LastWriteWins};
};

/**
 * Later (timestamp, version) wins; a full tie keeps local.
 */
[[nodiscard]] const Change& last_write_wins(const Change& local, const Change& remote);

/**
 * Field-wise union of two object payloads. Non-object payloads on either
 * side fall back to last_write_wins().
 */
[[nodiscard]] Change merge_changes(const Change& local, const Change& remote);

/**
 * Conflict - a detected local/remote pair and, once resolved, the outcome.
 */
class Conflict {
public:
    Conflict(Change local, Change remote)
        : local_(std::move(local)), remote_(std::move(remote)) {}

    /**
     * Resolve with `resolver`. Idempotent: a second call returns the
     * already resolved change without consulting the resolver.
     */
    const Change& resolve(const ConflictResolution& resolver);

    [[nodiscard]] bool is_resolved() const noexcept { return resolved_.has_value(); }

    [[nodiscard]] const Change& local() const noexcept { return local_; }
    [[nodiscard]] const Change& remote() const noexcept { return remote_; }
    [[nodiscard]] const std::optional<Change>& resolved() const noexcept { return resolved_; }
    [[nodiscard]] std::optional<ConflictStrategy> resolution_strategy() const noexcept {
        return resolution_strategy_;
    }

private:
    Change local_;
    Change remote_;
    std::optional<Change> resolved_;
    std::optional<ConflictStrategy> resolution_strategy_;
};

} // namespace braid::sync

#pragma once

#include "core/types.hpp"
#include "sync/change.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace braid::sync {

/**
 * QueuedChange - a change waiting in the offline queue, with delivery
 * bookkeeping.
 */
struct QueuedChange {
    Uuid id;
    Change change;
    Timestamp queued_at;
    uint32_t attempts{0};
    std::optional<std::string> last_error;

    explicit QueuedChange(Change c)
        : id(Uuid::generate())
        , change(std::move(c))
        , queued_at(Timestamp::now())
    {}

    /**
     * Record a failed delivery attempt.
     */
    void mark_failed(std::string error) {
        ++attempts;
        last_error = std::move(error);
    }

    [[nodiscard]] bool should_retry(uint32_t max_attempts) const noexcept {
        return attempts < max_attempts;
    }

    bool operator==(const QueuedChange&) const = default;
};

} // namespace braid::sync

#pragma once

#include "types.hpp"

namespace tiercache {

// Versioned value envelope stored and returned by every cache operation.
// Objects handed to callers are copies; a mutation always produces a new
// version in the owning backend.
struct Object {
    CacheKey key;
    Value value;
    Version version = NO_VERSION;
    std::optional<Timestamp> expire_at;

    bool is_expired() const noexcept {
        if (!expire_at) return false;
        return SystemClock::now() >= *expire_at;
    }

    // Time left before expiry, nullopt if the object never expires
    std::optional<std::chrono::milliseconds> remaining_ttl() const;
};

// Selects what an operation hands back to the caller
enum class Return {
    Value,
    Key,
    Object
};

using Reply = std::variant<Value, CacheKey, Object>;

Reply make_reply(const Object& object, Return mode);

// Reply for an operation that found nothing
Reply make_miss_reply(const CacheKey& key, Return mode);

}  // namespace tiercache

#pragma once

#include "types.hpp"
#include "object.hpp"
#include "fallback.hpp"
#include "transaction.hpp"
#include <elio/coro/task.hpp>
#include <unordered_map>
#include <unordered_set>

namespace tiercache {

// Read options
struct ReadOptions {
    Return ret = Return::Value;
    std::optional<size_t> level;     // 1-based level, multilevel caches only
    std::optional<Version> version;  // Expected version (pop)
    FallbackRef fallback;            // Overrides the cache default on total miss
};

// Write options
struct WriteOptions {
    Return ret = Return::Value;
    std::optional<size_t> level;
    std::optional<Version> version;  // Expected version of the stored object
    std::optional<std::chrono::milliseconds> ttl;  // Time-to-live
};

// Delete options
struct DeleteOptions {
    Return ret = Return::Key;
    std::optional<size_t> level;
    std::optional<Version> version;
};

enum class CacheResult {
    Hit,
    Miss,
    Error
};

// Result of a cache read operation
struct ReadResult {
    CacheResult result = CacheResult::Miss;
    Status status;
    std::optional<Object> object;
    Reply reply;

    bool ok() const noexcept { return status.ok(); }
    bool is_hit() const noexcept { return result == CacheResult::Hit; }
    bool is_miss() const noexcept { return result == CacheResult::Miss; }

    // Bare value, nil on miss
    Value value() const { return object ? object->value : Value::nil(); }

    static ReadResult hit(Object object, Return mode);
    static ReadResult miss(const CacheKey& key, Return mode);
    static ReadResult failure(Status status);
};

struct WriteResult {
    Status status;
    Object object;
    Reply reply;

    bool ok() const noexcept { return status.ok(); }

    static WriteResult success(Object object, Return mode);
    static WriteResult failure(Status status);
};

struct DeleteResult {
    Status status;
    std::optional<Object> object;  // Removed object, if one existed
    Reply reply;

    bool ok() const noexcept { return status.ok(); }

    static DeleteResult removed(std::optional<Object> object, const CacheKey& key, Return mode);
    static DeleteResult failure(Status status);
};

struct CounterResult {
    Status status;
    int64_t value = 0;
    Object object;

    bool ok() const noexcept { return status.ok(); }
};

// Result of get_and_update / update. `updated` is empty when the key was popped.
struct UpdateResult {
    Status status;
    Value retained;
    std::optional<Value> updated;

    bool ok() const noexcept { return status.ok(); }
};

struct MapResult {
    Status status;
    std::unordered_map<CacheKey, Reply> entries;

    bool ok() const noexcept { return status.ok(); }
};

template <typename Acc>
struct ReduceResult {
    Status status;
    Acc acc;

    bool ok() const noexcept { return status.ok(); }
};

using KeySet = std::unordered_set<CacheKey>;
using ObjectVisitor = std::function<void(const Object&)>;

// Returned by a get_and_update function to delete the key
struct PopTag {};
inline constexpr PopTag POP{};

// (retained value handed back to the caller, new value to store), or POP
using UpdateDecision = std::variant<std::pair<Value, Value>, PopTag>;
using GetAndUpdateFn = std::function<UpdateDecision(const Value& current)>;
using UpdateFn = std::function<Value(const Value& current)>;

// Abstract cache interface. Implemented by single levels and by the
// multilevel coordinator, so a multilevel cache can itself be a level.
class ICache {
public:
    virtual ~ICache() = default;

    virtual const std::string& name() const noexcept = 0;

    // Core operations (async)
    virtual elio::coro::task<ReadResult> get(
        const CacheKey& key,
        const ReadOptions& opts = {}) = 0;

    virtual elio::coro::task<WriteResult> set(
        const CacheKey& key,
        Value value,
        const WriteOptions& opts = {}) = 0;

    virtual elio::coro::task<DeleteResult> remove(
        const CacheKey& key,
        const DeleteOptions& opts = {}) = 0;

    virtual elio::coro::task<bool> has_key(const CacheKey& key) = 0;

    // Enumeration
    virtual elio::coro::task<size_t> size() = 0;
    virtual elio::coro::task<Status> flush() = 0;
    virtual elio::coro::task<KeySet> keys() = 0;

    // Visits every live object in the cache's own iteration order.
    // The visitor runs without any cache lock held.
    virtual elio::coro::task<Status> each(const ObjectVisitor& visit) = 0;

    virtual elio::coro::task<MapResult> to_map(const ReadOptions& opts = {}) = 0;

    // Read-modify-write
    virtual elio::coro::task<CounterResult> update_counter(
        const CacheKey& key,
        int64_t amount = 1,
        const WriteOptions& opts = {}) = 0;

    virtual elio::coro::task<ReadResult> pop(
        const CacheKey& key,
        const ReadOptions& opts = {}) = 0;

    virtual elio::coro::task<UpdateResult> get_and_update(
        const CacheKey& key,
        GetAndUpdateFn fn,
        const WriteOptions& opts = {}) = 0;

    virtual elio::coro::task<UpdateResult> update(
        const CacheKey& key,
        Value initial,
        UpdateFn fn,
        const WriteOptions& opts = {}) = 0;

    // Transactions
    virtual elio::coro::task<Status> transaction(
        TransactionFn fn,
        TransactionOptions opts = {}) = 0;

    virtual bool in_transaction(const TransactionContext& ctx) const noexcept = 0;

    // Folds fn(object, acc) -> acc over each()
    template <typename Acc, typename Fn>
    elio::coro::task<ReduceResult<Acc>> reduce(Acc acc, Fn fn) {
        auto status = co_await each([&acc, &fn](const Object& object) {
            acc = fn(object, std::move(acc));
        });
        co_return ReduceResult<Acc>{std::move(status), std::move(acc)};
    }

    // Statistics
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t writes = 0;
        uint64_t deletes = 0;
        size_t entry_count = 0;
    };

    virtual Stats stats() const = 0;

    // Lifecycle
    virtual elio::coro::task<Status> start() = 0;
    virtual elio::coro::task<void> stop() = 0;
};

}  // namespace tiercache

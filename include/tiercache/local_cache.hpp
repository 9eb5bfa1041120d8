#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "transaction.hpp"
#include <elio/sync/primitives.hpp>
#include <elio/io/io_context.hpp>
#include <atomic>

namespace tiercache {

// Single-node in-process cache level.
// Entries carry versions from a per-cache generation counter and optional
// expiry; expired entries read as missing and are dropped on the next write
// or enumeration.
class LocalCache : public ICache {
public:
    LocalCache(const LocalCacheConfig& config,
               LockTable& locks,
               elio::io::io_context& io_ctx,
               const TransactionConfig& txn_config = {});
    ~LocalCache() override;

    const std::string& name() const noexcept override { return config_.name; }

    // ICache interface
    elio::coro::task<ReadResult> get(
        const CacheKey& key,
        const ReadOptions& opts = {}) override;

    elio::coro::task<WriteResult> set(
        const CacheKey& key,
        Value value,
        const WriteOptions& opts = {}) override;

    elio::coro::task<DeleteResult> remove(
        const CacheKey& key,
        const DeleteOptions& opts = {}) override;

    elio::coro::task<bool> has_key(const CacheKey& key) override;

    elio::coro::task<size_t> size() override;
    elio::coro::task<Status> flush() override;
    elio::coro::task<KeySet> keys() override;
    elio::coro::task<Status> each(const ObjectVisitor& visit) override;
    elio::coro::task<MapResult> to_map(const ReadOptions& opts = {}) override;

    elio::coro::task<CounterResult> update_counter(
        const CacheKey& key,
        int64_t amount = 1,
        const WriteOptions& opts = {}) override;

    elio::coro::task<ReadResult> pop(
        const CacheKey& key,
        const ReadOptions& opts = {}) override;

    elio::coro::task<UpdateResult> get_and_update(
        const CacheKey& key,
        GetAndUpdateFn fn,
        const WriteOptions& opts = {}) override;

    elio::coro::task<UpdateResult> update(
        const CacheKey& key,
        Value initial,
        UpdateFn fn,
        const WriteOptions& opts = {}) override;

    elio::coro::task<Status> transaction(
        TransactionFn fn,
        TransactionOptions opts = {}) override;

    bool in_transaction(const TransactionContext& ctx) const noexcept override {
        return txn_.in_transaction(ctx);
    }

    Stats stats() const override;

    elio::coro::task<Status> start() override;
    elio::coro::task<void> stop() override;

private:
    LocalCacheConfig config_;
    TransactionManager txn_;

    mutable elio::sync::shared_mutex mutex_;
    std::unordered_map<CacheKey, Object> entries_;
    Version generation_ = NO_VERSION;  // Guarded by mutex_

    // Statistics
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<size_t> entry_count_{0};

    // Helpers below require mutex_ held exclusively
    Object* find_live(const CacheKey& key);
    Object& store(const CacheKey& key, Value value, std::optional<Timestamp> expire_at);
    void erase(const CacheKey& key);
    void purge_expired();
    std::optional<Timestamp> expiry_for(const WriteOptions& opts, const Object* current) const;
};

}  // namespace tiercache

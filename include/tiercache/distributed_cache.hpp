#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "transaction.hpp"
#include <elio/io/io_context.hpp>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>

namespace tiercache {

// Consistent hash ring mapping keys to node indices
class HashRing {
public:
    explicit HashRing(size_t virtual_nodes = 150);

    void add_node(size_t node);
    void remove_node(size_t node);

    // Node responsible for a key, nullopt on an empty ring
    std::optional<size_t> node_for(const CacheKey& key) const;

    size_t node_count() const;

private:
    size_t virtual_nodes_;
    std::map<uint64_t, size_t> ring_;
    std::set<size_t> nodes_;
    mutable std::shared_mutex mutex_;

    static uint64_t hash_point(size_t node, size_t replica);
};

// Level whose keys are partitioned over a fixed set of node caches.
// Each node is an ICache; how a node is reached (in-process or through a
// remote proxy) is up to the node implementation.
class DistributedCache : public ICache {
public:
    // Throws std::invalid_argument when nodes is empty
    DistributedCache(const DistributedConfig& config,
                     std::vector<std::shared_ptr<ICache>> nodes,
                     LockTable& locks,
                     elio::io::io_context& io_ctx,
                     const TransactionConfig& txn_config = {});
    ~DistributedCache() override;

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

    // Node owning a key
    ICache& node_for(const CacheKey& key);
    size_t node_count() const noexcept { return nodes_.size(); }

private:
    DistributedConfig config_;
    std::vector<std::shared_ptr<ICache>> nodes_;
    HashRing ring_;
    TransactionManager txn_;
};

}  // namespace tiercache

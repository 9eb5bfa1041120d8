#pragma once

#include "cache.hpp"
#include "config.hpp"
#include "fallback.hpp"
#include "transaction.hpp"
#include <elio/io/io_context.hpp>
#include <memory>
#include <vector>

namespace tiercache {

// Multilevel cache coordinator.
//
// Cascades every operation over an ordered list of levels (level 1 first).
// Under the inclusive model a read hit at level k is backfilled into levels
// 1..k-1; under the exclusive model it is moved to level 1, so a key lives
// in at most one level. Backfill and relocation complete before get()
// returns. The coordinator itself holds no mutable state: levels are
// independently synchronized and there is no cross-level rollback.
class MultilevelCache : public ICache {
public:
    // Throws std::invalid_argument on an empty or null level
    MultilevelCache(const MultilevelConfig& config,
                    std::vector<std::shared_ptr<ICache>> levels,
                    LockTable& locks,
                    elio::io::io_context& io_ctx,
                    std::shared_ptr<const FallbackRegistry> registry = nullptr,
                    const TransactionConfig& txn_config = {});
    ~MultilevelCache() override;

    const std::string& name() const noexcept override { return config_.name; }
    CacheModel model() const noexcept { return config_.model; }

    size_t level_count() const noexcept { return levels_.size(); }

    // 1-based level access
    ICache& level(size_t index) { return *levels_.at(index - 1); }

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

    // Raw footprint: a key replicated on three levels counts three times
    elio::coro::task<size_t> size() override;

    // Best-effort, not atomic across levels
    elio::coro::task<Status> flush() override;

    elio::coro::task<KeySet> keys() override;

    // Level order, then each level's native order. A key already visited
    // at a shallower level is skipped at deeper ones.
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
    // First level holding a key
    struct Lookup {
        Status status;
        std::optional<Object> object;
        size_t index = 0;  // 0-based
    };

    MultilevelConfig config_;
    std::vector<std::shared_ptr<ICache>> levels_;
    FallbackResolver resolver_;
    TransactionManager txn_;

    Status check_level(const std::optional<size_t>& level) const;

    elio::coro::task<Lookup> lookup(const CacheKey& key);

    // Compares an expected version against the shallowest stored object
    elio::coro::task<Status> check_version(const CacheKey& key,
                                           const std::optional<Version>& expected);

    elio::coro::task<ReadResult> fetch(const CacheKey& key,
                                       const ReadOptions& opts,
                                       bool use_fallback);

    elio::coro::task<ReadResult> backfill(const Object& found, size_t index);
    elio::coro::task<ReadResult> relocate(const Object& found, size_t index);

    elio::coro::task<ReadResult> resolve_fallback(const CacheKey& key,
                                                  const ReadOptions& opts);

    // Writes to the levels selected by opts and the model
    elio::coro::task<WriteResult> write_levels(const CacheKey& key,
                                               Value value,
                                               const WriteOptions& opts);

    // Removes from every level except `keep` (0-based), ignoring NotFound
    elio::coro::task<DeleteResult> remove_levels(const CacheKey& key,
                                                 std::optional<size_t> keep = std::nullopt);

    // Carries a read-modify-write done at level `index` (0-based) to the
    // other levels: the new value under inclusive, removal under exclusive
    // or when the key was popped (`updated` empty)
    elio::coro::task<Status> propagate(const CacheKey& key,
                                       size_t index,
                                       const std::optional<Value>& updated,
                                       const WriteOptions& opts);
};

}  // namespace tiercache

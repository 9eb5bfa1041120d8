#include "tiercache/distributed_cache.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace tiercache {

// HashRing

HashRing::HashRing(size_t virtual_nodes)
    : virtual_nodes_(virtual_nodes == 0 ? 1 : virtual_nodes)
{}

uint64_t HashRing::hash_point(size_t node, size_t replica) {
    uint64_t combined = (static_cast<uint64_t>(node) + 1) ^ (replica * 0x9E3779B97F4A7C15ULL);
    combined ^= combined >> 33;
    combined *= 0xff51afd7ed558ccdULL;
    combined ^= combined >> 33;
    combined *= 0xc4ceb9fe1a85ec53ULL;
    combined ^= combined >> 33;
    return combined;
}

void HashRing::add_node(size_t node) {
    std::unique_lock lock(mutex_);
    if (!nodes_.insert(node).second) {
        return;
    }
    for (size_t i = 0; i < virtual_nodes_; ++i) {
        ring_[hash_point(node, i)] = node;
    }
}

void HashRing::remove_node(size_t node) {
    std::unique_lock lock(mutex_);
    if (nodes_.erase(node) == 0) {
        return;
    }
    for (auto it = ring_.begin(); it != ring_.end();) {
        if (it->second == node) {
            it = ring_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<size_t> HashRing::node_for(const CacheKey& key) const {
    std::shared_lock lock(mutex_);
    if (ring_.empty()) {
        return std::nullopt;
    }

    auto it = ring_.lower_bound(key.hash());
    if (it == ring_.end()) {
        it = ring_.begin();
    }
    return it->second;
}

size_t HashRing::node_count() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

// DistributedCache

DistributedCache::DistributedCache(const DistributedConfig& config,
                                   std::vector<std::shared_ptr<ICache>> nodes,
                                   LockTable& locks,
                                   elio::io::io_context& io_ctx,
                                   const TransactionConfig& txn_config)
    : config_(config)
    , nodes_(std::move(nodes))
    , ring_(config.virtual_nodes)
    , txn_(config.name, locks, io_ctx, txn_config)
{
    if (nodes_.empty()) {
        throw std::invalid_argument("distributed cache '" + config_.name + "' needs at least one node");
    }
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (!nodes_[i]) {
            throw std::invalid_argument("distributed cache '" + config_.name + "' has a null node");
        }
        ring_.add_node(i);
    }
}

DistributedCache::~DistributedCache() = default;

ICache& DistributedCache::node_for(const CacheKey& key) {
    // The ring always holds every node index
    return *nodes_[ring_.node_for(key).value_or(0)];
}

elio::coro::task<ReadResult> DistributedCache::get(
    const CacheKey& key,
    const ReadOptions& opts)
{
    co_return co_await node_for(key).get(key, opts);
}

elio::coro::task<WriteResult> DistributedCache::set(
    const CacheKey& key,
    Value value,
    const WriteOptions& opts)
{
    co_return co_await node_for(key).set(key, std::move(value), opts);
}

elio::coro::task<DeleteResult> DistributedCache::remove(
    const CacheKey& key,
    const DeleteOptions& opts)
{
    co_return co_await node_for(key).remove(key, opts);
}

elio::coro::task<bool> DistributedCache::has_key(const CacheKey& key) {
    co_return co_await node_for(key).has_key(key);
}

elio::coro::task<size_t> DistributedCache::size() {
    size_t total = 0;
    for (auto& node : nodes_) {
        total += co_await node->size();
    }
    co_return total;
}

elio::coro::task<Status> DistributedCache::flush() {
    Status first = Status::make_ok();
    for (auto& node : nodes_) {
        auto status = co_await node->flush();
        if (!status) {
            std::cerr << "[TierCache] flush of node '" << node->name()
                      << "' failed: " << status.to_string() << "\n";
            if (first) {
                first = std::move(status);
            }
        }
    }
    co_return first;
}

elio::coro::task<KeySet> DistributedCache::keys() {
    KeySet result;
    for (auto& node : nodes_) {
        auto node_keys = co_await node->keys();
        result.insert(node_keys.begin(), node_keys.end());
    }
    co_return result;
}

elio::coro::task<Status> DistributedCache::each(const ObjectVisitor& visit) {
    for (auto& node : nodes_) {
        auto status = co_await node->each(visit);
        if (!status) {
            co_return status;
        }
    }
    co_return Status::make_ok();
}

elio::coro::task<MapResult> DistributedCache::to_map(const ReadOptions& opts) {
    MapResult result;
    for (auto& node : nodes_) {
        auto part = co_await node->to_map(opts);
        if (!part.ok()) {
            result.status = std::move(part.status);
            co_return result;
        }
        result.entries.merge(part.entries);
    }
    co_return result;
}

elio::coro::task<CounterResult> DistributedCache::update_counter(
    const CacheKey& key,
    int64_t amount,
    const WriteOptions& opts)
{
    co_return co_await node_for(key).update_counter(key, amount, opts);
}

elio::coro::task<ReadResult> DistributedCache::pop(
    const CacheKey& key,
    const ReadOptions& opts)
{
    co_return co_await node_for(key).pop(key, opts);
}

elio::coro::task<UpdateResult> DistributedCache::get_and_update(
    const CacheKey& key,
    GetAndUpdateFn fn,
    const WriteOptions& opts)
{
    co_return co_await node_for(key).get_and_update(key, std::move(fn), opts);
}

elio::coro::task<UpdateResult> DistributedCache::update(
    const CacheKey& key,
    Value initial,
    UpdateFn fn,
    const WriteOptions& opts)
{
    co_return co_await node_for(key).update(key, std::move(initial), std::move(fn), opts);
}

elio::coro::task<Status> DistributedCache::transaction(TransactionFn fn, TransactionOptions opts) {
    co_return co_await txn_.run(std::move(fn), std::move(opts));
}

ICache::Stats DistributedCache::stats() const {
    Stats total;
    for (const auto& node : nodes_) {
        auto s = node->stats();
        total.hits += s.hits;
        total.misses += s.misses;
        total.writes += s.writes;
        total.deletes += s.deletes;
        total.entry_count += s.entry_count;
    }
    return total;
}

elio::coro::task<Status> DistributedCache::start() {
    for (auto& node : nodes_) {
        auto status = co_await node->start();
        if (!status) {
            co_return status;
        }
    }
    co_return Status::make_ok();
}

elio::coro::task<void> DistributedCache::stop() {
    for (auto& node : nodes_) {
        co_await node->stop();
    }
    co_return;
}

}  // namespace tiercache

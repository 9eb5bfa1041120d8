#pragma once

#include "types.hpp"
#include "config.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace tiercache {

using TransactionId = uint64_t;

// Identifies one lock: a key of a cache scope, or the scope as a whole
struct LockKey {
    std::string scope;
    CacheKey key;
    bool whole_cache = false;

    static LockKey for_key(std::string scope, const CacheKey& key) {
        return LockKey{std::move(scope), key, false};
    }
    static LockKey global(std::string scope) {
        return LockKey{std::move(scope), CacheKey(), true};
    }

    // Canonical acquisition order: scope, then the whole-cache lock, then keys
    bool operator<(const LockKey& other) const noexcept;
    bool operator==(const LockKey& other) const noexcept {
        return whole_cache == other.whole_cache && scope == other.scope && key == other.key;
    }

    uint64_t hash() const noexcept;
    std::string to_string() const;
};

struct LockKeyHash {
    size_t operator()(const LockKey& k) const noexcept { return k.hash(); }
};

struct LockEntry {
    TransactionId owner = 0;
    Timestamp acquired_at;
};

// Shared table of transaction locks, sharded to keep unrelated keys off
// each other's mutex. One table may serve many caches; lock keys carry the
// cache scope.
class LockTable {
public:
    static constexpr size_t SHARD_COUNT = 16;

    LockTable() = default;
    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;

    // Non-blocking; fails if another owner holds the key
    bool try_acquire(const LockKey& key, TransactionId owner);

    // Only the owner may release
    bool release(const LockKey& key, TransactionId owner);

    std::optional<LockEntry> holder(const LockKey& key) const;
    size_t size() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<LockKey, LockEntry, LockKeyHash> entries;
    };

    std::array<Shard, SHARD_COUNT> shards_;

    Shard& shard_for(const LockKey& key) { return shards_[key.hash() % SHARD_COUNT]; }
    const Shard& shard_for(const LockKey& key) const { return shards_[key.hash() % SHARD_COUNT]; }
};

enum class TransactionState {
    Acquiring,
    Running,
    Committed,
    Aborted
};

const char* transaction_state_name(TransactionState state) noexcept;

// Live state of one transaction attempt
class Transaction {
public:
    Transaction(TransactionId id, std::string scope)
        : id_(id), scope_(std::move(scope)) {}

    TransactionId id() const noexcept { return id_; }
    const std::string& scope() const noexcept { return scope_; }

    TransactionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    void set_state(TransactionState state) noexcept { state_.store(state, std::memory_order_release); }

private:
    TransactionId id_;
    std::string scope_;
    std::atomic<TransactionState> state_{TransactionState::Acquiring};
};

// Explicit "am I inside a transaction" handle passed down the call chain.
// A default-constructed context is outside any transaction.
class TransactionContext {
public:
    TransactionContext() = default;
    explicit TransactionContext(std::shared_ptr<const Transaction> txn)
        : txn_(std::move(txn)) {}

    bool active() const noexcept {
        return txn_ && txn_->state() == TransactionState::Running;
    }

    bool active_in(std::string_view scope) const noexcept {
        return active() && txn_->scope() == scope;
    }

    TransactionId id() const noexcept { return txn_ ? txn_->id() : 0; }
    const Transaction* transaction() const noexcept { return txn_.get(); }

private:
    std::shared_ptr<const Transaction> txn_;
};

struct TransactionOptions {
    std::vector<CacheKey> keys;  // Empty = whole-cache lock
    std::optional<size_t> retries;  // Lock acquisition attempts
    std::optional<std::chrono::milliseconds> timeout;  // Per-attempt wait
};

using TransactionFn = std::function<elio::coro::task<Status>(TransactionContext&)>;

// Key-scoped mutual exclusion around a block of cache operations.
//
// ACQUIRING -> RUNNING -> COMMITTED | ABORTED. All requested locks are taken
// in canonical order, all-or-nothing, polling until the per-attempt timeout.
// Exhausting the attempts aborts with ErrorCode::TransactionAborted. Locks are
// released in reverse order whatever the block's outcome.
//
// Nested transactions are not flattened: a nested block over keys its parent
// holds waits on the parent and aborts once its attempts run out.
class TransactionManager {
public:
    TransactionManager(std::string scope,
                       LockTable& locks,
                       elio::io::io_context& io_ctx,
                       TransactionConfig config = {});

    elio::coro::task<Status> run(TransactionFn fn, TransactionOptions opts = {});

    bool in_transaction(const TransactionContext& ctx) const noexcept {
        return ctx.active_in(scope_);
    }

    const std::string& scope() const noexcept { return scope_; }
    const TransactionConfig& config() const noexcept { return config_; }

private:
    std::string scope_;
    LockTable& locks_;
    elio::io::io_context& io_ctx_;
    TransactionConfig config_;

    std::vector<LockKey> lock_keys(const TransactionOptions& opts) const;

    elio::coro::task<bool> acquire(const std::vector<LockKey>& keys,
                                   TransactionId owner,
                                   size_t attempts,
                                   std::chrono::milliseconds timeout,
                                   std::vector<LockKey>& acquired);

    bool try_acquire_all(const std::vector<LockKey>& keys,
                         TransactionId owner,
                         std::vector<LockKey>& acquired);

    void release_all(std::vector<LockKey>& acquired, TransactionId owner);

    static TransactionId next_id();
};

}  // namespace tiercache

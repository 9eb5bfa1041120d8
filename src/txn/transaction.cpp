#include "tiercache/transaction.hpp"
#include <elio/time/timer.hpp>
#include <algorithm>
#include <iostream>

namespace tiercache {

// LockKey

bool LockKey::operator<(const LockKey& other) const noexcept {
    if (scope != other.scope) return scope < other.scope;
    if (whole_cache != other.whole_cache) return whole_cache;
    return key < other.key;
}

uint64_t LockKey::hash() const noexcept {
    uint64_t h = std::hash<std::string>{}(scope);
    uint64_t k = whole_cache ? 0x9E3779B97F4A7C15ULL : key.hash();
    // Mix the bits
    h ^= k + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    return h;
}

std::string LockKey::to_string() const {
    return whole_cache ? scope + ":*" : scope + ":" + key.str();
}

// LockTable

bool LockTable::try_acquire(const LockKey& key, TransactionId owner) {
    auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto [it, inserted] = shard.entries.try_emplace(key, LockEntry{owner, SystemClock::now()});
    return inserted;
}

bool LockTable::release(const LockKey& key, TransactionId owner) {
    auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end() || it->second.owner != owner) {
        return false;
    }
    shard.entries.erase(it);
    return true;
}

std::optional<LockEntry> LockTable::holder(const LockKey& key) const {
    const auto& shard = shard_for(key);
    std::lock_guard lock(shard.mutex);

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t LockTable::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

const char* transaction_state_name(TransactionState state) noexcept {
    switch (state) {
        case TransactionState::Acquiring: return "acquiring";
        case TransactionState::Running:   return "running";
        case TransactionState::Committed: return "committed";
        case TransactionState::Aborted:   return "aborted";
    }
    return "unknown";
}

// TransactionManager

namespace {

// Releases held locks when the block exits, normally or by exception
class LockRelease {
public:
    LockRelease(std::function<void()> release) : release_(std::move(release)) {}
    ~LockRelease() { release_(); }

    LockRelease(const LockRelease&) = delete;
    LockRelease& operator=(const LockRelease&) = delete;

private:
    std::function<void()> release_;
};

}  // namespace

TransactionManager::TransactionManager(std::string scope,
                                       LockTable& locks,
                                       elio::io::io_context& io_ctx,
                                       TransactionConfig config)
    : scope_(std::move(scope))
    , locks_(locks)
    , io_ctx_(io_ctx)
    , config_(config)
{}

TransactionId TransactionManager::next_id() {
    static std::atomic<TransactionId> counter{0};
    return ++counter;
}

std::vector<LockKey> TransactionManager::lock_keys(const TransactionOptions& opts) const {
    std::vector<LockKey> keys;
    if (opts.keys.empty()) {
        keys.push_back(LockKey::global(scope_));
        return keys;
    }

    keys.reserve(opts.keys.size());
    for (const auto& key : opts.keys) {
        keys.push_back(LockKey::for_key(scope_, key));
    }

    // Canonical order prevents deadlock between overlapping key sets
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

elio::coro::task<Status> TransactionManager::run(TransactionFn fn, TransactionOptions opts) {
    if (!fn) {
        co_return Status::error(ErrorCode::InvalidArgument, "Empty transaction function");
    }

    auto keys = lock_keys(opts);
    auto txn = std::make_shared<Transaction>(next_id(), scope_);
    size_t attempts = std::max<size_t>(opts.retries.value_or(config_.retries), 1);
    auto timeout = opts.timeout.value_or(config_.lock_timeout);

    std::vector<LockKey> acquired;
    bool locked = co_await acquire(keys, txn->id(), attempts, timeout, acquired);
    if (!locked) {
        txn->set_state(TransactionState::Aborted);
        std::cerr << "[TierCache] transaction " << txn->id() << " on '" << scope_
                  << "' aborted after " << attempts << " lock attempt(s)\n";
        co_return Status::error(ErrorCode::TransactionAborted, "transaction aborted");
    }

    txn->set_state(TransactionState::Running);
    TransactionContext ctx(txn);

    Status status;
    {
        LockRelease release([this, &acquired, &txn]() {
            if (txn->state() == TransactionState::Running) {
                txn->set_state(TransactionState::Aborted);
            }
            release_all(acquired, txn->id());
        });

        status = co_await fn(ctx);
        txn->set_state(status.ok() ? TransactionState::Committed : TransactionState::Aborted);
    }

    co_return status;
}

elio::coro::task<bool> TransactionManager::acquire(const std::vector<LockKey>& keys,
                                                   TransactionId owner,
                                                   size_t attempts,
                                                   std::chrono::milliseconds timeout,
                                                   std::vector<LockKey>& acquired) {
    for (size_t attempt = 0; attempt < attempts; ++attempt) {
        auto deadline = Clock::now() + timeout;

        while (true) {
            if (try_acquire_all(keys, owner, acquired)) {
                co_return true;
            }

            auto now = Clock::now();
            if (now >= deadline) {
                break;
            }

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            auto wait = std::max(std::min(left, config_.poll_interval), std::chrono::milliseconds(1));
            co_await elio::time::sleep_for(io_ctx_, wait);
        }
    }

    co_return false;
}

bool TransactionManager::try_acquire_all(const std::vector<LockKey>& keys,
                                         TransactionId owner,
                                         std::vector<LockKey>& acquired) {
    for (const auto& key : keys) {
        if (!locks_.try_acquire(key, owner)) {
            release_all(acquired, owner);
            return false;
        }
        acquired.push_back(key);
    }
    return true;
}

void TransactionManager::release_all(std::vector<LockKey>& acquired, TransactionId owner) {
    for (auto it = acquired.rbegin(); it != acquired.rend(); ++it) {
        // Keys are only ever released by their owner
        (void)locks_.release(*it, owner);
    }
    acquired.clear();
}

}  // namespace tiercache

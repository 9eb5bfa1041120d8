#include "tiercache/local_cache.hpp"
#include <limits>
#include <vector>

namespace tiercache {

namespace {

// Adopts an elio shared_mutex already locked by the caller
class AdoptedLock {
public:
    explicit AdoptedLock(elio::sync::shared_mutex& m) : mutex_(m) {}
    ~AdoptedLock() { mutex_.unlock(); }

    AdoptedLock(const AdoptedLock&) = delete;
    AdoptedLock& operator=(const AdoptedLock&) = delete;

private:
    elio::sync::shared_mutex& mutex_;
};

class AdoptedSharedLock {
public:
    explicit AdoptedSharedLock(elio::sync::shared_mutex& m) : mutex_(m) {}
    ~AdoptedSharedLock() { mutex_.unlock_shared(); }

    AdoptedSharedLock(const AdoptedSharedLock&) = delete;
    AdoptedSharedLock& operator=(const AdoptedSharedLock&) = delete;

private:
    elio::sync::shared_mutex& mutex_;
};

Status check_version(const Object* current, const std::optional<Version>& expected) {
    if (!expected || !current || current->version == *expected) {
        return Status::make_ok();
    }
    return Status::error(ErrorCode::VersionConflict,
                         "Version conflict on key '" + current->key.str() + "': expected " +
                         std::to_string(*expected) + ", stored " +
                         std::to_string(current->version));
}

Status check_key(const CacheKey& key) {
    if (key.size() > MAX_KEY_SIZE) {
        return Status::error(ErrorCode::KeyTooLarge, "Key exceeds maximum size");
    }
    return Status::make_ok();
}

}  // namespace

LocalCache::LocalCache(const LocalCacheConfig& config,
                       LockTable& locks,
                       elio::io::io_context& io_ctx,
                       const TransactionConfig& txn_config)
    : config_(config)
    , txn_(config.name, locks, io_ctx, txn_config)
{}

LocalCache::~LocalCache() = default;

Object* LocalCache::find_live(const CacheKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.is_expired()) {
        entries_.erase(it);
        entry_count_--;
        return nullptr;
    }
    return &it->second;
}

Object& LocalCache::store(const CacheKey& key, Value value, std::optional<Timestamp> expire_at) {
    auto [it, inserted] = entries_.try_emplace(key);
    if (inserted) {
        entry_count_++;
    }

    Object& object = it->second;
    object.key = key;
    object.value = std::move(value);
    object.version = ++generation_;
    object.expire_at = expire_at;

    writes_++;
    return object;
}

void LocalCache::erase(const CacheKey& key) {
    if (entries_.erase(key) > 0) {
        entry_count_--;
        deletes_++;
    }
}

void LocalCache::purge_expired() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.is_expired()) {
            it = entries_.erase(it);
            entry_count_--;
        } else {
            ++it;
        }
    }
}

std::optional<Timestamp> LocalCache::expiry_for(const WriteOptions& opts, const Object* current) const {
    if (opts.ttl) {
        return SystemClock::now() + *opts.ttl;
    }
    if (current) {
        return current->expire_at;
    }
    if (config_.default_ttl) {
        return SystemClock::now() + *config_.default_ttl;
    }
    return std::nullopt;
}

elio::coro::task<ReadResult> LocalCache::get(
    const CacheKey& key,
    const ReadOptions& opts)
{
    std::optional<Object> found;
    {
        co_await mutex_.lock_shared();
        AdoptedSharedLock guard(mutex_);

        auto it = entries_.find(key);
        if (it != entries_.end() && !it->second.is_expired()) {
            found = it->second;
        }
    }

    if (!found) {
        misses_++;
        co_return ReadResult::miss(key, opts.ret);
    }

    hits_++;
    co_return ReadResult::hit(std::move(*found), opts.ret);
}

elio::coro::task<WriteResult> LocalCache::set(
    const CacheKey& key,
    Value value,
    const WriteOptions& opts)
{
    auto status = check_key(key);
    if (!status) {
        co_return WriteResult::failure(std::move(status));
    }

    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    Object* current = find_live(key);
    status = check_version(current, opts.version);
    if (!status) {
        co_return WriteResult::failure(std::move(status));
    }

    // A plain set replaces the object, expiry included
    Object& object = store(key, std::move(value), expiry_for(opts, nullptr));
    co_return WriteResult::success(object, opts.ret);
}

elio::coro::task<DeleteResult> LocalCache::remove(
    const CacheKey& key,
    const DeleteOptions& opts)
{
    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    Object* current = find_live(key);
    if (!current) {
        co_return DeleteResult::removed(std::nullopt, key, opts.ret);
    }

    auto status = check_version(current, opts.version);
    if (!status) {
        co_return DeleteResult::failure(std::move(status));
    }

    Object removed = std::move(*current);
    erase(key);
    co_return DeleteResult::removed(std::move(removed), key, opts.ret);
}

elio::coro::task<bool> LocalCache::has_key(const CacheKey& key) {
    co_await mutex_.lock_shared();
    AdoptedSharedLock guard(mutex_);

    auto it = entries_.find(key);
    co_return it != entries_.end() && !it->second.is_expired();
}

elio::coro::task<size_t> LocalCache::size() {
    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    purge_expired();
    co_return entries_.size();
}

elio::coro::task<Status> LocalCache::flush() {
    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    entries_.clear();
    entry_count_ = 0;
    co_return Status::make_ok();
}

elio::coro::task<KeySet> LocalCache::keys() {
    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    purge_expired();
    KeySet result;
    result.reserve(entries_.size());
    for (const auto& [key, object] : entries_) {
        result.insert(key);
    }
    co_return result;
}

elio::coro::task<Status> LocalCache::each(const ObjectVisitor& visit) {
    std::vector<Object> snapshot;
    {
        co_await mutex_.lock();
        AdoptedLock guard(mutex_);

        purge_expired();
        snapshot.reserve(entries_.size());
        for (const auto& [key, object] : entries_) {
            snapshot.push_back(object);
        }
    }

    for (const auto& object : snapshot) {
        visit(object);
    }
    co_return Status::make_ok();
}

elio::coro::task<MapResult> LocalCache::to_map(const ReadOptions& opts) {
    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    purge_expired();
    MapResult result;
    result.entries.reserve(entries_.size());
    for (const auto& [key, object] : entries_) {
        result.entries.emplace(key, make_reply(object, opts.ret));
    }
    co_return result;
}

elio::coro::task<CounterResult> LocalCache::update_counter(
    const CacheKey& key,
    int64_t amount,
    const WriteOptions& opts)
{
    CounterResult result;
    result.status = check_key(key);
    if (!result.status) {
        co_return result;
    }

    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    Object* current = find_live(key);
    result.status = check_version(current, opts.version);
    if (!result.status) {
        co_return result;
    }

    int64_t base = 0;
    if (current) {
        if (!current->value.is_integer()) {
            result.status = Status::error(ErrorCode::TypeMismatch,
                                          "Counter key '" + key.str() + "' holds a non-integer value");
            co_return result;
        }
        base = current->value.as_integer();
    }

    if ((amount > 0 && base > std::numeric_limits<int64_t>::max() - amount) ||
        (amount < 0 && base < std::numeric_limits<int64_t>::min() - amount)) {
        result.status = Status::error(ErrorCode::InvalidArgument,
                                      "Counter key '" + key.str() + "' would overflow");
        co_return result;
    }

    auto expire_at = expiry_for(opts, current);
    Object& object = store(key, Value::integer(base + amount), expire_at);
    result.value = object.value.as_integer();
    result.object = object;
    co_return result;
}

elio::coro::task<ReadResult> LocalCache::pop(
    const CacheKey& key,
    const ReadOptions& opts)
{
    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    Object* current = find_live(key);
    if (!current) {
        misses_++;
        co_return ReadResult::miss(key, opts.ret);
    }

    auto status = check_version(current, opts.version);
    if (!status) {
        co_return ReadResult::failure(std::move(status));
    }

    hits_++;
    Object popped = std::move(*current);
    erase(key);
    co_return ReadResult::hit(std::move(popped), opts.ret);
}

elio::coro::task<UpdateResult> LocalCache::get_and_update(
    const CacheKey& key,
    GetAndUpdateFn fn,
    const WriteOptions& opts)
{
    UpdateResult result;
    result.status = check_key(key);
    if (!result.status) {
        co_return result;
    }

    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    Object* current = find_live(key);
    result.status = check_version(current, opts.version);
    if (!result.status) {
        co_return result;
    }

    Value current_value = current ? current->value : Value::nil();
    auto decision = fn(current_value);

    if (std::holds_alternative<PopTag>(decision)) {
        result.retained = std::move(current_value);
        if (current) {
            erase(key);
        }
        co_return result;
    }

    auto& [retained, updated] = std::get<std::pair<Value, Value>>(decision);
    auto expire_at = expiry_for(opts, current);
    store(key, updated, expire_at);
    result.retained = std::move(retained);
    result.updated = std::move(updated);
    co_return result;
}

elio::coro::task<UpdateResult> LocalCache::update(
    const CacheKey& key,
    Value initial,
    UpdateFn fn,
    const WriteOptions& opts)
{
    UpdateResult result;
    result.status = check_key(key);
    if (!result.status) {
        co_return result;
    }

    co_await mutex_.lock();
    AdoptedLock guard(mutex_);

    Object* current = find_live(key);
    result.status = check_version(current, opts.version);
    if (!result.status) {
        co_return result;
    }

    Value updated = current ? fn(current->value) : std::move(initial);
    result.retained = current ? current->value : Value::nil();

    auto expire_at = expiry_for(opts, current);
    store(key, updated, expire_at);
    result.updated = std::move(updated);
    co_return result;
}

elio::coro::task<Status> LocalCache::transaction(TransactionFn fn, TransactionOptions opts) {
    co_return co_await txn_.run(std::move(fn), std::move(opts));
}

ICache::Stats LocalCache::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.writes = writes_.load();
    s.deletes = deletes_.load();
    s.entry_count = entry_count_.load();
    return s;
}

elio::coro::task<Status> LocalCache::start() {
    co_return Status::make_ok();
}

elio::coro::task<void> LocalCache::stop() {
    co_await mutex_.lock();
    entries_.clear();
    entry_count_ = 0;
    mutex_.unlock();
    co_return;
}

}  // namespace tiercache

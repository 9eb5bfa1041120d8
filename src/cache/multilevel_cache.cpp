#include "tiercache/multilevel_cache.hpp"
#include <iostream>
#include <stdexcept>

namespace tiercache {

namespace {

// Options forwarded to a single level: no level selection, no fallback
ReadOptions level_read(Return ret = Return::Object) {
    ReadOptions opts;
    opts.ret = ret;
    return opts;
}

WriteOptions level_write(const WriteOptions& opts, bool keep_version) {
    WriteOptions out;
    out.ret = Return::Object;
    out.ttl = opts.ttl;
    if (keep_version) {
        out.version = opts.version;
    }
    return out;
}

DeleteOptions level_delete(const DeleteOptions& opts, bool keep_version) {
    DeleteOptions out;
    out.ret = Return::Object;
    if (keep_version) {
        out.version = opts.version;
    }
    return out;
}

Status version_conflict(const Object& object, Version expected) {
    return Status::error(ErrorCode::VersionConflict,
                         "Version conflict on key '" + object.key.str() + "': expected " +
                         std::to_string(expected) + ", stored " +
                         std::to_string(object.version));
}

}  // namespace

MultilevelCache::MultilevelCache(const MultilevelConfig& config,
                                 std::vector<std::shared_ptr<ICache>> levels,
                                 LockTable& locks,
                                 elio::io::io_context& io_ctx,
                                 std::shared_ptr<const FallbackRegistry> registry,
                                 const TransactionConfig& txn_config)
    : config_(config)
    , levels_(std::move(levels))
    , resolver_(config.fallback, std::move(registry))
    , txn_(config.name, locks, io_ctx, txn_config)
{
    if (levels_.empty()) {
        throw std::invalid_argument("levels configuration must have at least one level");
    }
    for (const auto& level : levels_) {
        if (!level) {
            throw std::invalid_argument("multilevel cache '" + config_.name + "' has a null level");
        }
    }
}

MultilevelCache::~MultilevelCache() = default;

Status MultilevelCache::check_level(const std::optional<size_t>& level) const {
    if (level && (*level == 0 || *level > levels_.size())) {
        return Status::error(ErrorCode::ConfigError,
                             "Level " + std::to_string(*level) + " out of range 1.." +
                             std::to_string(levels_.size()));
    }
    return Status::make_ok();
}

elio::coro::task<MultilevelCache::Lookup> MultilevelCache::lookup(const CacheKey& key) {
    Lookup found;
    for (size_t i = 0; i < levels_.size(); ++i) {
        auto result = co_await levels_[i]->get(key, level_read());
        if (!result.ok()) {
            found.status = std::move(result.status);
            co_return found;
        }
        if (result.is_hit()) {
            found.object = std::move(result.object);
            found.index = i;
            co_return found;
        }
    }
    co_return found;
}

elio::coro::task<Status> MultilevelCache::check_version(const CacheKey& key,
                                                        const std::optional<Version>& expected) {
    if (!expected) {
        co_return Status::make_ok();
    }
    auto found = co_await lookup(key);
    if (!found.status) {
        co_return found.status;
    }
    if (found.object && found.object->version != *expected) {
        co_return version_conflict(*found.object, *expected);
    }
    co_return Status::make_ok();
}

elio::coro::task<ReadResult> MultilevelCache::backfill(const Object& found, size_t index) {
    WriteOptions opts;
    opts.ret = Return::Object;
    opts.ttl = found.remaining_ttl();

    std::optional<Object> top;
    for (size_t i = 0; i < index; ++i) {
        auto written = co_await levels_[i]->set(found.key, found.value, opts);
        if (!written.ok()) {
            co_return ReadResult::failure(std::move(written.status));
        }
        if (!top) {
            top = std::move(written.object);
        }
    }
    co_return ReadResult::hit(top ? std::move(*top) : found, Return::Object);
}

elio::coro::task<ReadResult> MultilevelCache::relocate(const Object& found, size_t index) {
    // Delete first, then set: a concurrent reader may briefly miss on both levels
    auto removed = co_await levels_[index]->remove(found.key, level_delete({}, false));
    if (!removed.ok() && removed.status.code() != ErrorCode::NotFound) {
        co_return ReadResult::failure(std::move(removed.status));
    }

    WriteOptions opts;
    opts.ret = Return::Object;
    opts.ttl = found.remaining_ttl();

    auto written = co_await levels_.front()->set(found.key, found.value, opts);
    if (!written.ok()) {
        co_return ReadResult::failure(std::move(written.status));
    }
    co_return ReadResult::hit(std::move(written.object), Return::Object);
}

elio::coro::task<ReadResult> MultilevelCache::resolve_fallback(const CacheKey& key,
                                                               const ReadOptions& opts) {
    auto outcome = resolver_.resolve(key, opts.fallback);
    if (!outcome.status) {
        co_return ReadResult::failure(std::move(outcome.status));
    }
    if (!outcome.should_cache()) {
        co_return ReadResult::miss(key, opts.ret);
    }

    // Nothing else holds the key on a total miss, so one level is enough
    size_t target = opts.level ? *opts.level - 1 : 0;
    WriteOptions write;
    write.ret = Return::Object;

    auto written = co_await levels_[target]->set(key, std::move(outcome.value), write);
    if (!written.ok()) {
        co_return ReadResult::failure(std::move(written.status));
    }
    co_return ReadResult::hit(std::move(written.object), opts.ret);
}

elio::coro::task<ReadResult> MultilevelCache::fetch(const CacheKey& key,
                                                    const ReadOptions& opts,
                                                    bool use_fallback) {
    auto status = check_level(opts.level);
    if (!status) {
        co_return ReadResult::failure(std::move(status));
    }

    if (opts.level) {
        auto result = co_await levels_[*opts.level - 1]->get(key, level_read(opts.ret));
        if (!result.is_miss() || !use_fallback) {
            co_return result;
        }

        // The fallback runs only when no level holds the key
        auto found = co_await lookup(key);
        if (!found.status) {
            co_return ReadResult::failure(std::move(found.status));
        }
        if (found.object) {
            co_return result;
        }
        co_return co_await resolve_fallback(key, opts);
    }

    auto found = co_await lookup(key);
    if (!found.status) {
        co_return ReadResult::failure(std::move(found.status));
    }

    if (!found.object) {
        if (use_fallback) {
            co_return co_await resolve_fallback(key, opts);
        }
        co_return ReadResult::miss(key, opts.ret);
    }

    if (found.index == 0) {
        co_return ReadResult::hit(std::move(*found.object), opts.ret);
    }

    ReadResult moved;
    if (config_.model == CacheModel::Inclusive) {
        moved = co_await backfill(*found.object, found.index);
    } else {
        moved = co_await relocate(*found.object, found.index);
    }
    if (!moved.ok()) {
        co_return moved;
    }
    co_return ReadResult::hit(std::move(*moved.object), opts.ret);
}

elio::coro::task<WriteResult> MultilevelCache::write_levels(const CacheKey& key,
                                                            Value value,
                                                            const WriteOptions& opts) {
    std::vector<size_t> targets;
    if (opts.level) {
        targets.push_back(*opts.level - 1);
    } else if (config_.model == CacheModel::Exclusive) {
        targets.push_back(0);
    } else {
        for (size_t i = 0; i < levels_.size(); ++i) {
            targets.push_back(i);
        }
    }

    // A single target checks the version atomically inside the level
    bool native_version = targets.size() == 1;
    auto forwarded = level_write(opts, native_version);

    std::optional<Object> stored;
    for (size_t index : targets) {
        auto written = co_await levels_[index]->set(key, value, forwarded);
        if (!written.ok()) {
            co_return WriteResult::failure(std::move(written.status));
        }
        if (!stored) {
            stored = std::move(written.object);
        }
    }

    if (config_.model == CacheModel::Exclusive) {
        auto removed = co_await remove_levels(key, targets.front());
        if (!removed.ok()) {
            co_return WriteResult::failure(std::move(removed.status));
        }
    }

    co_return WriteResult::success(std::move(*stored), opts.ret);
}

elio::coro::task<DeleteResult> MultilevelCache::remove_levels(const CacheKey& key,
                                                              std::optional<size_t> keep) {
    std::optional<Object> first;
    for (size_t i = 0; i < levels_.size(); ++i) {
        if (keep && *keep == i) {
            continue;
        }
        auto removed = co_await levels_[i]->remove(key, level_delete({}, false));
        if (!removed.ok()) {
            if (removed.status.code() == ErrorCode::NotFound) {
                continue;
            }
            co_return DeleteResult::failure(std::move(removed.status));
        }
        if (!first && removed.object) {
            first = std::move(removed.object);
        }
    }
    co_return DeleteResult::removed(std::move(first), key, Return::Object);
}

elio::coro::task<Status> MultilevelCache::propagate(const CacheKey& key,
                                                    size_t index,
                                                    const std::optional<Value>& updated,
                                                    const WriteOptions& opts) {
    if (!updated || config_.model == CacheModel::Exclusive) {
        auto removed = co_await remove_levels(key, updated ? std::optional<size_t>(index) : std::nullopt);
        co_return removed.status;
    }

    auto forwarded = level_write(opts, false);
    for (size_t i = 0; i < levels_.size(); ++i) {
        if (i == index) {
            continue;
        }
        auto written = co_await levels_[i]->set(key, *updated, forwarded);
        if (!written.ok()) {
            co_return written.status;
        }
    }
    co_return Status::make_ok();
}

elio::coro::task<ReadResult> MultilevelCache::get(
    const CacheKey& key,
    const ReadOptions& opts)
{
    co_return co_await fetch(key, opts, true);
}

elio::coro::task<WriteResult> MultilevelCache::set(
    const CacheKey& key,
    Value value,
    const WriteOptions& opts)
{
    auto status = check_level(opts.level);
    if (!status) {
        co_return WriteResult::failure(std::move(status));
    }

    // Without a level the key may sit deeper than the written levels
    if (!opts.level && levels_.size() > 1) {
        status = co_await check_version(key, opts.version);
        if (!status) {
            co_return WriteResult::failure(std::move(status));
        }
    }

    co_return co_await write_levels(key, std::move(value), opts);
}

elio::coro::task<DeleteResult> MultilevelCache::remove(
    const CacheKey& key,
    const DeleteOptions& opts)
{
    auto status = check_level(opts.level);
    if (!status) {
        co_return DeleteResult::failure(std::move(status));
    }

    if (opts.level) {
        auto removed = co_await levels_[*opts.level - 1]->remove(key, level_delete(opts, true));
        if (!removed.ok()) {
            co_return removed;
        }
        co_return DeleteResult::removed(std::move(removed.object), key, opts.ret);
    }

    status = co_await check_version(key, opts.version);
    if (!status) {
        co_return DeleteResult::failure(std::move(status));
    }

    auto removed = co_await remove_levels(key);
    if (!removed.ok()) {
        co_return removed;
    }
    co_return DeleteResult::removed(std::move(removed.object), key, opts.ret);
}

elio::coro::task<bool> MultilevelCache::has_key(const CacheKey& key) {
    for (auto& level : levels_) {
        if (co_await level->has_key(key)) {
            co_return true;
        }
    }
    co_return false;
}

elio::coro::task<size_t> MultilevelCache::size() {
    size_t total = 0;
    for (auto& level : levels_) {
        total += co_await level->size();
    }
    co_return total;
}

elio::coro::task<Status> MultilevelCache::flush() {
    Status first = Status::make_ok();
    for (auto& level : levels_) {
        auto status = co_await level->flush();
        if (!status) {
            std::cerr << "[TierCache] flush of level '" << level->name()
                      << "' failed: " << status.to_string() << "\n";
            if (first) {
                first = std::move(status);
            }
        }
    }
    co_return first;
}

elio::coro::task<KeySet> MultilevelCache::keys() {
    KeySet result;
    for (auto& level : levels_) {
        auto level_keys = co_await level->keys();
        result.insert(level_keys.begin(), level_keys.end());
    }
    co_return result;
}

elio::coro::task<Status> MultilevelCache::each(const ObjectVisitor& visit) {
    KeySet seen;
    ObjectVisitor dedup = [&seen, &visit](const Object& object) {
        if (seen.insert(object.key).second) {
            visit(object);
        }
    };

    for (auto& level : levels_) {
        auto status = co_await level->each(dedup);
        if (!status) {
            co_return status;
        }
    }
    co_return Status::make_ok();
}

elio::coro::task<MapResult> MultilevelCache::to_map(const ReadOptions& opts) {
    MapResult result;
    for (auto& level : levels_) {
        auto part = co_await level->to_map(level_read(opts.ret));
        if (!part.ok()) {
            result.status = std::move(part.status);
            co_return result;
        }
        // emplace keeps the entry from the shallower level
        for (auto& [key, reply] : part.entries) {
            result.entries.emplace(key, std::move(reply));
        }
    }
    co_return result;
}

elio::coro::task<CounterResult> MultilevelCache::update_counter(
    const CacheKey& key,
    int64_t amount,
    const WriteOptions& opts)
{
    CounterResult result;
    result.status = check_level(opts.level);
    if (!result.status) {
        co_return result;
    }

    if (opts.level) {
        size_t index = *opts.level - 1;
        auto counted = co_await levels_[index]->update_counter(key, amount, level_write(opts, true));
        if (counted.ok() && config_.model == CacheModel::Exclusive) {
            auto removed = co_await remove_levels(key, index);
            if (!removed.ok()) {
                counted.status = std::move(removed.status);
            }
        }
        co_return counted;
    }

    if (levels_.size() > 1) {
        result.status = co_await check_version(key, opts.version);
        if (!result.status) {
            co_return result;
        }
    }
    auto forwarded = level_write(opts, levels_.size() == 1);

    if (config_.model == CacheModel::Exclusive) {
        // Move the counter to level 1 before incrementing it there
        auto current = co_await fetch(key, level_read(), false);
        if (!current.ok()) {
            result.status = std::move(current.status);
            co_return result;
        }
        co_return co_await levels_.front()->update_counter(key, amount, forwarded);
    }

    // Each level keeps its own counter and receives the same delta
    bool first = true;
    for (auto& level : levels_) {
        auto counted = co_await level->update_counter(key, amount, forwarded);
        if (!counted.ok()) {
            co_return counted;
        }
        if (first) {
            result = std::move(counted);
            first = false;
        }
    }
    co_return result;
}

elio::coro::task<ReadResult> MultilevelCache::pop(
    const CacheKey& key,
    const ReadOptions& opts)
{
    auto status = check_level(opts.level);
    if (!status) {
        co_return ReadResult::failure(std::move(status));
    }

    if (opts.level) {
        ReadOptions forwarded = level_read(opts.ret);
        forwarded.version = opts.version;
        co_return co_await levels_[*opts.level - 1]->pop(key, forwarded);
    }

    // Checked before the read so a conflict leaves every level untouched
    status = co_await check_version(key, opts.version);
    if (!status) {
        co_return ReadResult::failure(std::move(status));
    }

    auto current = co_await fetch(key, level_read(), false);
    if (!current.ok()) {
        co_return current;
    }
    if (current.is_miss()) {
        co_return ReadResult::miss(key, opts.ret);
    }

    auto removed = co_await remove_levels(key);
    if (!removed.ok()) {
        co_return ReadResult::failure(std::move(removed.status));
    }
    co_return ReadResult::hit(std::move(*current.object), opts.ret);
}

elio::coro::task<UpdateResult> MultilevelCache::get_and_update(
    const CacheKey& key,
    GetAndUpdateFn fn,
    const WriteOptions& opts)
{
    UpdateResult result;
    result.status = check_level(opts.level);
    if (!result.status) {
        co_return result;
    }

    if (opts.level) {
        size_t index = *opts.level - 1;
        result = co_await levels_[index]->get_and_update(key, std::move(fn), level_write(opts, true));
        if (result.ok() && config_.model == CacheModel::Exclusive) {
            result.status = co_await propagate(key, index, result.updated, opts);
        }
        co_return result;
    }

    result.status = co_await check_version(key, opts.version);
    if (!result.status) {
        co_return result;
    }

    // Bring the key to level 1, then run the function atomically there
    auto current = co_await fetch(key, level_read(), false);
    if (!current.ok()) {
        result.status = std::move(current.status);
        co_return result;
    }

    result = co_await levels_.front()->get_and_update(key, std::move(fn),
                                                      level_write(opts, levels_.size() == 1));
    if (!result.ok()) {
        co_return result;
    }
    result.status = co_await propagate(key, 0, result.updated, opts);
    co_return result;
}

elio::coro::task<UpdateResult> MultilevelCache::update(
    const CacheKey& key,
    Value initial,
    UpdateFn fn,
    const WriteOptions& opts)
{
    UpdateResult result;
    result.status = check_level(opts.level);
    if (!result.status) {
        co_return result;
    }

    if (opts.level) {
        size_t index = *opts.level - 1;
        result = co_await levels_[index]->update(key, std::move(initial), std::move(fn),
                                                 level_write(opts, true));
        if (result.ok() && config_.model == CacheModel::Exclusive) {
            result.status = co_await propagate(key, index, result.updated, opts);
        }
        co_return result;
    }

    result.status = co_await check_version(key, opts.version);
    if (!result.status) {
        co_return result;
    }

    auto current = co_await fetch(key, level_read(), false);
    if (!current.ok()) {
        result.status = std::move(current.status);
        co_return result;
    }

    result = co_await levels_.front()->update(key, std::move(initial), std::move(fn),
                                              level_write(opts, levels_.size() == 1));
    if (!result.ok()) {
        co_return result;
    }
    result.status = co_await propagate(key, 0, result.updated, opts);
    co_return result;
}

elio::coro::task<Status> MultilevelCache::transaction(TransactionFn fn, TransactionOptions opts) {
    co_return co_await txn_.run(std::move(fn), std::move(opts));
}

ICache::Stats MultilevelCache::stats() const {
    Stats total;
    for (const auto& level : levels_) {
        auto s = level->stats();
        total.hits += s.hits;
        total.misses += s.misses;
        total.writes += s.writes;
        total.deletes += s.deletes;
        total.entry_count += s.entry_count;
    }
    return total;
}

elio::coro::task<Status> MultilevelCache::start() {
    for (auto& level : levels_) {
        auto status = co_await level->start();
        if (!status) {
            co_return status;
        }
    }
    co_return Status::make_ok();
}

elio::coro::task<void> MultilevelCache::stop() {
    for (auto& level : levels_) {
        co_await level->stop();
    }
    co_return;
}

}  // namespace tiercache

/*
 * TierCache Basic Usage Example
 *
 * This example demonstrates:
 * - Building a three-level inclusive cache from JSON configuration
 * - Reads that backfill shallower levels
 * - A registered fallback on total miss
 * - Counters and a key-scoped transaction
 */

#include "tiercache/tiercache.hpp"
#include <elio/io/io_context.hpp>
#include <elio/runtime/scheduler.hpp>
#include <future>
#include <iostream>
#include <string>

namespace {

elio::coro::task<tiercache::Status> demo(tiercache::MultilevelCache& cache) {
    using namespace tiercache;

    // Write to the deepest level only, then read through the coordinator
    WriteOptions deep;
    deep.level = cache.level_count();
    auto written = co_await cache.set(CacheKey("user:42"), Value::string("alice"), deep);
    if (!written.ok()) {
        co_return written.status;
    }

    auto read = co_await cache.get(CacheKey("user:42"));
    if (!read.ok() || !read.is_hit()) {
        co_return read.ok() ? Status::error(ErrorCode::NotFound, "user:42 missing") : read.status;
    }
    std::cout << "user:42 = " << read.value().to_string()
              << " (version " << read.object->version << ")\n";
    for (size_t i = 1; i <= cache.level_count(); ++i) {
        bool present = co_await cache.level(i).has_key(CacheKey("user:42"));
        std::cout << "  level " << i << ": " << (present ? "present" : "absent") << "\n";
    }

    // Total miss: the configured fallback computes and caches the value
    auto loaded = co_await cache.get(CacheKey("user:7"));
    if (!loaded.ok()) {
        co_return loaded.status;
    }
    std::cout << "user:7 = " << loaded.value().to_string() << " (from fallback)\n";

    // Every level keeps its own counter
    for (int i = 0; i < 3; ++i) {
        auto counted = co_await cache.update_counter(CacheKey("visits"));
        if (!counted.ok()) {
            co_return counted.status;
        }
    }
    for (size_t i = 1; i <= cache.level_count(); ++i) {
        auto counter = co_await cache.level(i).get(CacheKey("visits"));
        std::cout << "  visits at level " << i << ": " << counter.value().to_string() << "\n";
    }

    // Read-modify-write under a key lock
    TransactionOptions opts;
    opts.keys = {CacheKey("balance")};
    auto status = co_await cache.transaction([&cache](TransactionContext& ctx) -> elio::coro::task<Status> {
        std::cout << "In transaction: " << std::boolalpha << cache.in_transaction(ctx) << "\n";
        auto updated = co_await cache.update(
            CacheKey("balance"), Value::integer(100),
            [](const Value& v) { return Value::integer(v.as_integer() - 10); });
        co_return updated.status;
    }, opts);
    if (!status) {
        co_return status;
    }

    auto raw = co_await cache.size();
    auto distinct = co_await cache.keys();
    std::cout << "Raw size: " << raw << ", distinct keys: " << distinct.size() << "\n";
    co_return Status::make_ok();
}

}  // namespace

int main() {
    using namespace tiercache;

    std::cout << "TierCache Basic Usage Example\n";
    std::cout << "=============================\n\n";

    auto config = Config::load_json(R"({
  "name": "example",
  "model": "inclusive",
  "levels": ["local", "distributed:3", "local"],
  "fallback": "users:load",
  "transaction": { "lock_timeout_ms": 500, "retries": 3 }
})");

    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid config: " << status.message() << "\n";
        return 1;
    }

    auto registry = std::make_shared<FallbackRegistry>();
    registry->register_fallback("users", "load", [](const CacheKey& key) {
        return FallbackResult::of(Value::string("loaded " + key.str()));
    });

    elio::io::io_context io_ctx;
    elio::runtime::scheduler sched(2);
    sched.set_io_context(&io_ctx);
    sched.start();

    LockTable locks;
    auto cache = build_cache(config, locks, io_ctx, registry);

    std::promise<Status> done;
    auto future = done.get_future();
    auto run = [&]() -> elio::coro::task<void> {
        done.set_value(co_await demo(*cache));
    };
    auto task = run();
    sched.spawn(task.release());

    status = future.get();
    sched.shutdown();

    if (!status) {
        std::cerr << "Example failed: " << status.to_string() << "\n";
        return 1;
    }

    std::cout << "\nTierCache version: " << LibraryVersion::string() << "\n";
    return 0;
}

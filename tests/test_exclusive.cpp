#include <catch2/catch_test_macros.hpp>
#include "multilevel_fixture.hpp"
#include <atomic>
#include <random>

using namespace tiercache;
using tiercache::test::Fixture;

TEST_CASE("Exclusive writes", "[multilevel][exclusive]") {
    Fixture f(CacheModel::Exclusive);
    auto& cache = *f.cache;

    SECTION("set without a level goes to level 1 only") {
        REQUIRE(cache.set("k", Value::integer(1)).ok());
        REQUIRE(f.level(1).has_key("k"));
        REQUIRE(f.holders("k") == 1);
    }

    SECTION("set with a level goes there only") {
        WriteOptions l3;
        l3.level = 3;
        REQUIRE(cache.set("k", Value::integer(1), l3).ok());
        REQUIRE(f.level(3).has_key("k"));
        REQUIRE(f.holders("k") == 1);
    }

    SECTION("A later write moves the key") {
        WriteOptions l3;
        l3.level = 3;
        cache.set("k", Value::integer(1), l3);
        cache.set("k", Value::integer(2));

        REQUIRE(f.level(1).get("k").value() == Value::integer(2));
        REQUIRE(!f.level(3).has_key("k"));
        REQUIRE(f.holders("k") == 1);

        WriteOptions l2;
        l2.level = 2;
        cache.set("k", Value::integer(3), l2);
        REQUIRE(f.level(2).get("k").value() == Value::integer(3));
        REQUIRE(f.holders("k") == 1);
    }
}

TEST_CASE("Exclusive relocation on read", "[multilevel][exclusive]") {
    Fixture f(CacheModel::Exclusive);
    auto& cache = *f.cache;

    WriteOptions l3;
    l3.level = 3;
    cache.set("deep", Value::string("payload"), l3);
    cache.set("top", Value::string("t"));

    SECTION("Hit below level 1 relocates to level 1") {
        auto r = cache.get("deep");
        REQUIRE(r.is_hit());
        REQUIRE(r.value() == Value::string("payload"));

        REQUIRE(f.level(1).has_key("deep"));
        REQUIRE(!f.level(3).has_key("deep"));
        REQUIRE(f.holders("deep") == 1);
    }

    SECTION("Relocation keeps the total item count") {
        size_t before = cache.size();
        cache.get("deep");
        REQUIRE(cache.size() == before);
    }

    SECTION("Hit at level 1 needs no relocation") {
        auto version = f.level(1).get("top").object->version;
        auto r = cache.get("top");
        REQUIRE(r.object->version == version);
    }

    SECTION("pop from a deep level removes the only copy") {
        auto p = cache.pop("deep");
        REQUIRE(p.value() == Value::string("payload"));
        REQUIRE(f.holders("deep") == 0);
    }

    SECTION("remove from a deep level") {
        REQUIRE(cache.remove("deep").ok());
        REQUIRE(!cache.has_key("deep"));
    }
}

TEST_CASE("Exclusive counters and updates", "[multilevel][exclusive]") {
    Fixture f(CacheModel::Exclusive);
    auto& cache = *f.cache;

    SECTION("Counter at a deep level is moved to level 1 and incremented") {
        WriteOptions l3;
        l3.level = 3;
        REQUIRE(cache.update_counter("c", 5, l3).value == 5);

        auto counted = cache.update_counter("c");
        REQUIRE(counted.ok());
        REQUIRE(counted.value == 6);
        REQUIRE(f.level(1).get("c").value() == Value::integer(6));
        REQUIRE(f.holders("c") == 1);
    }

    SECTION("New counter starts at level 1") {
        REQUIRE(cache.update_counter("n", 2).value == 2);
        REQUIRE(f.level(1).has_key("n"));
        REQUIRE(f.holders("n") == 1);
    }

    SECTION("get_and_update on a deep key") {
        WriteOptions l2;
        l2.level = 2;
        cache.set("k", Value::integer(1), l2);

        auto u = cache.get_and_update("k", [](const Value& current) -> UpdateDecision {
            return std::make_pair(current, Value::integer(current.as_integer() + 1));
        });
        REQUIRE(u.ok());
        REQUIRE(u.retained == Value::integer(1));
        REQUIRE(f.level(1).get("k").value() == Value::integer(2));
        REQUIRE(f.holders("k") == 1);
    }

    SECTION("update on a missing key") {
        auto u = cache.update("k", Value::integer(9), [](const Value& v) { return v; });
        REQUIRE(u.updated == Value::integer(9));
        REQUIRE(f.holders("k") == 1);
    }
}

TEST_CASE("Exclusive level-targeted operations keep one copy", "[multilevel][exclusive]") {
    Fixture f(CacheModel::Exclusive);
    auto& cache = *f.cache;
    REQUIRE(cache.set("k", Value::integer(1)).ok());

    WriteOptions l2;
    l2.level = 2;

    SECTION("update_counter at another level") {
        auto counted = cache.update_counter("k", 5, l2);
        REQUIRE(counted.ok());
        REQUIRE(counted.value == 5);
        REQUIRE(f.level(2).get("k").value() == Value::integer(5));
        REQUIRE(f.holders("k") == 1);
    }

    SECTION("get_and_update at another level") {
        auto u = cache.get_and_update("k", [](const Value&) -> UpdateDecision {
            return std::make_pair(Value::nil(), Value::integer(7));
        }, l2);
        REQUIRE(u.ok());
        REQUIRE(f.level(2).get("k").value() == Value::integer(7));
        REQUIRE(f.holders("k") == 1);
    }

    SECTION("get_and_update popping at another level removes every copy") {
        auto u = cache.get_and_update("k", [](const Value&) -> UpdateDecision { return POP; }, l2);
        REQUIRE(u.ok());
        REQUIRE(f.holders("k") == 0);
    }

    SECTION("update at another level") {
        auto u = cache.update("k", Value::integer(3), [](const Value& v) { return v; }, l2);
        REQUIRE(u.ok());
        REQUIRE(f.level(2).get("k").value() == Value::integer(3));
        REQUIRE(f.holders("k") == 1);
    }

    SECTION("Level-targeted read does not run the fallback while another level holds the key") {
        auto calls = std::make_shared<std::atomic<int>>(0);
        ReadOptions opts;
        opts.level = 2;
        opts.fallback = FallbackFn([calls](const CacheKey&) {
            (*calls)++;
            return FallbackResult::of(Value::string("loaded"));
        });

        auto r = cache.get("k", opts);
        REQUIRE(r.ok());
        REQUIRE(r.is_miss());
        REQUIRE(calls->load() == 0);
        REQUIRE(f.holders("k") == 1);
        REQUIRE(f.level(1).get("k").value() == Value::integer(1));

        // A total miss still reaches the fallback and stores at the named level
        auto loaded = cache.get("absent", opts);
        REQUIRE(loaded.value() == Value::string("loaded"));
        REQUIRE(calls->load() == 1);
        REQUIRE(f.level(2).has_key("absent"));
        REQUIRE(f.holders("absent") == 1);
    }
}

TEST_CASE("Exclusive never duplicates a key", "[multilevel][exclusive]") {
    FallbackFn loader = [](const CacheKey& key) {
        return FallbackResult::of(Value::string("loaded:" + key.str()));
    };
    Fixture f(CacheModel::Exclusive);
    auto& cache = *f.cache;

    std::mt19937 rng(42);
    std::uniform_int_distribution<int> op(0, 8);
    std::uniform_int_distribution<int> level(0, 3);
    std::uniform_int_distribution<int> key(0, 4);

    auto increment = [](const Value& v) {
        return v.is_integer() ? Value::integer(v.as_integer() + 1) : Value::integer(0);
    };

    for (int i = 0; i < 400; ++i) {
        auto k = "k" + std::to_string(key(rng));

        WriteOptions write;
        ReadOptions read;
        int l = level(rng);
        if (l > 0) {
            write.level = static_cast<size_t>(l);
            read.level = static_cast<size_t>(l);
        }

        switch (op(rng)) {
            case 0:
                REQUIRE(cache.set(k, Value::integer(i), write).ok());
                break;
            case 1:
                REQUIRE(cache.get(k, read).ok());
                break;
            case 2:
                read.fallback = loader;
                REQUIRE(cache.get(k, read).ok());
                break;
            case 3: {
                // Counters only apply to integer values
                auto counted = cache.update_counter(k, 1, write);
                REQUIRE((counted.ok() || counted.status.code() == ErrorCode::TypeMismatch));
                break;
            }
            case 4:
                REQUIRE(cache.get_and_update(k, [&](const Value& current) -> UpdateDecision {
                    return std::make_pair(current, increment(current));
                }, write).ok());
                break;
            case 5:
                REQUIRE(cache.get_and_update(k, [](const Value&) -> UpdateDecision { return POP; },
                                             write).ok());
                break;
            case 6:
                REQUIRE(cache.update(k, Value::integer(0), increment, write).ok());
                break;
            case 7:
                REQUIRE(cache.pop(k).ok());
                break;
            default:
                REQUIRE(cache.remove(k).ok());
                break;
        }

        REQUIRE(f.holders(k) <= 1);
    }

    for (int j = 0; j <= 4; ++j) {
        REQUIRE(f.holders("k" + std::to_string(j)) <= 1);
    }
    REQUIRE(cache.size() == cache.keys().size());
}

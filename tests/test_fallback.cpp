#include <catch2/catch_test_macros.hpp>
#include "tiercache/fallback.hpp"
#include "multilevel_fixture.hpp"
#include <atomic>

using namespace tiercache;
using tiercache::test::Fixture;

TEST_CASE("NamedFallback parsing", "[fallback]") {
    SECTION("module:function") {
        auto ref = NamedFallback::parse("loader:fetch");
        REQUIRE(ref.has_value());
        REQUIRE(ref->module == "loader");
        REQUIRE(ref->function == "fetch");
        REQUIRE(ref->to_string() == "loader:fetch");
    }

    SECTION("Malformed references") {
        REQUIRE(!NamedFallback::parse("loader").has_value());
        REQUIRE(!NamedFallback::parse(":fetch").has_value());
        REQUIRE(!NamedFallback::parse("loader:").has_value());
        REQUIRE(!NamedFallback::parse("a:b:c").has_value());
    }
}

TEST_CASE("FallbackRegistry", "[fallback]") {
    FallbackRegistry registry;
    registry.register_fallback("m", "f", [](const CacheKey&) { return FallbackResult::of(Value::integer(1)); });

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.lookup(NamedFallback{"m", "f"}).has_value());
    REQUIRE(!registry.lookup(NamedFallback{"m", "g"}).has_value());

    REQUIRE(registry.unregister_fallback("m", "f"));
    REQUIRE(!registry.unregister_fallback("m", "f"));
    REQUIRE(registry.size() == 0);
}

TEST_CASE("FallbackResolver", "[fallback]") {
    auto registry = std::make_shared<FallbackRegistry>();
    registry->register_fallback("m", "upper", [](const CacheKey& key) {
        return FallbackResult::of(Value::string("named:" + key.str()));
    });

    FallbackFn inline_fn = [](const CacheKey& key) {
        return FallbackResult::of(Value::string("inline:" + key.str()));
    };

    SECTION("No fallback configured") {
        FallbackResolver resolver;
        auto outcome = resolver.resolve(CacheKey("k"));
        REQUIRE(outcome.status.ok());
        REQUIRE(!outcome.invoked);
        REQUIRE(!outcome.should_cache());
    }

    SECTION("Default fallback") {
        FallbackResolver resolver(inline_fn, registry);
        REQUIRE(resolver.has_default());
        auto outcome = resolver.resolve(CacheKey("k"));
        REQUIRE(outcome.invoked);
        REQUIRE(outcome.value == Value::string("inline:k"));
        REQUIRE(outcome.should_cache());
    }

    SECTION("Per-call reference overrides the default") {
        FallbackResolver resolver(inline_fn, registry);
        auto outcome = resolver.resolve(CacheKey("k"), NamedFallback{"m", "upper"});
        REQUIRE(outcome.value == Value::string("named:k"));
    }

    SECTION("Unknown name is a configuration error") {
        FallbackResolver resolver(NamedFallback{"m", "missing"}, registry);
        auto outcome = resolver.resolve(CacheKey("k"));
        REQUIRE(outcome.status.code() == ErrorCode::ConfigError);
        REQUIRE(!outcome.invoked);
    }

    SECTION("Names registered after construction are found") {
        FallbackResolver resolver(NamedFallback{"m", "late"}, registry);
        registry->register_fallback("m", "late", [](const CacheKey&) {
            return FallbackResult::of(Value::integer(5));
        });
        REQUIRE(resolver.resolve(CacheKey("k")).value == Value::integer(5));
    }

    SECTION("Nil result is not cached") {
        FallbackResolver resolver([](const CacheKey&) { return FallbackResult::of(Value::nil()); },
                                  nullptr);
        auto outcome = resolver.resolve(CacheKey("k"));
        REQUIRE(outcome.invoked);
        REQUIRE(outcome.status.ok());
        REQUIRE(!outcome.should_cache());
    }
}

TEST_CASE("Multilevel fallback on total miss", "[fallback][multilevel]") {
    auto calls = std::make_shared<std::atomic<int>>(0);
    FallbackFn loader = [calls](const CacheKey& key) {
        (*calls)++;
        return FallbackResult::of(Value::string("loaded:" + key.str()));
    };

    SECTION("Per-call fallback result is stored at level 1 only") {
        Fixture f(CacheModel::Inclusive);
        auto& cache = *f.cache;

        ReadOptions opts;
        opts.fallback = loader;
        auto r = cache.get("k", opts);
        REQUIRE(r.is_hit());
        REQUIRE(r.value() == Value::string("loaded:k"));
        REQUIRE(calls->load() == 1);

        REQUIRE(f.level(1).has_key("k"));
        REQUIRE(!f.level(2).has_key("k"));
        REQUIRE(!f.level(3).has_key("k"));

        // Served from level 1 without the fallback
        auto again = cache.get("k");
        REQUIRE(again.is_hit());
        REQUIRE(again.value() == Value::string("loaded:k"));
        REQUIRE(calls->load() == 1);
    }

    SECTION("Fallback is not called on a hit") {
        Fixture f(CacheModel::Inclusive, loader);
        auto& cache = *f.cache;

        WriteOptions l2;
        l2.level = 2;
        cache.set("k", Value::integer(1), l2);
        REQUIRE(cache.get("k").value() == Value::integer(1));
        REQUIRE(calls->load() == 0);
    }

    SECTION("Default fallback from the configuration") {
        Fixture f(CacheModel::Exclusive, loader);
        auto& cache = *f.cache;

        REQUIRE(cache.get("x").value() == Value::string("loaded:x"));
        REQUIRE(f.holders("x") == 1);
        REQUIRE(f.level(1).has_key("x"));
    }

    SECTION("Fallback result gets a fresh version") {
        Fixture f(CacheModel::Inclusive, loader);
        auto& cache = *f.cache;

        ReadOptions read;
        read.ret = Return::Object;
        auto r = cache.get("k", read);
        REQUIRE(std::get<Object>(r.reply).version != NO_VERSION);
        REQUIRE(std::get<Object>(r.reply).version == f.level(1).get("k").object->version);
    }

    SECTION("Fallback with a level writes to that level") {
        Fixture f(CacheModel::Inclusive);
        auto& cache = *f.cache;

        ReadOptions opts;
        opts.level = 2;
        opts.fallback = loader;
        REQUIRE(cache.get("k", opts).is_hit());
        REQUIRE(!f.level(1).has_key("k"));
        REQUIRE(f.level(2).has_key("k"));
    }

    SECTION("Nil fallback result is a miss") {
        Fixture f(CacheModel::Inclusive);
        auto& cache = *f.cache;

        ReadOptions opts;
        opts.fallback = FallbackFn([](const CacheKey&) { return FallbackResult::of(Value::nil()); });
        auto r = cache.get("k", opts);
        REQUIRE(r.ok());
        REQUIRE(r.is_miss());
        REQUIRE(f.holders("k") == 0);
    }

    SECTION("Failing fallback propagates and caches nothing") {
        Fixture f(CacheModel::Inclusive);
        auto& cache = *f.cache;

        ReadOptions opts;
        opts.fallback = FallbackFn([](const CacheKey&) { return FallbackResult::failure("origin down"); });
        auto r = cache.get("k", opts);
        REQUIRE(r.status.code() == ErrorCode::FallbackError);
        REQUIRE(r.status.message() == "origin down");
        REQUIRE(f.holders("k") == 0);
    }

    SECTION("Named fallback resolved through the registry") {
        auto registry = std::make_shared<FallbackRegistry>();
        registry->register_fallback("origin", "load", loader);

        Fixture f(CacheModel::Inclusive, NamedFallback{"origin", "load"}, registry);
        auto& cache = *f.cache;

        REQUIRE(cache.get("n").value() == Value::string("loaded:n"));
        REQUIRE(f.level(1).has_key("n"));
    }

    SECTION("Unknown named fallback") {
        Fixture f(CacheModel::Inclusive, NamedFallback{"origin", "missing"},
                  std::make_shared<FallbackRegistry>());
        auto& cache = *f.cache;

        REQUIRE(cache.get("n").status.code() == ErrorCode::ConfigError);
    }

    SECTION("pop does not call the fallback") {
        Fixture f(CacheModel::Inclusive, loader);
        auto& cache = *f.cache;

        REQUIRE(cache.pop("k").is_miss());
        REQUIRE(calls->load() == 0);
    }
}

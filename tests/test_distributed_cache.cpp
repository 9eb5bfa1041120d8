#include <catch2/catch_test_macros.hpp>
#include "tiercache/distributed_cache.hpp"
#include "tiercache/local_cache.hpp"
#include "test_runtime.hpp"
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

using namespace tiercache;
using tiercache::test::Runtime;
using tiercache::test::SyncCache;

namespace {

std::vector<std::shared_ptr<ICache>> make_nodes(size_t count, LockTable& locks, elio::io::io_context& io) {
    std::vector<std::shared_ptr<ICache>> nodes;
    for (size_t i = 0; i < count; ++i) {
        LocalCacheConfig config;
        config.name = "node" + std::to_string(i);
        nodes.push_back(std::make_shared<LocalCache>(config, locks, io));
    }
    return nodes;
}

// Node whose flush always fails
class BrokenFlushNode : public LocalCache {
public:
    using LocalCache::LocalCache;

    elio::coro::task<Status> flush() override {
        co_return Status::error(ErrorCode::BackendError, name() + " unavailable");
    }
};

// Redirects std::cerr for the lifetime of the object
class CerrCapture {
public:
    CerrCapture() : saved_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(saved_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* saved_;
};

size_t count_of(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

}  // namespace

TEST_CASE("HashRing routing", "[distributed][hash_ring]") {
    SECTION("Empty ring") {
        HashRing ring(16);
        REQUIRE(!ring.node_for(CacheKey("a")).has_value());
        REQUIRE(ring.node_count() == 0);
    }

    SECTION("Stable assignment") {
        HashRing ring(64);
        ring.add_node(0);
        ring.add_node(1);
        ring.add_node(2);
        REQUIRE(ring.node_count() == 3);

        CacheKey key("stable-key");
        auto first = ring.node_for(key);
        REQUIRE(first.has_value());
        REQUIRE(ring.node_for(key) == first);
    }

    SECTION("Keys spread over nodes") {
        HashRing ring(150);
        for (size_t i = 0; i < 4; ++i) {
            ring.add_node(i);
        }

        std::set<size_t> used;
        for (int i = 0; i < 200; ++i) {
            used.insert(*ring.node_for(CacheKey("key-" + std::to_string(i))));
        }
        REQUIRE(used.size() == 4);
    }

    SECTION("Removing a node reroutes its keys") {
        HashRing ring(32);
        ring.add_node(0);
        ring.add_node(1);
        ring.remove_node(1);
        REQUIRE(ring.node_count() == 1);

        for (int i = 0; i < 50; ++i) {
            REQUIRE(ring.node_for(CacheKey(std::to_string(i))) == size_t{0});
        }
    }
}

TEST_CASE("DistributedCache construction", "[distributed]") {
    Runtime rt;
    LockTable locks;

    REQUIRE_THROWS_AS(DistributedCache(DistributedConfig{}, {}, locks, rt.io()),
                      std::invalid_argument);
}

TEST_CASE("DistributedCache operations", "[distributed]") {
    Runtime rt;
    LockTable locks;
    auto nodes = make_nodes(3, locks, rt.io());
    DistributedCache dist(DistributedConfig{}, nodes, locks, rt.io());
    SyncCache cache(rt, dist);

    REQUIRE(dist.node_count() == 3);

    SECTION("Keys live on exactly their owning node") {
        for (int i = 0; i < 30; ++i) {
            REQUIRE(cache.set("k" + std::to_string(i), Value::integer(i)).ok());
        }

        for (int i = 0; i < 30; ++i) {
            auto key = "k" + std::to_string(i);
            REQUIRE(cache.get(key).value() == Value::integer(i));

            ICache& owner = dist.node_for(CacheKey(key));
            size_t holders = 0;
            for (auto& node : nodes) {
                SyncCache view(rt, *node);
                if (view.has_key(key)) {
                    holders++;
                    REQUIRE(node.get() == &owner);
                }
            }
            REQUIRE(holders == 1);
        }
    }

    SECTION("Aggregates across nodes") {
        for (int i = 0; i < 20; ++i) {
            cache.set("k" + std::to_string(i), Value::integer(1));
        }

        REQUIRE(cache.size() == 20);
        REQUIRE(cache.keys().size() == 20);
        REQUIRE(cache.to_map().entries.size() == 20);

        auto total = cache.reduce(int64_t{0}, [](const Object& object, int64_t acc) {
            return acc + object.value.as_integer();
        });
        REQUIRE(total.acc == 20);
        REQUIRE(dist.stats().entry_count == 20);

        REQUIRE(cache.flush().ok());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Counters and removal route to the owner") {
        REQUIRE(cache.update_counter("hits", 5).value == 5);
        REQUIRE(cache.update_counter("hits").value == 6);

        REQUIRE(cache.remove("hits").ok());
        REQUIRE(!cache.has_key("hits"));
    }

    SECTION("Pop") {
        cache.set("p", Value::string("x"));
        auto p = cache.pop("p");
        REQUIRE(p.is_hit());
        REQUIRE(p.value() == Value::string("x"));
        REQUIRE(!cache.has_key("p"));
    }
}

TEST_CASE("DistributedCache flush with failing nodes", "[distributed]") {
    Runtime rt;
    LockTable locks;

    std::vector<std::shared_ptr<ICache>> nodes;
    for (const char* name : {"bad0", "good", "bad1"}) {
        LocalCacheConfig config;
        config.name = name;
        if (std::string(name) == "good") {
            nodes.push_back(std::make_shared<LocalCache>(config, locks, rt.io()));
        } else {
            nodes.push_back(std::make_shared<BrokenFlushNode>(config, locks, rt.io()));
        }
    }
    DistributedCache dist(DistributedConfig{}, nodes, locks, rt.io());
    SyncCache cache(rt, dist);

    SyncCache good(rt, *nodes[1]);
    REQUIRE(good.set("g", Value::integer(1)).ok());

    Status status;
    std::string logged;
    {
        CerrCapture capture;
        status = cache.flush();
        logged = capture.str();
    }

    // First failure is returned, every failure is logged, healthy nodes still flush
    REQUIRE(status.code() == ErrorCode::BackendError);
    REQUIRE(status.message() == "bad0 unavailable");
    REQUIRE(count_of(logged, "flush of node") == 2);
    REQUIRE(logged.find("bad1") != std::string::npos);
    REQUIRE(!good.has_key("g"));
}

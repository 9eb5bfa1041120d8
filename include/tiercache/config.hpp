#pragma once

#include "types.hpp"
#include "fallback.hpp"
#include <string>
#include <vector>
#include <optional>
#include <limits>
#include <filesystem>

namespace tiercache {

// Consistency model of a multilevel cache
enum class CacheModel {
    Inclusive,  // values are backfilled into every shallower level on read
    Exclusive   // a key lives in exactly one level; reads relocate it to level 1
};

const char* cache_model_name(CacheModel model) noexcept;
std::optional<CacheModel> parse_cache_model(std::string_view name);

// Upper bounds accepted by validation
constexpr size_t MAX_LEVEL_NODES = 1024;
constexpr size_t MAX_VIRTUAL_NODES = 4096;

// Single-node in-process level
struct LocalCacheConfig {
    std::string name = "local";
    std::optional<std::chrono::milliseconds> default_ttl;  // nullopt = never expire
};

// Level spread over several nodes
struct DistributedConfig {
    std::string name = "distributed";
    size_t virtual_nodes = 150;  // Virtual nodes per physical node
};

// Lock acquisition settings
struct TransactionConfig {
    std::chrono::milliseconds lock_timeout{1000};  // Per-attempt lock wait
    size_t retries = std::numeric_limits<size_t>::max();  // Attempts before abort
    std::chrono::milliseconds poll_interval{10};

    bool unbounded_retries() const noexcept {
        return retries == std::numeric_limits<size_t>::max();
    }
};

// Multilevel coordinator settings
struct MultilevelConfig {
    std::string name = "multilevel";
    CacheModel model = CacheModel::Inclusive;
    FallbackRef fallback;  // Default fallback on total miss
};

// One entry of the level list: "local" or "distributed:<nodes>"
struct LevelSpec {
    enum class Kind { Local, Distributed };

    Kind kind = Kind::Local;
    size_t nodes = 1;

    static std::optional<LevelSpec> parse(std::string_view spec);
    std::string to_string() const;
};

// Main configuration
struct Config {
    MultilevelConfig multilevel;
    std::vector<LevelSpec> levels;
    LocalCacheConfig local;
    DistributedConfig distributed;
    TransactionConfig transaction;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;
};

}  // namespace tiercache

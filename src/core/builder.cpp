#include "tiercache/tiercache.hpp"
#include <iostream>
#include <stdexcept>

namespace tiercache {

namespace {

std::string level_name(const std::string& cache, size_t index) {
    return cache + ".l" + std::to_string(index);
}

std::shared_ptr<ICache> build_level(const Config& config,
                                    const LevelSpec& spec,
                                    size_t index,
                                    LockTable& locks,
                                    elio::io::io_context& io_ctx) {
    auto name = level_name(config.multilevel.name, index);

    if (spec.kind == LevelSpec::Kind::Local) {
        LocalCacheConfig local = config.local;
        local.name = name;
        return std::make_shared<LocalCache>(local, locks, io_ctx, config.transaction);
    }

    std::vector<std::shared_ptr<ICache>> nodes;
    nodes.reserve(spec.nodes);
    for (size_t j = 1; j <= spec.nodes; ++j) {
        LocalCacheConfig node = config.local;
        node.name = name + ".n" + std::to_string(j);
        nodes.push_back(std::make_shared<LocalCache>(node, locks, io_ctx, config.transaction));
    }

    DistributedConfig distributed = config.distributed;
    distributed.name = name;
    return std::make_shared<DistributedCache>(distributed, std::move(nodes), locks, io_ctx,
                                              config.transaction);
}

}  // namespace

std::shared_ptr<MultilevelCache> build_cache(
    const Config& config,
    LockTable& locks,
    elio::io::io_context& io_ctx,
    std::shared_ptr<const FallbackRegistry> registry)
{
    auto status = config.validate();
    if (!status) {
        throw std::invalid_argument(status.message());
    }

    std::vector<std::shared_ptr<ICache>> levels;
    levels.reserve(config.levels.size());
    for (size_t i = 0; i < config.levels.size(); ++i) {
        levels.push_back(build_level(config, config.levels[i], i + 1, locks, io_ctx));
    }

    auto cache = std::make_shared<MultilevelCache>(config.multilevel, std::move(levels), locks,
                                                   io_ctx, std::move(registry), config.transaction);

    std::cout << "[TierCache] Built '" << config.multilevel.name << "' ("
              << cache_model_name(config.multilevel.model) << ", "
              << config.levels.size() << " levels)\n";
    return cache;
}

}  // namespace tiercache

#pragma once

// Main TierCache header - includes everything needed

#include "types.hpp"
#include "object.hpp"
#include "config.hpp"
#include "fallback.hpp"
#include "transaction.hpp"
#include "cache.hpp"
#include "local_cache.hpp"
#include "distributed_cache.hpp"
#include "multilevel_cache.hpp"
#include <elio/io/io_context.hpp>
#include <memory>

namespace tiercache {

// Builds the multilevel cache described by a configuration.
// Level i (1-based) is named "<name>.l<i>"; node j of a distributed level
// is named "<name>.l<i>.n<j>". Throws std::invalid_argument if the
// configuration does not validate.
std::shared_ptr<MultilevelCache> build_cache(
    const Config& config,
    LockTable& locks,
    elio::io::io_context& io_ctx,
    std::shared_ptr<const FallbackRegistry> registry = nullptr);

// Version information
struct LibraryVersion {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;
    static const char* string() { return "0.1.0"; }
};

}  // namespace tiercache

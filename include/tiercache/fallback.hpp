#pragma once

#include "types.hpp"
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace tiercache {

// Value computed by a fallback on a total cache miss.
// A non-ok status is a failed fallback and is handed back to the caller.
struct FallbackResult {
    Status status;
    Value value;

    static FallbackResult of(Value value) { return {Status::make_ok(), std::move(value)}; }
    static FallbackResult failure(std::string msg) {
        return {Status::error(ErrorCode::FallbackError, std::move(msg)), Value::nil()};
    }
};

using FallbackFn = std::function<FallbackResult(const CacheKey&)>;

// (module, function) reference resolved against a registry at call time
struct NamedFallback {
    std::string module;
    std::string function;

    // Parses "module:function"
    static std::optional<NamedFallback> parse(std::string_view ref);
    std::string to_string() const { return module + ":" + function; }

    bool operator==(const NamedFallback& other) const {
        return module == other.module && function == other.function;
    }
};

// No fallback, an inline function, or a named reference
using FallbackRef = std::variant<std::monostate, FallbackFn, NamedFallback>;

inline bool has_fallback(const FallbackRef& ref) noexcept {
    return !std::holds_alternative<std::monostate>(ref);
}

// Named fallbacks available to a cache. Thread-safe.
class FallbackRegistry {
public:
    void register_fallback(const std::string& module, const std::string& function, FallbackFn fn);
    bool unregister_fallback(const std::string& module, const std::string& function);

    std::optional<FallbackFn> lookup(const NamedFallback& ref) const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FallbackFn> functions_;  // "module:function" -> fn
};

// Outcome of a fallback resolution on a total miss
struct FallbackOutcome {
    Status status;
    bool invoked = false;
    Value value;

    // Only a successful, non-nil result is written back into the cache
    bool should_cache() const noexcept {
        return invoked && status.ok() && !value.is_nil();
    }
};

// Computes values on a total miss from a per-call reference or the
// cache-wide default. Never caches by itself; the caller decides where
// the value lands.
class FallbackResolver {
public:
    FallbackResolver() = default;
    FallbackResolver(FallbackRef default_ref, std::shared_ptr<const FallbackRegistry> registry);

    bool has_default() const noexcept { return has_fallback(default_); }

    // Per-call reference wins over the default. Without either, the
    // outcome is ok and not invoked.
    FallbackOutcome resolve(const CacheKey& key, const FallbackRef& per_call = {}) const;

private:
    FallbackRef default_;
    std::shared_ptr<const FallbackRegistry> registry_;
};

}  // namespace tiercache

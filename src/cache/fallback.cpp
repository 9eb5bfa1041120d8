#include "tiercache/fallback.hpp"
#include <iostream>
#include <mutex>

namespace tiercache {

std::optional<NamedFallback> NamedFallback::parse(std::string_view ref) {
    auto sep = ref.find(':');
    if (sep == std::string_view::npos || sep == 0 || sep + 1 >= ref.size()) {
        return std::nullopt;
    }
    if (ref.find(':', sep + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    return NamedFallback{std::string(ref.substr(0, sep)), std::string(ref.substr(sep + 1))};
}

void FallbackRegistry::register_fallback(const std::string& module,
                                         const std::string& function,
                                         FallbackFn fn) {
    std::unique_lock lock(mutex_);
    functions_[NamedFallback{module, function}.to_string()] = std::move(fn);
}

bool FallbackRegistry::unregister_fallback(const std::string& module,
                                           const std::string& function) {
    std::unique_lock lock(mutex_);
    return functions_.erase(NamedFallback{module, function}.to_string()) > 0;
}

std::optional<FallbackFn> FallbackRegistry::lookup(const NamedFallback& ref) const {
    std::shared_lock lock(mutex_);
    auto it = functions_.find(ref.to_string());
    if (it == functions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t FallbackRegistry::size() const {
    std::shared_lock lock(mutex_);
    return functions_.size();
}

FallbackResolver::FallbackResolver(FallbackRef default_ref,
                                   std::shared_ptr<const FallbackRegistry> registry)
    : default_(std::move(default_ref))
    , registry_(std::move(registry))
{}

FallbackOutcome FallbackResolver::resolve(const CacheKey& key, const FallbackRef& per_call) const {
    FallbackOutcome outcome;
    const FallbackRef& ref = has_fallback(per_call) ? per_call : default_;

    FallbackFn fn;
    if (auto* inline_fn = std::get_if<FallbackFn>(&ref)) {
        fn = *inline_fn;
    } else if (auto* named = std::get_if<NamedFallback>(&ref)) {
        // Named references are looked up on every call so registrations
        // made after the cache was built are honored
        std::optional<FallbackFn> found;
        if (registry_) {
            found = registry_->lookup(*named);
        }
        if (!found || !*found) {
            outcome.status = Status::error(ErrorCode::ConfigError,
                                           "Unknown fallback: " + named->to_string());
            return outcome;
        }
        fn = std::move(*found);
    } else {
        return outcome;
    }

    if (!fn) {
        outcome.status = Status::error(ErrorCode::ConfigError, "Empty fallback function");
        return outcome;
    }

    auto result = fn(key);
    outcome.invoked = true;
    outcome.status = std::move(result.status);
    outcome.value = std::move(result.value);

    if (!outcome.status) {
        std::cerr << "[TierCache] fallback for key '" << key.str()
                  << "' failed: " << outcome.status.to_string() << "\n";
    }
    return outcome;
}

}  // namespace tiercache

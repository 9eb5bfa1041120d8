#include "tiercache/object.hpp"
#include <algorithm>

namespace tiercache {

std::optional<std::chrono::milliseconds> Object::remaining_ttl() const {
    if (!expire_at) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *expire_at - SystemClock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

Reply make_reply(const Object& object, Return mode) {
    switch (mode) {
        case Return::Key:    return Reply(std::in_place_type<CacheKey>, object.key);
        case Return::Object: return Reply(std::in_place_type<Object>, object);
        case Return::Value:  break;
    }
    return Reply(std::in_place_type<Value>, object.value);
}

Reply make_miss_reply(const CacheKey& key, Return mode) {
    if (mode == Return::Key) {
        return Reply(std::in_place_type<CacheKey>, key);
    }
    return Reply(std::in_place_type<Value>, Value::nil());
}

}  // namespace tiercache

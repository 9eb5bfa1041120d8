#include "tiercache/cache.hpp"

namespace tiercache {

ReadResult ReadResult::hit(Object object, Return mode) {
    ReadResult result;
    result.result = CacheResult::Hit;
    result.reply = make_reply(object, mode);
    result.object = std::move(object);
    return result;
}

ReadResult ReadResult::miss(const CacheKey& key, Return mode) {
    ReadResult result;
    result.result = CacheResult::Miss;
    result.reply = make_miss_reply(key, mode);
    return result;
}

ReadResult ReadResult::failure(Status status) {
    ReadResult result;
    result.result = CacheResult::Error;
    result.status = std::move(status);
    return result;
}

WriteResult WriteResult::success(Object object, Return mode) {
    WriteResult result;
    result.reply = make_reply(object, mode);
    result.object = std::move(object);
    return result;
}

WriteResult WriteResult::failure(Status status) {
    WriteResult result;
    result.status = std::move(status);
    return result;
}

DeleteResult DeleteResult::removed(std::optional<Object> object, const CacheKey& key, Return mode) {
    DeleteResult result;
    result.reply = object ? make_reply(*object, mode) : make_miss_reply(key, mode);
    result.object = std::move(object);
    return result;
}

DeleteResult DeleteResult::failure(Status status) {
    DeleteResult result;
    result.status = std::move(status);
    return result;
}

}  // namespace tiercache

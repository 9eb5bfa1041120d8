#include "tiercache/types.hpp"
#include <xxhash.h>

namespace tiercache {

// CacheKey implementation
CacheKey::CacheKey(std::string_view key) : data_(key) {
    compute_hash();
}

void CacheKey::compute_hash() {
    if (data_.empty()) {
        hash_ = 0;
        return;
    }
    hash_ = XXH3_64bits(data_.data(), data_.size());
}

// Value implementation
Value Value::integer(int64_t v) {
    Value value;
    value.data_ = v;
    return value;
}

Value Value::bytes(ByteBuffer data) {
    Value value;
    value.data_ = std::move(data);
    return value;
}

Value Value::string(std::string_view s) {
    return bytes(ByteBuffer(s.begin(), s.end()));
}

std::string Value::to_string() const {
    if (is_nil()) return "nil";
    if (is_integer()) return std::to_string(as_integer());
    const auto& b = as_bytes();
    return std::string(b.begin(), b.end());
}

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                 return "Ok";
        case ErrorCode::NotFound:           return "NotFound";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::KeyTooLarge:        return "KeyTooLarge";
        case ErrorCode::ConfigError:        return "ConfigError";
        case ErrorCode::VersionConflict:    return "VersionConflict";
        case ErrorCode::TransactionAborted: return "TransactionAborted";
        case ErrorCode::TypeMismatch:       return "TypeMismatch";
        case ErrorCode::FallbackError:      return "FallbackError";
        case ErrorCode::BackendError:       return "BackendError";
        case ErrorCode::InternalError:      return "InternalError";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    std::string s = error_code_name(code_);
    if (!message_.empty()) {
        s += ": ";
        s += message_;
    }
    return s;
}

}  // namespace tiercache

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <optional>
#include <variant>
#include <functional>

namespace tiercache {

// Constants
constexpr size_t MAX_KEY_SIZE = 8 * 1024;  // 8KB

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using SystemClock = std::chrono::system_clock;
using Timestamp = SystemClock::time_point;

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

// Version token assigned by the storing backend; 0 is never assigned
using Version = uint64_t;
constexpr Version NO_VERSION = 0;

// Cache key with pre-computed hash
class CacheKey {
public:
    CacheKey() = default;
    explicit CacheKey(std::string_view key);

    std::string_view view() const noexcept { return data_; }
    const std::string& str() const noexcept { return data_; }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    uint64_t hash() const noexcept { return hash_; }

    bool operator==(const CacheKey& other) const noexcept {
        return hash_ == other.hash_ && data_ == other.data_;
    }

    bool operator<(const CacheKey& other) const noexcept {
        return data_ < other.data_;
    }

private:
    std::string data_;
    uint64_t hash_ = 0;

    void compute_hash();
};

// Cached payload: nil, a signed integer (counters) or raw bytes.
// Nil is an explicit empty value, distinct from "not found".
class Value {
public:
    Value() = default;

    static Value nil() { return Value(); }
    static Value integer(int64_t v);
    static Value bytes(ByteBuffer data);
    static Value string(std::string_view s);

    bool is_nil() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    bool is_integer() const noexcept { return std::holds_alternative<int64_t>(data_); }
    bool is_bytes() const noexcept { return std::holds_alternative<ByteBuffer>(data_); }

    int64_t as_integer() const { return std::get<int64_t>(data_); }
    const ByteBuffer& as_bytes() const { return std::get<ByteBuffer>(data_); }
    std::string to_string() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, int64_t, ByteBuffer> data_;
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    NotFound,
    InvalidArgument,
    KeyTooLarge,
    ConfigError,
    VersionConflict,
    TransactionAborted,
    TypeMismatch,
    FallbackError,
    BackendError,
    InternalError
};

const char* error_code_name(ErrorCode code) noexcept;

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

}  // namespace tiercache

// Hash specializations for standard containers
namespace std {

template<>
struct hash<tiercache::CacheKey> {
    size_t operator()(const tiercache::CacheKey& k) const noexcept {
        return k.hash();
    }
};

}  // namespace std

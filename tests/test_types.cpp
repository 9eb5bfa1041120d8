#include <catch2/catch_test_macros.hpp>
#include "tiercache/types.hpp"
#include "tiercache/object.hpp"
#include <unordered_set>

using namespace tiercache;

TEST_CASE("CacheKey basic operations", "[types]") {
    SECTION("Empty key") {
        CacheKey key;
        REQUIRE(key.empty());
        REQUIRE(key.size() == 0);
        REQUIRE(key.hash() == 0);
    }

    SECTION("String key") {
        CacheKey key("test-key");
        REQUIRE(!key.empty());
        REQUIRE(key.size() == 8);
        REQUIRE(key.view() == "test-key");
        REQUIRE(key.str() == "test-key");
    }

    SECTION("Key equality") {
        CacheKey key1("test");
        CacheKey key2("test");
        CacheKey key3("other");

        REQUIRE(key1 == key2);
        REQUIRE(!(key1 == key3));
    }

    SECTION("Key ordering") {
        REQUIRE(CacheKey("a") < CacheKey("b"));
        REQUIRE(!(CacheKey("b") < CacheKey("a")));
    }

    SECTION("Key hashing") {
        CacheKey key1("test");
        CacheKey key2("test");

        REQUIRE(key1.hash() == key2.hash());
        REQUIRE(key1.hash() != 0);
        REQUIRE(std::hash<CacheKey>{}(key1) == std::hash<CacheKey>{}(key2));
    }

    SECTION("Usable in unordered containers") {
        std::unordered_set<CacheKey> keys;
        keys.insert(CacheKey("1"));
        keys.insert(CacheKey("1"));
        keys.insert(CacheKey("2"));
        REQUIRE(keys.size() == 2);
    }
}

TEST_CASE("Value variants", "[types]") {
    SECTION("Nil is the default") {
        Value v;
        REQUIRE(v.is_nil());
        REQUIRE(v == Value::nil());
        REQUIRE(v.to_string() == "nil");
    }

    SECTION("Integer") {
        auto v = Value::integer(-42);
        REQUIRE(v.is_integer());
        REQUIRE(v.as_integer() == -42);
        REQUIRE(v.to_string() == "-42");
        REQUIRE(v != Value::integer(42));
    }

    SECTION("Bytes and strings") {
        auto v = Value::string("hello");
        REQUIRE(v.is_bytes());
        REQUIRE(v.as_bytes().size() == 5);
        REQUIRE(v.to_string() == "hello");
        REQUIRE(v == Value::bytes(ByteBuffer{'h', 'e', 'l', 'l', 'o'}));
    }

    SECTION("Nil differs from an empty byte string") {
        REQUIRE(Value::nil() != Value::string(""));
    }
}

TEST_CASE("Status", "[types]") {
    SECTION("Default is ok") {
        Status s;
        REQUIRE(s.ok());
        REQUIRE(static_cast<bool>(s));
        REQUIRE(s.to_string() == "Ok");
    }

    SECTION("Error carries code and message") {
        auto s = Status::error(ErrorCode::VersionConflict, "stale");
        REQUIRE(s.is_error());
        REQUIRE(!s);
        REQUIRE(s.code() == ErrorCode::VersionConflict);
        REQUIRE(s.message() == "stale");
        REQUIRE(s.to_string() == "VersionConflict: stale");
    }

    SECTION("Every code has a name") {
        REQUIRE(std::string(error_code_name(ErrorCode::TransactionAborted)) == "TransactionAborted");
        REQUIRE(std::string(error_code_name(ErrorCode::ConfigError)) == "ConfigError");
        REQUIRE(std::string(error_code_name(ErrorCode::TypeMismatch)) == "TypeMismatch");
    }
}

TEST_CASE("Object expiry", "[types][object]") {
    Object object{CacheKey("k"), Value::integer(1), 7, std::nullopt};

    SECTION("No expiry") {
        REQUIRE(!object.is_expired());
        REQUIRE(!object.remaining_ttl().has_value());
    }

    SECTION("Future expiry") {
        object.expire_at = SystemClock::now() + std::chrono::seconds(60);
        REQUIRE(!object.is_expired());
        REQUIRE(object.remaining_ttl().has_value());
        REQUIRE(*object.remaining_ttl() > std::chrono::seconds(50));
    }

    SECTION("Past expiry") {
        object.expire_at = SystemClock::now() - std::chrono::milliseconds(1);
        REQUIRE(object.is_expired());
        REQUIRE(object.remaining_ttl() == std::chrono::milliseconds(0));
    }
}

TEST_CASE("Reply projection", "[types][object]") {
    Object object{CacheKey("k"), Value::string("v"), 3, std::nullopt};

    SECTION("Value mode") {
        auto reply = make_reply(object, Return::Value);
        REQUIRE(std::holds_alternative<Value>(reply));
        REQUIRE(std::get<Value>(reply) == Value::string("v"));
    }

    SECTION("Key mode") {
        auto reply = make_reply(object, Return::Key);
        REQUIRE(std::get<CacheKey>(reply) == CacheKey("k"));
    }

    SECTION("Object mode") {
        auto reply = make_reply(object, Return::Object);
        REQUIRE(std::get<Object>(reply).version == 3);
    }

    SECTION("Miss replies") {
        REQUIRE(std::get<Value>(make_miss_reply(CacheKey("k"), Return::Value)).is_nil());
        REQUIRE(std::get<Value>(make_miss_reply(CacheKey("k"), Return::Object)).is_nil());
        REQUIRE(std::get<CacheKey>(make_miss_reply(CacheKey("k"), Return::Key)) == CacheKey("k"));
    }
}

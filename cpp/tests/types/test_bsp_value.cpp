/**
 * Unit tests for bspgraph::Value and the binary value codec.
 */

#include <catch2/catch_test_macros.hpp>
#include <bspgraph/types/value.h>
#include <bspgraph/types/value_codec.h>
#include <bspgraph/util/errors.h>

#include <limits>
#include <stdexcept>

using namespace bspgraph;

// ============================================================================
// Value
// ============================================================================

TEST_CASE("Value - kinds and accessors", "[value]") {
    REQUIRE(Value{}.is_none());
    REQUIRE(Value{true}.as_bool());
    REQUIRE(Value{42}.as_int() == 42);
    REQUIRE(Value{2.5}.as_double() == 2.5);
    REQUIRE(Value{"abc"}.as_string() == "abc");
    REQUIRE(Value::list({1, 2}).size() == 2);
    REQUIRE(Value::map({{"a", 1}}).kind() == ValueKind::MAP);

    REQUIRE(Value{3}.as_number() == 3.0);
    REQUIRE(Value{0.5}.as_number() == 0.5);
}

TEST_CASE("Value - wrong kind access throws", "[value]") {
    Value v{"text"};
    REQUIRE_THROWS_AS(v.as_int(), std::invalid_argument);
    REQUIRE_THROWS_AS(v.as_list(), std::invalid_argument);
    REQUIRE_THROWS_AS(v.as_number(), std::invalid_argument);
}

TEST_CASE("Value - map and list lookup", "[value]") {
    auto v = Value::map({{"name", "x"}, {"items", Value::list({1, 2, 3})}});

    REQUIRE(v.contains("name"));
    REQUIRE_FALSE(v.contains("missing"));
    REQUIRE(v.find("missing") == nullptr);
    REQUIRE(v.at("items").at(2).as_int() == 3);
    REQUIRE_THROWS_AS(v.at("missing"), std::out_of_range);
    REQUIRE_THROWS_AS(v.at("items").at(3), std::out_of_range);
}

TEST_CASE("Value - text rendering", "[value]") {
    auto v = Value::map({{"b", Value::list({1, 2.0, true, Value{}})}, {"a", "q\"x"}});
    REQUIRE(v.to_string() == R"({"a":"q\"x","b":[1,2.0,true,null]})");
    REQUIRE(fmt::format("{}", Value{7}) == "7");
    REQUIRE(fmt::format("{}", ValueKind::LIST) == "list");
}

TEST_CASE("Value - equality distinguishes int and double", "[value]") {
    REQUIRE(Value{1} == Value{1});
    REQUIRE_FALSE(Value{1} == Value{1.0});
    REQUIRE(Value::list({1, "a"}) == Value::list({1, "a"}));
}

// ============================================================================
// Codec
// ============================================================================

TEST_CASE("Codec - nested values survive encode and decode", "[value][codec]") {
    auto v = Value::map({
        {"int", std::numeric_limits<int64_t>::min()},
        {"double", -0.125},
        {"none", Value{}},
        {"flag", false},
        {"nested", Value::list({Value::map({{"k", "v"}}), Value::list({}), ""})},
    });
    REQUIRE(decode_value(encode_value(v)) == v);
}

TEST_CASE("Codec - header layout", "[value][codec]") {
    auto bytes = encode_value(Value{});
    REQUIRE(bytes.size() == 6);
    // Magic 0x42535047 little endian, then the version and the none tag.
    REQUIRE(bytes[0] == 0x47);
    REQUIRE(bytes[3] == 0x42);
    REQUIRE(bytes[4] == value_format::VERSION);
    REQUIRE(bytes[5] == value_format::TYPE_NONE);
}

TEST_CASE("Codec - malformed input is rejected", "[value][codec]") {
    auto bytes = encode_value(Value::list({1, "abc"}));

    auto expect_serialization_error = [](const bytes_t &input) {
        try {
            (void)decode_value(input);
            FAIL("decode_value accepted malformed input");
        } catch (const ChannelError &e) {
            REQUIRE(e.kind() == ChannelError::Kind::SERIALIZATION_ERROR);
        }
    };

    SECTION("bad magic") {
        auto copy = bytes;
        copy[0] ^= 0xff;
        expect_serialization_error(copy);
    }
    SECTION("unsupported version") {
        auto copy = bytes;
        copy[4] = 99;
        expect_serialization_error(copy);
    }
    SECTION("truncated") {
        auto copy = bytes;
        copy.resize(copy.size() - 2);
        expect_serialization_error(copy);
    }
    SECTION("trailing bytes") {
        auto copy = bytes;
        copy.push_back(0);
        expect_serialization_error(copy);
    }
    SECTION("unknown tag") {
        bytes_t copy(bytes.begin(), bytes.begin() + 5);
        copy.push_back(0x7f);
        expect_serialization_error(copy);
    }
    SECTION("huge list count") {
        bytes_t copy(bytes.begin(), bytes.begin() + 5);
        copy.push_back(value_format::TYPE_LIST);
        for (int i = 0; i < 8; ++i) { copy.push_back(0xff); }
        expect_serialization_error(copy);
    }
    SECTION("empty input") {
        expect_serialization_error({});
    }
}

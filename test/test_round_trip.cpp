// test_round_trip.cpp - Tests for rebuilding a Value from a Value
// Module 10: Deserialize<Value> through both consumption modes

#include "test_support.h"

#include <catch2/catch_all.hpp>
#include <value_de/from_value.h>

#include <cstdint>
#include <string>

using namespace value_de;
using namespace test_support;

namespace {

constexpr const char* kDocument = R"({
    "name": "sensor",
    "zeta": [1, -2, 3.5, 18446744073709551615],
    "alpha": {"nested": {"deep": [null, true, false, ""]}},
    "mid": [],
    "empty": {}
})";

} // namespace

TEST_CASE("Rebuilding a tree yields an equal tree", "[round_trip]") {
    Value doc = json(kDocument);
    const std::string text = to_json(doc);

    SECTION("borrowed") {
        Value copy = from_value<Value>(doc);
        REQUIRE(copy == doc);
        REQUIRE(to_json(copy) == text);
    }

    SECTION("owned") {
        Value copy = from_value<Value>(doc.clone());
        REQUIRE(copy == doc);
        REQUIRE(to_json(copy) == text);
    }
}

TEST_CASE("Rebuilding keeps object key order", "[round_trip][order]") {
    Value doc = json(R"({"z": 1, "a": 2, "m": 3})");
    REQUIRE(to_json(from_value<Value>(doc)) == R"({"z":1,"a":2,"m":3})");
    REQUIRE(to_json(from_value<Value>(std::move(doc))) == R"({"z":1,"a":2,"m":3})");
}

TEST_CASE("Rebuilding keeps number representations", "[round_trip][number]") {
    SECTION("integers stay integers") {
        Value v = from_value<Value>(Value{int64_t{-5}});
        REQUIRE(v.get_if<Number>()->is_i64());
        REQUIRE(to_json(v) == "-5");
    }

    SECTION("large unsigned integers stay unsigned") {
        Value v = from_value<Value>(Value{UINT64_MAX});
        REQUIRE(v.get_if<Number>()->is_u64());
        REQUIRE(to_json(v) == "18446744073709551615");
    }

    SECTION("whole floats stay floats") {
        Value v = from_value<Value>(Value{3.0});
        REQUIRE(v.get_if<Number>()->is_f64());
        REQUIRE(to_json(v) == "3.0");
    }
}

TEST_CASE("Rebuilding a sub-tree leaves the rest untouched", "[round_trip]") {
    Value doc = json(kDocument);
    Value part = from_value<Value>(doc.at("alpha"));
    REQUIRE(part == doc.at("alpha"));
    REQUIRE(part.at("nested").at("deep").size() == 4);
    REQUIRE(doc.at("name").as_string_view() == "sensor");
}

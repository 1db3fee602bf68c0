// test_sequence_map.cpp - Tests for the sequence and map cursors
// Module 6: Size hints, completeness checks, two-phase map access

#include "test_support.h"

#include <catch2/catch_all.hpp>
#include <value_de/from_value.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace value_de;
using namespace test_support;

namespace {

/// Takes the first `limit` elements and stops
struct TakeVisitor : Visitor<TakeVisitor, std::vector<int64_t>> {
    std::size_t limit = 0;

    std::string expecting() const { return "a prefix of a sequence"; }

    template <SeqAccessType A>
    std::vector<int64_t> visit_seq(A& seq)
    {
        std::vector<int64_t> out;
        while (out.size() < limit) {
            auto elem = seq.template next_element<int64_t>();
            if (!elem) break;
            out.push_back(*elem);
        }
        return out;
    }
};

/// Records the size hint before and after each element
struct HintVisitor : Visitor<HintVisitor, std::vector<std::size_t>> {
    std::string expecting() const { return "a sequence"; }

    template <SeqAccessType A>
    std::vector<std::size_t> visit_seq(A& seq)
    {
        std::vector<std::size_t> hints;
        hints.push_back(*seq.size_hint());
        while (seq.template next_element<IgnoredAny>()) {
            hints.push_back(*seq.size_hint());
        }
        return hints;
    }

    template <MapAccessType A>
    std::vector<std::size_t> visit_map(A& map)
    {
        std::vector<std::size_t> hints;
        hints.push_back(*map.size_hint());
        while (map.template next_entry<std::string, IgnoredAny>()) {
            hints.push_back(*map.size_hint());
        }
        return hints;
    }
};

/// Takes the first `limit` entries and stops
struct TakeEntriesVisitor : Visitor<TakeEntriesVisitor, std::size_t> {
    std::size_t limit = 0;

    std::string expecting() const { return "a prefix of a map"; }

    template <MapAccessType A>
    std::size_t visit_map(A& map)
    {
        std::size_t taken = 0;
        while (taken < limit && map.template next_entry<std::string, IgnoredAny>()) {
            ++taken;
        }
        return taken;
    }
};

/// Asks for a value without a key first
struct ValueFirstVisitor : Visitor<ValueFirstVisitor, int64_t> {
    std::string expecting() const { return "a map"; }

    template <MapAccessType A>
    int64_t visit_map(A& map)
    {
        return map.template next_value<int64_t>();
    }
};

/// Reads every key and skips every value
struct KeysVisitor : Visitor<KeysVisitor, std::vector<std::string>> {
    std::string expecting() const { return "a map"; }

    template <MapAccessType A>
    std::vector<std::string> visit_map(A& map)
    {
        std::vector<std::string> keys;
        while (auto key = map.template next_key<std::string>()) {
            keys.push_back(std::move(*key));
            map.template next_value<IgnoredAny>();
        }
        return keys;
    }
};

template <typename V>
auto run_owned(const Value& input, V visitor)
{
    return ValueDeserializer{input.clone()}.deserialize_any(visitor);
}

template <typename V>
auto run_borrowed(const Value& input, V visitor)
{
    return ValueRefDeserializer{input}.deserialize_any(visitor);
}

} // namespace

// ============================================================
// Sequence Cursor Tests
// ============================================================

TEST_CASE("Sequence cursor size hint is exact", "[sequence][hint]") {
    Value arr = json("[10, 20, 30]");
    auto expected = std::vector<std::size_t>{3, 2, 1, 0};
    REQUIRE(run_owned(arr, HintVisitor{}) == expected);
    REQUIRE(run_borrowed(arr, HintVisitor{}) == expected);
}

TEST_CASE("Sequence cursor requires every element be consumed", "[sequence][completeness]") {
    Value arr = json("[1, 2, 3, 4]");

    SECTION("consuming all elements succeeds") {
        TakeVisitor take;
        take.limit = 4;
        REQUIRE(run_owned(arr, take) == std::vector<int64_t>{1, 2, 3, 4});
        REQUIRE(run_borrowed(arr, take) == std::vector<int64_t>{1, 2, 3, 4});
    }

    SECTION("stopping early reports the original length") {
        for (std::size_t k = 0; k < 4; ++k) {
            TakeVisitor take;
            take.limit = k;
            Error owned = capture_error([&] { (void)run_owned(arr, take); });
            Error borrowed = capture_error([&] { (void)run_borrowed(arr, take); });
            REQUIRE(owned.kind() == ErrorKind::InvalidLength);
            REQUIRE(std::string_view{owned.what()} == "invalid length 4, expected fewer elements in array");
            REQUIRE(std::string_view{borrowed.what()} == std::string_view{owned.what()});
        }
    }

    SECTION("empty arrays are trivially complete") {
        TakeVisitor take;
        REQUIRE(run_owned(json("[]"), take).empty());
    }
}

TEST_CASE("Sequence cursor completeness applies to nested arrays", "[sequence][completeness]") {
    Error e = capture_error([] { (void)from_value<std::vector<std::pair<int32_t, int32_t>>>(json("[[1, 2], [3, 4, 5]]")); });
    REQUIRE(std::string_view{e.what()} == "invalid length 3, expected fewer elements in array");
}

// ============================================================
// Map Cursor Tests
// ============================================================

TEST_CASE("Map cursor size hint is exact", "[map][hint]") {
    Value obj = json(R"({"a": 1, "b": 2})");
    auto expected = std::vector<std::size_t>{2, 1, 0};
    REQUIRE(run_owned(obj, HintVisitor{}) == expected);
    REQUIRE(run_borrowed(obj, HintVisitor{}) == expected);
}

TEST_CASE("Map cursor presents keys in insertion order", "[map][order]") {
    Value obj = json(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    auto expected = std::vector<std::string>{"zeta", "alpha", "mid"};
    REQUIRE(run_owned(obj, KeysVisitor{}) == expected);
    REQUIRE(run_borrowed(obj, KeysVisitor{}) == expected);
}

TEST_CASE("Map cursor requires every entry be consumed", "[map][completeness]") {
    Value obj = json(R"({"a": 1, "b": 2, "c": 3})");

    SECTION("consuming all entries succeeds") {
        TakeEntriesVisitor take;
        take.limit = 3;
        REQUIRE(run_owned(obj, take) == 3);
        REQUIRE(run_borrowed(obj, take) == 3);
    }

    SECTION("stopping early reports the original length") {
        TakeEntriesVisitor take;
        take.limit = 1;
        Error owned = capture_error([&] { (void)run_owned(obj, take); });
        Error borrowed = capture_error([&] { (void)run_borrowed(obj, take); });
        REQUIRE(owned.kind() == ErrorKind::InvalidLength);
        REQUIRE(std::string_view{owned.what()} == "invalid length 3, expected fewer elements in map");
        REQUIRE(std::string_view{borrowed.what()} == std::string_view{owned.what()});
    }
}

TEST_CASE("Map cursor value without key is missing", "[map][protocol]") {
    Value obj = json(R"({"a": 1})");

    Error owned = capture_error([&] { (void)run_owned(obj, ValueFirstVisitor{}); });
    Error borrowed = capture_error([&] { (void)run_borrowed(obj, ValueFirstVisitor{}); });
    REQUIRE(owned.kind() == ErrorKind::Custom);
    REQUIRE(std::string_view{owned.what()} == "value is missing");
    REQUIRE(std::string_view{borrowed.what()} == "value is missing");
}

TEST_CASE("Map cursor values fail inside the entry", "[map][errors]") {
    REQUIRE_THROWS_WITH((from_value<std::map<std::string, bool>>(json(R"({"a": true, "b": 0})"))),
                        "invalid type: integer `0`, expected a boolean");
}

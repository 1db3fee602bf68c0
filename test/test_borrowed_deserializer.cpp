// test_borrowed_deserializer.cpp - Tests for owning vs borrowing consumption
// Module 5: Both modes make the same decisions; only ownership differs

#include "test_support.h"

#include <catch2/catch_all.hpp>
#include <value_de/from_value.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

using namespace value_de;
using namespace test_support;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Keeps a view into the input tree when one is offered
struct ViewVisitor : Visitor<ViewVisitor, std::string_view> {
    std::string expecting() const { return "a borrowed string"; }

    std::string_view visit_borrowed_str(std::string_view v) { return v; }
};

/// Collects how each string arrived
struct StringOriginVisitor : Visitor<StringOriginVisitor, std::string> {
    std::string expecting() const { return "a string"; }

    std::string visit_str(std::string_view) { return "copied"; }
    std::string visit_borrowed_str(std::string_view) { return "borrowed"; }
    std::string visit_string(std::string) { return "moved"; }
};

/// Build T in both modes and require the same result
template <typename T>
T from_both(const Value& input)
{
    T borrowed = from_value<T>(input);
    T owned = from_value<T>(input.clone());
    REQUIRE(borrowed == owned);
    return owned;
}

/// Build T in both modes and require the same failure
template <typename T>
Error fail_both(const Value& input)
{
    Error borrowed = capture_error([&] { (void)from_value<T>(input); });
    Error owned = capture_error([&] { (void)from_value<T>(input.clone()); });
    REQUIRE(borrowed.kind() == owned.kind());
    REQUIRE(std::string_view{borrowed.what()} == std::string_view{owned.what()});
    return owned;
}

} // namespace

// ============================================================
// Borrowing Tests
// ============================================================

TEST_CASE("Borrowed strings point into the tree", "[borrowed][string]") {
    Value doc = json(R"({"name": "sensor"})");
    ValueRefDeserializer de{doc.at("name")};

    std::string_view view = de.deserialize_str(ViewVisitor{});
    REQUIRE(view == "sensor");
    REQUIRE(view.data() == doc.at("name").as_string_view().data());
}

TEST_CASE("Owned strings are moved, borrowed ones are lent", "[borrowed][string]") {
    Value s{"abc"};
    REQUIRE(ValueRefDeserializer{s}.deserialize_string(StringOriginVisitor{}) == "borrowed");
    REQUIRE(ValueDeserializer{s.clone()}.deserialize_string(StringOriginVisitor{}) == "moved");
}

TEST_CASE("Borrowed consumption only accepts lasting trees", "[borrowed][lifetime]") {
    STATIC_REQUIRE(std::is_constructible_v<ValueRefDeserializer, const Value&>);
    STATIC_REQUIRE(std::is_constructible_v<ValueRefDeserializer, Value&>);
    STATIC_REQUIRE_FALSE(std::is_constructible_v<ValueRefDeserializer, Value&&>);
    STATIC_REQUIRE(std::is_constructible_v<ValueDeserializer, Value&&>);
    STATIC_REQUIRE_FALSE(std::is_constructible_v<ValueDeserializer, const Value&>);
}

TEST_CASE("Borrowed map keys point into the tree", "[borrowed][map]") {
    Value doc = json(R"({"alpha": 1})");
    auto keys = from_value<std::map<std::string, int32_t>>(doc);
    REQUIRE(keys.count("alpha") == 1);

    // The tree is untouched and can be consumed again
    REQUIRE(doc.at("alpha").as_i64() == 1);
    auto again = from_value<std::map<std::string, int32_t>>(doc);
    REQUIRE(again == keys);
}

TEST_CASE("Borrowed consumption leaves the tree intact", "[borrowed][lifetime]") {
    Value doc = json(R"({"points": [[1, 2], {"x": 3, "y": 4}], "label": "route"})");
    const std::string before = to_json(doc);

    auto points = from_value<std::vector<Point>>(doc.at("points"));
    auto label = from_value<std::string>(doc.at("label"));

    REQUIRE(points.size() == 2);
    REQUIRE(label == "route");
    REQUIRE(to_json(doc) == before);
}

TEST_CASE("Owned consumption takes the tree", "[borrowed][lifetime]") {
    Value doc = json(R"(["a", "b"])");
    auto items = from_value<std::vector<std::string>>(std::move(doc));
    REQUIRE(items == std::vector<std::string>{"a", "b"});
}

// ============================================================
// Equivalence Tests
// ============================================================

TEST_CASE("Both modes succeed with equal results", "[borrowed][equivalence]") {
    REQUIRE(from_both<int32_t>(Value{-9}) == -9);
    REQUIRE(from_both<std::string>(Value{"s"}) == "s");
    REQUIRE(from_both<std::optional<bool>>(Value{}) == std::nullopt);
    REQUIRE(from_both<std::vector<double>>(json("[1, 2.5]")).size() == 2);
    REQUIRE(from_both<Point>(json(R"({"x": 1, "y": 2})")) == Point{1, 2});
    REQUIRE(from_both<Point>(json("[1, 2]")) == Point{1, 2});
    REQUIRE(from_both<Command>(json(R"({"Move": [1, 2]})")).dx == 1);
    REQUIRE(from_both<Value>(json(R"({"k": [null, true, "v"]})")).size() == 1);

    auto keyed = from_both<std::map<int64_t, std::string>>(json(R"({"-1": "neg", "2": "pos"})"));
    REQUIRE(keyed.at(-1) == "neg");
}

TEST_CASE("Both modes fail with the same error", "[borrowed][equivalence]") {
    SECTION("invalid type") {
        Error e = fail_both<bool>(Value{"true"});
        REQUIRE(e.kind() == ErrorKind::InvalidType);
    }

    SECTION("invalid value") {
        Error e = fail_both<uint8_t>(Value{300});
        REQUIRE(e.kind() == ErrorKind::InvalidValue);
    }

    SECTION("invalid length") {
        Error e = fail_both<std::tuple<int32_t>>(json("[1, 2]"));
        REQUIRE(e.kind() == ErrorKind::InvalidLength);
    }

    SECTION("enum selector shape") {
        Error e = fail_both<Command>(json(R"({"Stop": null, "Say": "x"})"));
        REQUIRE(e.kind() == ErrorKind::InvalidValue);
    }

    SECTION("custom") {
        Error e = fail_both<Point>(json(R"({"x": 1})"));
        REQUIRE(e.kind() == ErrorKind::Custom);
        REQUIRE_THAT(e.what(), ContainsSubstring("missing field"));
    }

    SECTION("nested failure deep inside") {
        Error e = fail_both<std::vector<std::map<std::string, Point>>>(json(R"([{"a": {"x": 1, "y": "2"}}])"));
        REQUIRE(std::string_view{e.what()} == "invalid type: string \"2\", expected i32");
    }
}

// test_number_error.cpp - Tests for Number representations and Error formatting
// Module 2: Numeric collaborator and the error taxonomy

#include <catch2/catch_all.hpp>
#include <value_de/error.h>
#include <value_de/number.h>

#include <array>
#include <cmath>
#include <limits>
#include <string_view>

using namespace value_de;
using Catch::Matchers::ContainsSubstring;

// ============================================================
// Number Tests
// ============================================================

TEST_CASE("Number integer representations", "[number][construction]") {
    SECTION("non-negative integers are unsigned") {
        Number n{int64_t{5}};
        REQUIRE(n.is_u64());
        REQUIRE(n.is_i64());
        REQUIRE(n.as_u64() == 5u);
    }

    SECTION("negative integers are signed") {
        Number n{int32_t{-5}};
        REQUIRE_FALSE(n.is_u64());
        REQUIRE(n.is_i64());
        REQUIRE(n.as_i64() == -5);
        REQUIRE_FALSE(n.as_u64().has_value());
    }

    SECTION("u64 max is not an i64") {
        Number n{std::numeric_limits<uint64_t>::max()};
        REQUIRE(n.is_u64());
        REQUIRE_FALSE(n.is_i64());
        REQUIRE_FALSE(n.as_i64().has_value());
    }

    SECTION("signed and unsigned zero compare equal") {
        REQUIRE(Number{int64_t{0}} == Number{uint64_t{0}});
    }
}

TEST_CASE("Number from_f64", "[number][construction]") {
    REQUIRE(Number::from_f64(1.5).has_value());
    REQUIRE(Number::from_f64(1.5)->is_f64());
    REQUIRE_FALSE(Number::from_f64(std::nan("")).has_value());
    REQUIRE_FALSE(Number::from_f64(-std::numeric_limits<double>::infinity()).has_value());
}

TEST_CASE("Number from_string", "[number][parse]") {
    SECTION("integers") {
        REQUIRE(Number::from_string("42") == Number{uint64_t{42}});
        REQUIRE(Number::from_string("-42") == Number{int64_t{-42}});
        REQUIRE(Number::from_string("18446744073709551615") == Number{std::numeric_limits<uint64_t>::max()});
    }

    SECTION("floats") {
        auto n = Number::from_string("3.5e2");
        REQUIRE(n.has_value());
        REQUIRE(n->is_f64());
        REQUIRE(n->as_f64() == Catch::Approx(350.0));
    }

    SECTION("integers beyond 64 bits become floats") {
        auto n = Number::from_string("18446744073709551616");
        REQUIRE(n.has_value());
        REQUIRE(n->is_f64());
    }

    SECTION("malformed text") {
        REQUIRE_FALSE(Number::from_string("").has_value());
        REQUIRE_FALSE(Number::from_string("01").has_value());
        REQUIRE_FALSE(Number::from_string("1.").has_value());
        REQUIRE_FALSE(Number::from_string("+1").has_value());
        REQUIRE_FALSE(Number::from_string("abc").has_value());
    }
}

TEST_CASE("Number to_string", "[number][format]") {
    REQUIRE(Number{uint64_t{7}}.to_string() == "7");
    REQUIRE(Number{int64_t{-7}}.to_string() == "-7");
    REQUIRE(Number::from_f64(2.0)->to_string() == "2.0");
    REQUIRE(Number::from_f64(0.25)->to_string() == "0.25");
}

// ============================================================
// Error Tests
// ============================================================

TEST_CASE("Error message formats", "[error][format]") {
    SECTION("invalid type") {
        Error e = Error::invalid_type(Unexpected::boolean(true), "a string");
        REQUIRE(e.kind() == ErrorKind::InvalidType);
        REQUIRE(std::string_view{e.what()} == "invalid type: boolean `true`, expected a string");
    }

    SECTION("invalid value") {
        Error e = Error::invalid_value(Unexpected::unsigned_int(200), "i8");
        REQUIRE(e.kind() == ErrorKind::InvalidValue);
        REQUIRE(std::string_view{e.what()} == "invalid value: integer `200`, expected i8");
    }

    SECTION("invalid length") {
        Error e = Error::invalid_length(3, "fewer elements in array");
        REQUIRE(e.kind() == ErrorKind::InvalidLength);
        REQUIRE(std::string_view{e.what()} == "invalid length 3, expected fewer elements in array");
    }

    SECTION("custom") {
        Error e = Error::custom("value is missing");
        REQUIRE(e.kind() == ErrorKind::Custom);
        REQUIRE(std::string_view{e.what()} == "value is missing");
    }
}

TEST_CASE("Error helpers for user types", "[error][format]") {
    constexpr std::array<std::string_view, 3> names{"a", "b", "c"};
    constexpr std::array<std::string_view, 2> pair{"a", "b"};

    REQUIRE_THAT(Error::unknown_variant("d", names).what(), ContainsSubstring("unknown variant `d`, expected one of `a`, `b`, `c`"));
    REQUIRE_THAT(Error::unknown_field("d", pair).what(), ContainsSubstring("expected `a` or `b`"));
    REQUIRE_THAT(Error::unknown_field("d", {}).what(), ContainsSubstring("there are no fields"));
    REQUIRE(std::string_view{Error::missing_field("id").what()} == "missing field `id`");
    REQUIRE(std::string_view{Error::duplicate_field("id").what()} == "duplicate field `id`");
    REQUIRE(Error::missing_field("id").kind() == ErrorKind::Custom);
}

TEST_CASE("Unexpected descriptors", "[error][format]") {
    REQUIRE(Unexpected::signed_int(-3).to_string() == "integer `-3`");
    REQUIRE(Unexpected::floating(1.5).to_string() == "floating point `1.5`");
    REQUIRE(Unexpected::str("a\"b").to_string() == "string \"a\\\"b\"");
    REQUIRE(Unexpected::unit_variant().to_string() == "unit variant");
    REQUIRE(Unexpected::other("integer `1` as i128").to_string() == "integer `1` as i128");
    REQUIRE(to_string(ErrorKind::InvalidLength) == "invalid length");
}

// test_support.h - Shared fixtures for the value_de tests
// User-defined targets (a struct and an enum) and error capture helpers

#pragma once

#include <catch2/catch_all.hpp>
#include <value_de/from_value.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace test_support {

using namespace value_de;

// ============================================================
// Point - struct with two fields
// ============================================================

struct Point {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Point&) const = default;
};

inline constexpr std::array<std::string_view, 2> point_fields{"x", "y"};

struct PointVisitor : Visitor<PointVisitor, Point> {
    std::string expecting() const { return "struct Point"; }

    template <MapAccessType A>
    Point visit_map(A& map)
    {
        std::optional<int32_t> x;
        std::optional<int32_t> y;
        while (auto key = map.template next_key<std::string>()) {
            if (*key == "x") {
                if (x) throw Error::duplicate_field("x");
                x = map.template next_value<int32_t>();
            } else if (*key == "y") {
                if (y) throw Error::duplicate_field("y");
                y = map.template next_value<int32_t>();
            } else {
                throw Error::unknown_field(*key, point_fields);
            }
        }
        if (!x) throw Error::missing_field("x");
        if (!y) throw Error::missing_field("y");
        return Point{*x, *y};
    }

    template <SeqAccessType A>
    Point visit_seq(A& seq)
    {
        auto x = seq.template next_element<int32_t>();
        if (!x) throw Error::invalid_length(0, expecting());
        auto y = seq.template next_element<int32_t>();
        if (!y) throw Error::invalid_length(1, expecting());
        return Point{*x, *y};
    }
};

// ============================================================
// Command - enum with one variant of each kind
// ============================================================
//   Stop                     unit
//   Say(std::string)         newtype
//   Move(int32_t, int32_t)   tuple
//   Scale { factor: double } struct

struct Command {
    enum class Kind { Stop, Say, Move, Scale };

    Kind kind = Kind::Stop;
    std::string text;
    int32_t dx = 0;
    int32_t dy = 0;
    double factor = 1.0;

    bool operator==(const Command&) const = default;
};

inline constexpr std::array<std::string_view, 4> command_variants{"Stop", "Say", "Move", "Scale"};
inline constexpr std::array<std::string_view, 1> scale_fields{"factor"};

struct CommandKindVisitor : Visitor<CommandKindVisitor, Command::Kind> {
    std::string expecting() const { return "variant identifier"; }

    Command::Kind visit_str(std::string_view name)
    {
        if (name == "Stop") return Command::Kind::Stop;
        if (name == "Say") return Command::Kind::Say;
        if (name == "Move") return Command::Kind::Move;
        if (name == "Scale") return Command::Kind::Scale;
        throw Error::unknown_variant(name, command_variants);
    }
};

/// Tuple payload of Move; an empty array arrives as visit_unit
struct MoveVisitor : Visitor<MoveVisitor, Command> {
    std::string expecting() const { return "tuple variant Command::Move"; }

    Command visit_unit() { return Command{Command::Kind::Move}; }

    template <SeqAccessType A>
    Command visit_seq(A& seq)
    {
        auto dx = seq.template next_element<int32_t>();
        if (!dx) throw Error::invalid_length(0, expecting());
        auto dy = seq.template next_element<int32_t>();
        if (!dy) throw Error::invalid_length(1, expecting());
        Command cmd{Command::Kind::Move};
        cmd.dx = *dx;
        cmd.dy = *dy;
        return cmd;
    }
};

struct ScaleVisitor : Visitor<ScaleVisitor, Command> {
    std::string expecting() const { return "struct variant Command::Scale"; }

    template <MapAccessType A>
    Command visit_map(A& map)
    {
        std::optional<double> factor;
        while (auto key = map.template next_key<std::string>()) {
            if (*key != "factor") throw Error::unknown_field(*key, scale_fields);
            factor = map.template next_value<double>();
        }
        if (!factor) throw Error::missing_field("factor");
        Command cmd{Command::Kind::Scale};
        cmd.factor = *factor;
        return cmd;
    }
};

struct CommandVisitor : Visitor<CommandVisitor, Command> {
    std::string expecting() const { return "enum Command"; }

    template <EnumAccessType A>
    Command visit_enum(A& data)
    {
        auto [kind, access] = data.template variant<Command::Kind>();
        switch (kind) {
            case Command::Kind::Stop:
                access.unit_variant();
                return Command{Command::Kind::Stop};
            case Command::Kind::Say: {
                Command cmd{Command::Kind::Say};
                cmd.text = access.template newtype_variant<std::string>();
                return cmd;
            }
            case Command::Kind::Move:
                return access.tuple_variant(2, MoveVisitor{});
            case Command::Kind::Scale:
                return access.struct_variant(scale_fields, ScaleVisitor{});
        }
        throw Error::custom("unreachable Command kind");
    }
};

// ============================================================
// Error capture
// ============================================================

/// Run f and return the value_de::Error it throws
template <typename F>
Error capture_error(F&& f)
{
    try {
        std::forward<F>(f)();
    } catch (const Error& e) {
        return e;
    }
    FAIL("expected value_de::Error");
    return Error::custom("");
}

/// Parse a JSON literal used as test input
inline Value json(std::string_view text)
{
    std::string error;
    Value v = from_json(text, &error);
    REQUIRE(error.empty());
    return v;
}

} // namespace test_support

template <>
struct value_de::Deserialize<test_support::Point> {
    template <value_de::Deserializer D>
    static test_support::Point deserialize(D&& de)
    {
        return de.deserialize_struct("Point", test_support::point_fields, test_support::PointVisitor{});
    }
};

template <>
struct value_de::Deserialize<test_support::Command::Kind> {
    template <value_de::Deserializer D>
    static test_support::Command::Kind deserialize(D&& de)
    {
        return de.deserialize_identifier(test_support::CommandKindVisitor{});
    }
};

template <>
struct value_de::Deserialize<test_support::Command> {
    template <value_de::Deserializer D>
    static test_support::Command deserialize(D&& de)
    {
        return de.deserialize_enum("Command", test_support::command_variants, test_support::CommandVisitor{});
    }
};

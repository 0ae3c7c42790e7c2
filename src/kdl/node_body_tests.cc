#include "kdl/node_body.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace kdlgen;

TEST_CASE("node_body") {
    SUBCASE("plain-table") {
        Value::Table table{{"layout", "us"}, {"repeat-rate", 25}};

        NodeBody body;
        RenderResult result;
        REQUIRE(node_body_from_table(table, result, body));
        REQUIRE(body.args.empty());
        REQUIRE(body.props.empty());
        REQUIRE(body.ordered_children.empty());
        REQUIRE(body.extra.keys() == std::vector<std::string>{"layout", "repeat-rate"});
        REQUIRE(body.has_children());
    }

    SUBCASE("reserved-keys") {
        Value::Table table{
            {"b", 2},
            {"_children", Value::Array{Value::Table{{"a", 1}}, Value::Table{{"c", Value::Table{}}}}},
            {"_props", Value::Table{{"x", "y"}, {"w", 3}}},
            {"_args", Value::Array{1, "two", Value{}}},
        };

        NodeBody body;
        RenderResult result;
        REQUIRE(node_body_from_table(table, result, body));
        REQUIRE(result.is_ok());

        REQUIRE(body.args.size() == 3);
        REQUIRE(body.args[1].as_string() == "two");
        REQUIRE(body.args[2].is_null());

        REQUIRE(body.props.keys() == std::vector<std::string>{"x", "w"});

        REQUIRE(body.ordered_children.size() == 2);
        REQUIRE(body.ordered_children[0].first == "a");
        REQUIRE(body.ordered_children[1].first == "c");
        REQUIRE(body.ordered_children[1].second.is_table());

        REQUIRE(body.extra.keys() == std::vector<std::string>{"b"});
    }

    SUBCASE("no-children") {
        Value::Table table{{"_args", Value::Array{1}}, {"_props", Value::Table{{"x", 1}}}};

        NodeBody body;
        RenderResult result;
        REQUIRE(node_body_from_table(table, result, body));
        REQUIRE_FALSE(body.has_children());
    }

    SUBCASE("is-reserved-key") {
        REQUIRE(is_reserved_key("_args"));
        REQUIRE(is_reserved_key("_props"));
        REQUIRE(is_reserved_key("_children"));
        REQUIRE_FALSE(is_reserved_key("args"));
        REQUIRE_FALSE(is_reserved_key("_other"));
    }
}

TEST_CASE("node_body_errors") {
    auto expect_invalid = [](const Value::Table& table, const std::string& path) {
        NodeBody body;
        RenderResult result;
        REQUIRE_FALSE(node_body_from_table(table, result, body, "node"));
        REQUIRE(result.kind == RenderErrorKind::InvalidReservedKey);
        REQUIRE_EQ(result.path, path);
    };

    SUBCASE("args-not-an-array") {
        expect_invalid(Value::Table{{"_args", 1}}, "node._args");
        expect_invalid(Value::Table{{"_args", Value::Table{}}}, "node._args");
    }

    SUBCASE("args-with-containers") {
        expect_invalid(Value::Table{{"_args", Value::Array{1, Value::Array{2}}}}, "node._args[1]");
        expect_invalid(Value::Table{{"_args", Value::Array{Value::Table{{"a", 1}}}}}, "node._args[0]");
    }

    SUBCASE("props-not-a-table") {
        expect_invalid(Value::Table{{"_props", Value::Array{1}}}, "node._props");
        expect_invalid(Value::Table{{"_props", "x=y"}}, "node._props");
    }

    SUBCASE("props-with-containers") {
        expect_invalid(Value::Table{{"_props", Value::Table{{"ok", 1}, {"bad", Value::Array{}}}}}, "node._props.bad");
    }

    SUBCASE("children-not-an-array") {
        expect_invalid(Value::Table{{"_children", Value::Table{{"a", 1}}}}, "node._children");
    }

    SUBCASE("children-entries-not-tables") {
        expect_invalid(Value::Table{{"_children", Value::Array{1}}}, "node._children[0]");
        expect_invalid(Value::Table{{"_children", Value::Array{Value::Table{{"a", 1}}, Value::Array{}}}},
                       "node._children[1]");
    }

    SUBCASE("children-entries-with-zero-keys") {
        expect_invalid(Value::Table{{"_children", Value::Array{Value::Table{}}}}, "node._children[0]");
    }

    SUBCASE("children-entries-with-many-keys") {
        expect_invalid(Value::Table{{"_children", Value::Array{Value::Table{{"a", 1}, {"b", 2}}}}},
                       "node._children[0]");
    }
}

/**
 * @file test_value.cpp
 * @brief Unit tests for Type and Value (GoogleTest)
 */

#include <gtest/gtest.h>
#include "mocksynth/Type.hpp"
#include "mocksynth/Value.hpp"

#include <stdexcept>

using namespace mocksynth;

// ============================================================================
// Type
// ============================================================================

TEST(Type, DefaultIsDynamic) {
    Type t;
    EXPECT_TRUE(t.is_dynamic());
    EXPECT_EQ(t.friendly_name(), "dynamic");
}

TEST(Type, FriendlyNames) {
    EXPECT_EQ(Type::string().friendly_name(), "string");
    EXPECT_EQ(Type::number().friendly_name(), "number");
    EXPECT_EQ(Type::boolean().friendly_name(), "bool");
    EXPECT_EQ(Type::list(Type::string()).friendly_name(), "list of string");
    EXPECT_EQ(Type::set(Type::number()).friendly_name(), "set of number");
    EXPECT_EQ(Type::map(Type::empty_object()).friendly_name(), "map of object");
    EXPECT_EQ(Type::list(Type::list(Type::boolean())).friendly_name(), "list of list of bool");
    EXPECT_EQ(Type::object({{"id", Type::string()}}).friendly_name(), "object");
}

TEST(Type, StructuralEquality) {
    EXPECT_EQ(Type::list(Type::string()), Type::list(Type::string()));
    EXPECT_NE(Type::list(Type::string()), Type::set(Type::string()));
    EXPECT_NE(Type::list(Type::string()), Type::list(Type::number()));

    Type a = Type::object({{"id", Type::string()}, {"n", Type::number()}});
    Type b = Type::object({{"n", Type::number()}, {"id", Type::string()}});
    Type c = Type::object({{"id", Type::string()}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(Type, Predicates) {
    EXPECT_TRUE(Type::string().is_primitive());
    EXPECT_TRUE(Type::boolean().is_primitive());
    EXPECT_FALSE(Type::dynamic().is_primitive());
    EXPECT_TRUE(Type::map(Type::string()).is_collection());
    EXPECT_FALSE(Type::empty_object().is_collection());
    EXPECT_TRUE(Type::empty_object().is_object());
}

TEST(Type, ElementTypeOnlyForCollections) {
    EXPECT_EQ(Type::set(Type::number()).element_type(), Type::number());
    EXPECT_THROW(Type::string().element_type(), std::logic_error);
}

TEST(Type, AttributeLookup) {
    Type t = Type::object({{"id", Type::string()}});
    EXPECT_TRUE(t.has_attribute("id"));
    EXPECT_FALSE(t.has_attribute("value"));
    EXPECT_EQ(t.attribute_type("id"), Type::string());
    EXPECT_THROW(t.attribute_type("value"), std::out_of_range);
    EXPECT_FALSE(Type::string().has_attribute("id"));
    EXPECT_THROW(Type::string().attribute_types(), std::logic_error);
}

// ============================================================================
// Value
// ============================================================================

TEST(Value, NullsAreTyped) {
    Value s = Value::null(Type::string());
    Value n = Value::null(Type::number());

    EXPECT_TRUE(s.is_null());
    EXPECT_EQ(s.type(), Type::string());
    EXPECT_NE(s, n);
    EXPECT_EQ(s, Value::null(Type::string()));
    EXPECT_TRUE(Value().is_null());
    EXPECT_TRUE(Value().type().is_dynamic());
}

TEST(Value, NullIsNeverEqualToAKnownValue) {
    EXPECT_NE(Value::null(Type::string()), Value::string(""));
    EXPECT_NE(Value::string(""), Value::null(Type::string()));
}

TEST(Value, Primitives) {
    EXPECT_EQ(Value::string("x").as_string(), "x");
    EXPECT_EQ(Value::number(1.5).as_number(), 1.5);
    EXPECT_TRUE(Value::boolean(true).as_bool());
    EXPECT_THROW(Value::string("x").as_number(), std::logic_error);
    EXPECT_THROW(Value::null(Type::string()).as_string(), std::logic_error);
}

TEST(Value, ObjectTypeFollowsAttributes) {
    Value v = Value::object({{"id", Value::string("a")}, {"n", Value::null(Type::number())}});

    EXPECT_TRUE(v.is_object());
    EXPECT_EQ(v.type(), Type::object({{"id", Type::string()}, {"n", Type::number()}}));
    EXPECT_EQ(v.size(), 2u);
    EXPECT_TRUE(v.has_attr("id"));
    EXPECT_FALSE(v.has_attr("missing"));
    EXPECT_EQ(v.get_attr("id"), Value::string("a"));
    EXPECT_THROW(v.get_attr("missing"), std::out_of_range);
}

TEST(Value, NullObjectIsNotAnObject) {
    Value v = Value::null(Type::empty_object());
    EXPECT_FALSE(v.is_object());
    EXPECT_FALSE(v.has_attr("id"));
    EXPECT_EQ(v.size(), 0u);
}

TEST(Value, ListKeepsOrder) {
    Value a = Value::list(Type::string(), {Value::string("x"), Value::string("y")});
    Value b = Value::list(Type::string(), {Value::string("y"), Value::string("x")});

    EXPECT_TRUE(a.is_list());
    EXPECT_EQ(a.elements()[0], Value::string("x"));
    EXPECT_NE(a, b);
}

TEST(Value, SetCollapsesDuplicatesAndIgnoresOrder) {
    Value a = Value::set(Type::string(), {
        Value::string("x"), Value::string("y"), Value::string("x"),
    });
    Value b = Value::set(Type::string(), {Value::string("y"), Value::string("x")});

    EXPECT_EQ(a.size(), 2u);
    EXPECT_EQ(a.elements()[0], Value::string("x"));
    EXPECT_EQ(a, b);
}

TEST(Value, MapEntries) {
    Value m = Value::map(Type::number(), {{"b", Value::number(2)}, {"a", Value::number(1)}});

    EXPECT_TRUE(m.is_map());
    EXPECT_EQ(m.entries().begin()->first, "a");
    EXPECT_EQ(m.type(), Type::map(Type::number()));
    EXPECT_THROW(m.elements(), std::logic_error);
    EXPECT_THROW(m.attributes(), std::logic_error);
}

TEST(Value, EmptyCollectionsAreKnown) {
    EXPECT_FALSE(Value::empty_list(Type::string()).is_null());
    EXPECT_EQ(Value::empty_set(Type::string()).size(), 0u);
    EXPECT_NE(Value::empty_map(Type::string()), Value::null(Type::map(Type::string())));
}

TEST(Value, ToString) {
    EXPECT_EQ(Value::string("hi").to_string(), "\"hi\"");
    EXPECT_EQ(Value::number(42).to_string(), "42");
    EXPECT_EQ(Value::boolean(false).to_string(), "false");
    EXPECT_EQ(Value::null(Type::string()).to_string(), "null");
    EXPECT_EQ(Value::list(Type::number(), {Value::number(1), Value::number(2)}).to_string(),
              "[1, 2]");
    EXPECT_EQ(Value::set(Type::string(), {Value::string("a")}).to_string(), "toset([\"a\"])");
    EXPECT_EQ(Value::map(Type::string(), {{"k", Value::string("v")}}).to_string(),
              "tomap({\"k\" = \"v\"})");
    EXPECT_EQ(Value::object({{"id", Value::string("a")}}).to_string(), "{id = \"a\"}");
}

TEST(Value, FormatNumber) {
    EXPECT_EQ(format_number(0), "0");
    EXPECT_EQ(format_number(-3), "-3");
    EXPECT_EQ(format_number(1e6), "1000000");
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(0.1), "0.1");
}

/**
 * @file test_convert.cpp
 * @brief Unit tests for type-directed conversion (GoogleTest)
 */

#include <gtest/gtest.h>
#include "mocksynth/Convert.hpp"
#include "mocksynth/Errors.hpp"

#include <string>

using namespace mocksynth;

namespace {

/// Message of the ConversionError thrown by convert(), or "" if it succeeds.
std::string conversion_failure(const Value& value, const Type& want) {
    try {
        convert(value, want);
    } catch (const ConversionError& err) {
        return err.what();
    }
    return "";
}

} // namespace

// ============================================================================
// Identity and nulls
// ============================================================================

TEST(Convert, SameTypeIsUnchanged) {
    Value v = Value::list(Type::string(), {Value::string("a")});
    EXPECT_EQ(convert(v, Type::list(Type::string())), v);
}

TEST(Convert, DynamicAcceptsAnything) {
    Value v = Value::number(3);
    EXPECT_EQ(convert(v, Type::dynamic()), v);
}

TEST(Convert, NullTakesWantedType) {
    Value out = convert(Value(), Type::number());
    EXPECT_TRUE(out.is_null());
    EXPECT_EQ(out.type(), Type::number());
}

// ============================================================================
// Primitives
// ============================================================================

TEST(Convert, ToString) {
    EXPECT_EQ(convert(Value::number(42), Type::string()), Value::string("42"));
    EXPECT_EQ(convert(Value::number(1.25), Type::string()), Value::string("1.25"));
    EXPECT_EQ(convert(Value::boolean(true), Type::string()), Value::string("true"));
}

TEST(Convert, ToNumber) {
    EXPECT_EQ(convert(Value::string("12"), Type::number()), Value::number(12));
    EXPECT_EQ(convert(Value::string("-0.5"), Type::number()), Value::number(-0.5));
    EXPECT_EQ(convert(Value::string("1e3"), Type::number()), Value::number(1000));
    EXPECT_EQ(conversion_failure(Value::string("twelve"), Type::number()),
              "a number is required");
    EXPECT_EQ(conversion_failure(Value::string(" 12"), Type::number()),
              "a number is required");
    EXPECT_EQ(conversion_failure(Value::string("1e400"), Type::number()),
              "a number is required");
    EXPECT_EQ(conversion_failure(Value::boolean(true), Type::number()), "number required");
}

TEST(Convert, TinyNumberStringUnderflows) {
    Value out = convert(Value::string("1e-400"), Type::number());
    ASSERT_TRUE(out.type() == Type::number());
    EXPECT_NEAR(out.as_number(), 0.0, 1e-300);
    EXPECT_EQ(convert(Value::string("-1e-400"), Type::number()).type(), Type::number());
}

TEST(Convert, ToBool) {
    EXPECT_EQ(convert(Value::string("true"), Type::boolean()), Value::boolean(true));
    EXPECT_EQ(convert(Value::string("false"), Type::boolean()), Value::boolean(false));
    EXPECT_EQ(conversion_failure(Value::string("yes"), Type::boolean()), "a bool is required");
    EXPECT_EQ(conversion_failure(Value::number(1), Type::boolean()), "bool required");
}

TEST(Convert, CollectionToPrimitiveFails) {
    EXPECT_EQ(conversion_failure(Value::empty_list(Type::string()), Type::string()),
              "string required");
    EXPECT_EQ(conversion_failure(Value::empty_object(), Type::string()), "string required");
}

// ============================================================================
// Collections
// ============================================================================

TEST(Convert, ListElementsAreConverted) {
    Value in = Value::list(Type::number(), {Value::number(1), Value::number(2)});
    Value out = convert(in, Type::list(Type::string()));
    EXPECT_EQ(out, Value::list(Type::string(), {Value::string("1"), Value::string("2")}));
}

TEST(Convert, ListToSetDeduplicates) {
    Value in = Value::list(Type::string(), {Value::string("a"), Value::string("a")});
    Value out = convert(in, Type::set(Type::string()));
    EXPECT_TRUE(out.is_set());
    EXPECT_EQ(out.size(), 1u);
}

TEST(Convert, ElementFailureNamesTheIndex) {
    Value in = Value::list(Type::string(), {Value::string("1"), Value::string("x")});
    EXPECT_EQ(conversion_failure(in, Type::list(Type::number())),
              "element 1: a number is required");
}

TEST(Convert, ObjectToMap) {
    Value in = Value::object({{"a", Value::string("1")}, {"b", Value::number(2)}});
    Value out = convert(in, Type::map(Type::string()));
    EXPECT_EQ(out, Value::map(Type::string(), {
        {"a", Value::string("1")},
        {"b", Value::string("2")},
    }));
}

TEST(Convert, MapFailureNamesTheKey) {
    Value in = Value::map(Type::string(), {{"k", Value::string("x")}});
    EXPECT_EQ(conversion_failure(in, Type::map(Type::boolean())),
              "key \"k\": a bool is required");
}

TEST(Convert, MapToObject) {
    Type want = Type::object({{"id", Type::string()}, {"n", Type::number()}});
    Value in = Value::map(Type::string(), {{"id", Value::string("a")}, {"n", Value::string("3")}});

    Value out = convert(in, want);
    EXPECT_EQ(out.type(), want);
    EXPECT_EQ(out.get_attr("n"), Value::number(3));
}

TEST(Convert, ObjectAttributesMustMatch) {
    Type want = Type::object({{"id", Type::string()}});

    EXPECT_EQ(conversion_failure(Value::empty_object(), want),
              "attribute \"id\" is required");
    EXPECT_EQ(conversion_failure(Value::object({
                  {"id", Value::string("a")},
                  {"extra", Value::string("b")},
              }), want),
              "unsupported attribute \"extra\"");
    EXPECT_EQ(conversion_failure(Value::object({{"id", Value::empty_object()}}), want),
              "attribute \"id\": string required");
}

TEST(Convert, ErrorCarriesWantedTypeName) {
    try {
        convert(Value::empty_list(Type::string()), Type::string());
        FAIL() << "expected ConversionError";
    } catch (const ConversionError& err) {
        EXPECT_EQ(err.want(), "string");
    }
}

/**
 * @file test_path.cpp
 * @brief Unit tests for Path, SourceRange and Diagnostics (GoogleTest)
 */

#include <gtest/gtest.h>
#include "mocksynth/Diagnostics.hpp"
#include "mocksynth/Path.hpp"

using namespace mocksynth;

// ============================================================================
// Path
// ============================================================================

TEST(Path, EmptyPath) {
    Path p;
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.to_string(), "");
    EXPECT_EQ(p.attribute_string(), "");
}

TEST(Path, AppendDoesNotModifyReceiver) {
    Path root = Path().attribute("block");
    Path child = root.element(1).attribute("id");

    EXPECT_EQ(root.size(), 1u);
    EXPECT_EQ(child.size(), 3u);
    EXPECT_EQ(root.to_string(), "block");
}

TEST(Path, Rendering) {
    EXPECT_EQ(Path().attribute("a").attribute("b").to_string(), "a.b");
    EXPECT_EQ(Path().attribute("block").element(1).attribute("id").to_string(), "block[1].id");
    EXPECT_EQ(Path().attribute("m").key("k").to_string(), "m[\"k\"]");
    EXPECT_EQ(Path().attribute("m").key("k").attribute("id").to_string(), "m[\"k\"].id");
}

TEST(Path, AttributeStringSkipsIndexAndKeySteps) {
    EXPECT_EQ(Path().attribute("block").element(3).attribute("id").attribute_string(),
              "block.id");
    EXPECT_EQ(Path().attribute("nested").key("one").attribute("id").attribute_string(),
              "nested.id");
}

TEST(Path, Equality) {
    EXPECT_EQ(Path().attribute("a").element(0), Path().attribute("a").element(0));
    EXPECT_NE(Path().attribute("a").element(0), Path().attribute("a").key("0"));
}

TEST(DotPath, SplitAndJoin) {
    EXPECT_EQ(split_dot_path("database.host"), (std::vector<std::string>{"database", "host"}));
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_EQ(split_dot_path("a..b"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(join_dot_path({"a", "b", "c"}), "a.b.c");
    EXPECT_EQ(join_dot_path({}), "");
}

TEST(DotPath, PathFromDots) {
    Path p = path_from_dots("nested.id");
    EXPECT_EQ(p, Path().attribute("nested").attribute("id"));
    EXPECT_TRUE(path_from_dots("").empty());
}

// ============================================================================
// SourceRange
// ============================================================================

TEST(SourceRange, ZeroRange) {
    EXPECT_EQ(SourceRange{}.to_string(), ":0,0-0");
}

TEST(SourceRange, SingleLine) {
    SourceRange r{"main.tftest.hcl", {3, 10, 40}, {3, 25, 55}};
    EXPECT_EQ(r.to_string(), "main.tftest.hcl:3,10-25");
}

TEST(SourceRange, MultiLine) {
    SourceRange r{"main.tftest.hcl", {3, 10, 40}, {5, 2, 80}};
    EXPECT_EQ(r.to_string(), "main.tftest.hcl:3,10-5,2");
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(Diagnostics, Accumulates) {
    Diagnostics diags;
    EXPECT_TRUE(diags.empty());
    EXPECT_FALSE(diags.has_errors());

    Diagnostic warning;
    warning.severity = Severity::Warning;
    warning.summary = "Heads up";
    warning.detail = "first";
    diags.append(warning);
    EXPECT_FALSE(diags.has_errors());

    Diagnostic error;
    error.summary = "Broken";
    error.detail = "second";
    diags.append(error);

    ASSERT_EQ(diags.size(), 2u);
    EXPECT_TRUE(diags.has_errors());
    EXPECT_EQ(diags.details(), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(diags[1].to_string(), "Error: Broken: second");
    EXPECT_EQ(diags[0].to_string(), "Warning: Heads up: first");
}

TEST(Diagnostics, Extend) {
    Diagnostic d;
    d.detail = "x";

    Diagnostics a;
    a.append(d);
    Diagnostics b;
    b.append(d);
    b.append(d);

    a.extend(b);
    EXPECT_EQ(a.size(), 3u);

    size_t count = 0;
    for (const auto& item : a) {
        EXPECT_EQ(item.detail, "x");
        ++count;
    }
    EXPECT_EQ(count, 3u);
}

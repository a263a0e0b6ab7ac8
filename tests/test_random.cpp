/**
 * @file test_random.cpp
 * @brief Unit tests for RandomSource (GoogleTest)
 */

#include <gtest/gtest.h>
#include "mocksynth/Random.hpp"

#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mocksynth;

TEST(RandomSource, StringsUseLowercaseAlphanumerics) {
    RandomSource random(7);
    for (int i = 0; i < 50; ++i) {
        const std::string s = random.next_string();
        ASSERT_EQ(s.size(), RandomSource::kStringLength);
        for (char c : s) {
            EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) << s;
        }
    }
}

TEST(RandomSource, CustomLength) {
    RandomSource random(7);
    EXPECT_EQ(random.next_string(3).size(), 3u);
    EXPECT_EQ(random.next_string(0), "");
}

TEST(RandomSource, SameSeedSameSequence) {
    RandomSource a(0);
    RandomSource b(0);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.next_string(), b.next_string());
    }
}

TEST(RandomSource, DifferentSeedsDiverge) {
    RandomSource a(1);
    RandomSource b(2);
    EXPECT_NE(a.next_string(), b.next_string());
}

TEST(RandomSource, SuccessiveStringsDiffer) {
    RandomSource random(0);
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(random.next_string());
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(RandomSource, GeneratePrimitives) {
    RandomSource random(0);
    RandomSource expected(0);

    EXPECT_EQ(random.generate(Type::string()), Value::string(expected.next_string()));
    EXPECT_EQ(random.generate(Type::number()), Value::number(0));
    EXPECT_EQ(random.generate(Type::boolean()), Value::boolean(false));
}

TEST(RandomSource, GenerateCollectionsAreEmpty) {
    RandomSource random(0);

    EXPECT_EQ(random.generate(Type::list(Type::string())), Value::empty_list(Type::string()));
    EXPECT_EQ(random.generate(Type::set(Type::number())), Value::empty_set(Type::number()));
    EXPECT_EQ(random.generate(Type::map(Type::boolean())), Value::empty_map(Type::boolean()));
}

TEST(RandomSource, GenerateObjectFillsEveryAttribute) {
    RandomSource random(0);
    Type t = Type::object({
        {"id", Type::string()},
        {"count", Type::number()},
        {"tags", Type::list(Type::string())},
    });

    Value v = random.generate(t);
    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v.type(), t);
    EXPECT_EQ(v.get_attr("id").as_string().size(), RandomSource::kStringLength);
    EXPECT_EQ(v.get_attr("count"), Value::number(0));
    EXPECT_EQ(v.get_attr("tags").size(), 0u);
}

TEST(RandomSource, DynamicHasNoStrategy) {
    RandomSource random(0);
    Value v = random.generate(Type::dynamic());
    EXPECT_TRUE(v.is_null());
}

TEST(RandomSource, ConcurrentDrawsAreSafe) {
    RandomSource random(99);
    std::vector<std::thread> workers;
    std::vector<std::vector<std::string>> results(4);

    for (size_t t = 0; t < results.size(); ++t) {
        workers.emplace_back([&random, &results, t] {
            for (int i = 0; i < 250; ++i) {
                results[t].push_back(random.next_string());
            }
        });
    }
    for (auto& w : workers) w.join();

    std::set<std::string> all;
    for (const auto& r : results) all.insert(r.begin(), r.end());
    EXPECT_EQ(all.size(), 1000u);
}

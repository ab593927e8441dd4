/*
 * Copyright 2025 AxonOps
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "cache/parser_cache.h"
#include "errors.h"
#include <gtest/gtest.h>
#include <thread>

using namespace formatscan;
using namespace formatscan::cache;

/**
 * Parser Cache Tests - Test BOTH std and TBB implementations.
 *
 * Tests are parameterized to run with both use_tbb=false and use_tbb=true.
 * This ensures functional equivalence between both code paths.
 */
class ParserCacheTest : public ::testing::TestWithParam<bool> {
protected:
    CacheConfig makeConfig(bool use_tbb, size_t max_entries = 1000) {
        std::string json = std::string(R"({
            "cache_enabled": true,
            "max_entries": )") + std::to_string(max_entries) + R"(,
            "use_tbb": )" + (use_tbb ? "true" : "false") + R"(
        })";
        return CacheConfig::fromJson(json);
    }

    pattern::TypeRegistry registry;
    ParserOptions options;
    ParserCacheMetrics metrics;
};

// Basic compilation
TEST_P(ParserCacheTest, CompilePattern) {
    ParserCache cache(makeConfig(GetParam()));

    auto matcher = cache.getOrCompile("{:d} items", options, registry, metrics);

    ASSERT_NE(matcher, nullptr);
    EXPECT_EQ(matcher->pattern(), "{:d} items");
    EXPECT_TRUE(matcher->parse("3 items").has_value());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.usingTBB(), GetParam());
    EXPECT_EQ(metrics.misses.load(), 1u);
    EXPECT_EQ(metrics.hits.load(), 0u);
}

// Cache hit (same pattern twice)
TEST_P(ParserCacheTest, CacheHit) {
    ParserCache cache(makeConfig(GetParam()));

    auto m1 = cache.getOrCompile("{name}", options, registry, metrics);
    auto m2 = cache.getOrCompile("{name}", options, registry, metrics);

    EXPECT_EQ(m1.get(), m2.get()) << "Same pattern should return same matcher";
    EXPECT_EQ(metrics.hits.load(), 1u);
    EXPECT_EQ(metrics.misses.load(), 1u);
    EXPECT_DOUBLE_EQ(metrics.hit_rate(), 50.0);
}

// Options are part of the key
TEST_P(ParserCacheTest, OptionsCreateDistinctEntries) {
    ParserCache cache(makeConfig(GetParam()));

    ParserOptions sensitive;
    sensitive.case_sensitive = true;

    auto m1 = cache.getOrCompile("Hello {}", sensitive, registry, metrics);
    auto m2 = cache.getOrCompile("Hello {}", options, registry, metrics);

    EXPECT_NE(m1.get(), m2.get()) << "Different options = different entries";
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(metrics.misses.load(), 2u);
    EXPECT_FALSE(m1->parse("HELLO x").has_value());
    EXPECT_TRUE(m2->parse("HELLO x").has_value());
}

// Registering a type changes the registry generation
TEST_P(ParserCacheTest, RegistrationInvalidates) {
    ParserCache cache(makeConfig(GetParam()));

    auto before = cache.getOrCompile("{:d}", options, registry, metrics);
    registry.registerCustom("d", "[0-9]", [](std::string_view s) -> pattern::Value {
        return std::string(s);
    });
    auto after = cache.getOrCompile("{:d}", options, registry, metrics);

    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(metrics.misses.load(), 2u);

    // Old holders keep the old behavior
    EXPECT_TRUE(std::holds_alternative<int64_t>((*before->parse("7"))[0]));
    EXPECT_TRUE(std::holds_alternative<std::string>((*after->parse("7"))[0]));
}

// Different registries never share entries
TEST_P(ParserCacheTest, RegistryIdentityInKey) {
    ParserCache cache(makeConfig(GetParam()));
    pattern::TypeRegistry other;

    auto m1 = cache.getOrCompile("{}", options, registry, metrics);
    auto m2 = cache.getOrCompile("{}", options, other, metrics);

    EXPECT_NE(m1.get(), m2.get());
    EXPECT_NE(ParserCache::makeKey("{}", options, registry.snapshot()),
              ParserCache::makeKey("{}", options, other.snapshot()));
}

// Least recently used entry goes first
TEST_P(ParserCacheTest, LRUEviction) {
    ParserCache cache(makeConfig(GetParam(), 2));

    auto a = cache.getOrCompile("a{}", options, registry, metrics);
    auto b = cache.getOrCompile("b{}", options, registry, metrics);
    cache.getOrCompile("a{}", options, registry, metrics);   // A now more recent than B
    cache.getOrCompile("c{}", options, registry, metrics);   // Evicts B

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(metrics.lru_evictions.load(), 1u);

    uint64_t misses = metrics.misses.load();
    EXPECT_EQ(cache.getOrCompile("a{}", options, registry, metrics).get(), a.get());
    EXPECT_EQ(metrics.misses.load(), misses);

    EXPECT_NE(cache.getOrCompile("b{}", options, registry, metrics).get(), b.get());
    EXPECT_EQ(metrics.misses.load(), misses + 1);
}

// Evicted matchers remain usable by their holders
TEST_P(ParserCacheTest, EvictedMatcherStillUsable) {
    ParserCache cache(makeConfig(GetParam(), 1));

    auto first = cache.getOrCompile("x={:d}", options, registry, metrics);
    cache.getOrCompile("y={:d}", options, registry, metrics);

    EXPECT_EQ(cache.size(), 1u);
    auto result = first->parse("x=5");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<int64_t>((*result)[0]), 5);
}

// Failed compilations are counted and never cached
TEST_P(ParserCacheTest, CompilationErrors) {
    ParserCache cache(makeConfig(GetParam()));

    EXPECT_THROW(cache.getOrCompile("{", options, registry, metrics), PatternSyntaxError);
    EXPECT_THROW(cache.getOrCompile("{", options, registry, metrics), PatternSyntaxError);

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(metrics.compilation_errors.load(), 2u);
    EXPECT_EQ(metrics.compilation_timeouts.load(), 0u);
    EXPECT_EQ(metrics.misses.load(), 2u);
}

TEST_P(ParserCacheTest, CompilationTimeoutsCounted) {
    ParserCache cache(makeConfig(GetParam()));
    options.compile_timeout = std::chrono::microseconds(1);

    std::string pattern;
    for (int i = 0; i < 50; ++i) {
        pattern += "{:te} ";
    }

    EXPECT_THROW(cache.getOrCompile(pattern, options, registry, metrics), CompilationTimeoutError);
    EXPECT_EQ(metrics.compilation_errors.load(), 1u);
    EXPECT_EQ(metrics.compilation_timeouts.load(), 1u);
    EXPECT_EQ(cache.size(), 0u);
}

// Disabled cache compiles every time
TEST_P(ParserCacheTest, Disabled) {
    CacheConfig config = makeConfig(GetParam());
    config.cache_enabled = false;
    ParserCache cache(config);

    auto m1 = cache.getOrCompile("{}", options, registry, metrics);
    auto m2 = cache.getOrCompile("{}", options, registry, metrics);

    EXPECT_NE(m1.get(), m2.get());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(metrics.misses.load(), 2u);
    EXPECT_EQ(metrics.hits.load(), 0u);
}

TEST_P(ParserCacheTest, Clear) {
    ParserCache cache(makeConfig(GetParam()));

    cache.getOrCompile("{a}", options, registry, metrics);
    cache.getOrCompile("{b}", options, registry, metrics);
    EXPECT_EQ(cache.size(), 2u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_P(ParserCacheTest, SnapshotMetrics) {
    ParserCache cache(makeConfig(GetParam(), 4));

    cache.getOrCompile("{}", options, registry, metrics);
    cache.snapshotMetrics(metrics);

    EXPECT_EQ(metrics.current_entry_count, 1u);
    EXPECT_EQ(metrics.max_entries, 4u);
    EXPECT_DOUBLE_EQ(metrics.utilization_ratio, 0.25);
    EXPECT_EQ(metrics.using_tbb, GetParam());
}

// Many threads asking for the same pattern share one entry
TEST_P(ParserCacheTest, ConcurrentSamePattern) {
    ParserCache cache(makeConfig(GetParam()));

    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<const CompiledMatcher>> results(8);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 50; ++i) {
                results[t] = cache.getOrCompile("{key}={value:d}", options, registry, metrics);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(metrics.hits.load() + metrics.misses.load(), 400u);
    for (const auto& m : results) {
        ASSERT_NE(m, nullptr);
        EXPECT_TRUE(m->parse("k=1").has_value());
    }
}

// Concurrent inserts never leave the cache above its bound
TEST_P(ParserCacheTest, ConcurrentEviction) {
    ParserCache cache(makeConfig(GetParam(), 10));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 50; ++i) {
                std::string pattern = "t" + std::to_string(t) + "_" + std::to_string(i) + "={:d}";
                auto m = cache.getOrCompile(pattern, options, registry, metrics);
                EXPECT_NE(m, nullptr);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_LE(cache.size(), 10u);
    EXPECT_EQ(metrics.misses.load(), 200u);
    EXPECT_EQ(metrics.lru_evictions.load(), 200u - cache.size());
}

INSTANTIATE_TEST_SUITE_P(
    BothImplementations,
    ParserCacheTest,
    ::testing::Values(false, true),
    [](const ::testing::TestParamInfo<bool>& info) {
        return info.param ? "TBB" : "Std";
    }
);

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

#pragma once

#include "cache/cache_config.h"
#include "cache/cache_metrics.h"
#include "compiled_matcher.h"
#include "parser_options.h"
#include "pattern/type_registry.h"
#include <oneapi/tbb/concurrent_hash_map.h>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace formatscan {
namespace cache {

/**
 * Parser Cache - bounded LRU store of compiled matchers.
 *
 * Dual implementation:
 * - std::unordered_map + shared_mutex (default, simpler)
 * - TBB concurrent_hash_map (optional, high-concurrency)
 *
 * Entries are keyed by pattern text, option fingerprint, registry id and
 * registry generation, so a type registration never serves a stale
 * matcher. Matchers are shared_ptr<const>; eviction only drops the cache's
 * reference and holders keep using theirs.
 *
 * Thread-safe for concurrent lookup, compilation and eviction.
 */
class ParserCache {
public:
    explicit ParserCache(const CacheConfig& config);
    ~ParserCache();

    ParserCache(const ParserCache&) = delete;
    ParserCache& operator=(const ParserCache&) = delete;

    /**
     * Get or compile a matcher.
     *
     * Flow:
     * 1. Check cache (hit → bump recency, return)
     * 2. Compile with no lock held (miss)
     * 3. Insert; if another thread won the race, return its matcher
     * 4. Evict least recently used entries while over max_entries
     *
     * With cache_enabled == false every call compiles and nothing is stored.
     *
     * @param pattern pattern text
     * @param options matching options and limits
     * @param registry type registry (snapshotted once per call)
     * @param metrics metrics to update
     * @return compiled matcher, never null
     * @throws FormatScanError subclasses from compilation
     */
    std::shared_ptr<const CompiledMatcher> getOrCompile(
        const std::string& pattern,
        const ParserOptions& options,
        const pattern::TypeRegistry& registry,
        ParserCacheMetrics& metrics);

    /**
     * Drop every entry.
     */
    void clear();

    /**
     * Update snapshot fields of metrics.
     */
    void snapshotMetrics(ParserCacheMetrics& metrics) const;

    /**
     * Get current entry count.
     */
    size_t size() const;

    bool usingTBB() const { return using_tbb_; }

    /**
     * Cache key for one compilation request.
     */
    static std::string makeKey(const std::string& pattern,
                               const ParserOptions& options,
                               const pattern::RegistrySnapshot& registry);

private:
    struct ParserCacheEntry {
        std::shared_ptr<const CompiledMatcher> matcher;
        mutable std::atomic<uint64_t> last_used{0};  // Recency tick, bumped on hit

        ParserCacheEntry() = default;  // Default constructor for TBB

        ParserCacheEntry(std::shared_ptr<const CompiledMatcher> m, uint64_t tick)
            : matcher(std::move(m)), last_used(tick) {}

        ParserCacheEntry(const ParserCacheEntry& other)
            : matcher(other.matcher), last_used(other.last_used.load()) {}
    };

    const CacheConfig config_;
    const bool using_tbb_;

    std::atomic<uint64_t> tick_{0};

    // ========== std::unordered_map Implementation ==========
    std::unordered_map<std::string, ParserCacheEntry> std_cache_;
    mutable std::shared_mutex std_mutex_;

    // ========== TBB concurrent_hash_map Implementation ==========
    using TBBMap = tbb::concurrent_hash_map<std::string, ParserCacheEntry>;
    TBBMap tbb_cache_;
    mutable std::shared_mutex tbb_evict_mutex_;  // Shared for access, unique for LRU scans

    // ========== Implementation Methods ==========

    std::shared_ptr<const CompiledMatcher> getOrCompileStd(
        const std::string& key,
        const std::string& pattern,
        const ParserOptions& options,
        const pattern::RegistrySnapshot& registry,
        ParserCacheMetrics& metrics);

    std::shared_ptr<const CompiledMatcher> getOrCompileTBB(
        const std::string& key,
        const std::string& pattern,
        const ParserOptions& options,
        const pattern::RegistrySnapshot& registry,
        ParserCacheMetrics& metrics);

    // Caller holds std_mutex_ exclusively
    void evictLRUStd(ParserCacheMetrics& metrics);

    void evictLRUTBB(ParserCacheMetrics& metrics);

    std::shared_ptr<const CompiledMatcher> compileCounted(
        const std::string& pattern,
        const ParserOptions& options,
        const pattern::RegistrySnapshot& registry,
        ParserCacheMetrics& metrics);

    uint64_t nextTick() { return tick_.fetch_add(1, std::memory_order_relaxed) + 1; }
};

}  // namespace cache
}  // namespace formatscan

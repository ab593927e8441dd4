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
#include <limits>
#include <mutex>

namespace formatscan {
namespace cache {

//============================================================================
// Constructor / Destructor
//============================================================================

ParserCache::ParserCache(const CacheConfig& config)
    : config_(config),
      using_tbb_(config.use_tbb) {
    // Both implementations always present (zero overhead when not used)
}

ParserCache::~ParserCache() {
    clear();
}

//============================================================================
// Public API (Dispatches to std or TBB implementation)
//============================================================================

std::string ParserCache::makeKey(const std::string& pattern,
                                 const ParserOptions& options,
                                 const pattern::RegistrySnapshot& registry) {
    std::string key = pattern;
    key.push_back('\0');
    key += options.fingerprint();
    key.push_back('\0');
    key += std::to_string(registry.registryId());
    key.push_back(':');
    key += std::to_string(registry.generation());
    return key;
}

std::shared_ptr<const CompiledMatcher> ParserCache::getOrCompile(
    const std::string& pattern,
    const ParserOptions& options,
    const pattern::TypeRegistry& registry,
    ParserCacheMetrics& metrics) {

    pattern::RegistrySnapshot snapshot = registry.snapshot();

    if (!config_.cache_enabled) {
        metrics.misses.fetch_add(1);
        return compileCounted(pattern, options, snapshot, metrics);
    }

    std::string key = makeKey(pattern, options, snapshot);

    if (using_tbb_) {
        return getOrCompileTBB(key, pattern, options, snapshot, metrics);
    } else {
        return getOrCompileStd(key, pattern, options, snapshot, metrics);
    }
}

void ParserCache::clear() {
    if (using_tbb_) {
        std::unique_lock lock(tbb_evict_mutex_);
        tbb_cache_.clear();
    } else {
        std::unique_lock lock(std_mutex_);
        std_cache_.clear();
    }
}

void ParserCache::snapshotMetrics(ParserCacheMetrics& metrics) const {
    metrics.current_entry_count = size();
    metrics.max_entries = config_.max_entries;
    metrics.utilization_ratio = metrics.max_entries > 0
        ? static_cast<double>(metrics.current_entry_count) / metrics.max_entries
        : 0.0;
    metrics.using_tbb = using_tbb_;
}

size_t ParserCache::size() const {
    if (using_tbb_) {
        return tbb_cache_.size();
    } else {
        std::shared_lock lock(std_mutex_);
        return std_cache_.size();
    }
}

std::shared_ptr<const CompiledMatcher> ParserCache::compileCounted(
    const std::string& pattern,
    const ParserOptions& options,
    const pattern::RegistrySnapshot& registry,
    ParserCacheMetrics& metrics) {

    try {
        return CompiledMatcher::compile(pattern, options, registry);
    } catch (const CompilationTimeoutError&) {
        metrics.compilation_errors.fetch_add(1);
        metrics.compilation_timeouts.fetch_add(1);
        throw;
    } catch (const std::exception&) {
        metrics.compilation_errors.fetch_add(1);
        throw;
    }
}

//============================================================================
// std::unordered_map Implementation
//============================================================================

std::shared_ptr<const CompiledMatcher> ParserCache::getOrCompileStd(
    const std::string& key,
    const std::string& pattern,
    const ParserOptions& options,
    const pattern::RegistrySnapshot& registry,
    ParserCacheMetrics& metrics) {

    // Try cache lookup first (shared lock - allows concurrent reads)
    {
        std::shared_lock lock(std_mutex_);
        auto it = std_cache_.find(key);

        if (it != std_cache_.end()) {
            // CACHE HIT
            it->second.last_used.store(nextTick(), std::memory_order_relaxed);
            metrics.hits.fetch_add(1);
            return it->second.matcher;
        }
    }

    // CACHE MISS - compile with no lock held (compilation can be slow)
    metrics.misses.fetch_add(1);
    auto matcher = compileCounted(pattern, options, registry, metrics);

    // Add to cache (exclusive lock for write)
    std::unique_lock lock(std_mutex_);

    // Double-check not added by another thread while we were compiling
    auto it = std_cache_.find(key);
    if (it != std_cache_.end()) {
        // Another thread compiled it - use theirs, discard ours
        it->second.last_used.store(nextTick(), std::memory_order_relaxed);
        return it->second.matcher;
    }

    std_cache_.try_emplace(key, matcher, nextTick());
    evictLRUStd(metrics);

    return matcher;
}

void ParserCache::evictLRUStd(ParserCacheMetrics& metrics) {
    while (std_cache_.size() > config_.max_entries) {
        auto oldest = std_cache_.begin();
        for (auto it = std_cache_.begin(); it != std_cache_.end(); ++it) {
            if (it->second.last_used.load(std::memory_order_relaxed) <
                oldest->second.last_used.load(std::memory_order_relaxed)) {
                oldest = it;
            }
        }
        std_cache_.erase(oldest);
        metrics.lru_evictions.fetch_add(1);
    }
}

//============================================================================
// TBB concurrent_hash_map Implementation
//============================================================================

std::shared_ptr<const CompiledMatcher> ParserCache::getOrCompileTBB(
    const std::string& key,
    const std::string& pattern,
    const ParserOptions& options,
    const pattern::RegistrySnapshot& registry,
    ParserCacheMetrics& metrics) {

    // Try cache lookup first (TBB accessor for read)
    {
        std::shared_lock evict_guard(tbb_evict_mutex_);
        TBBMap::const_accessor acc;

        if (tbb_cache_.find(acc, key)) {
            // CACHE HIT
            acc->second.last_used.store(nextTick(), std::memory_order_relaxed);
            metrics.hits.fetch_add(1);
            return acc->second.matcher;
        }
    }

    // CACHE MISS - compile with no lock held
    metrics.misses.fetch_add(1);
    auto matcher = compileCounted(pattern, options, registry, metrics);

    // Add to cache (TBB accessor for write)
    {
        std::shared_lock evict_guard(tbb_evict_mutex_);
        TBBMap::accessor acc;

        if (!tbb_cache_.insert(acc, key)) {
            // Another thread inserted while we were compiling
            // Use their matcher, discard ours
            acc->second.last_used.store(nextTick(), std::memory_order_relaxed);
            return acc->second.matcher;
        }

        acc->second.matcher = matcher;
        acc->second.last_used.store(nextTick(), std::memory_order_relaxed);
    }

    if (tbb_cache_.size() > config_.max_entries) {
        evictLRUTBB(metrics);
    }

    return matcher;
}

void ParserCache::evictLRUTBB(ParserCacheMetrics& metrics) {
    // Exclusive: no accessor can be alive while we iterate
    std::unique_lock evict_guard(tbb_evict_mutex_);

    while (tbb_cache_.size() > config_.max_entries) {
        std::string oldest_key;
        uint64_t oldest_tick = std::numeric_limits<uint64_t>::max();

        for (TBBMap::iterator it = tbb_cache_.begin(); it != tbb_cache_.end(); ++it) {
            uint64_t tick = it->second.last_used.load(std::memory_order_relaxed);
            if (tick < oldest_tick) {
                oldest_tick = tick;
                oldest_key = it->first;
            }
        }

        if (!tbb_cache_.erase(oldest_key)) {
            break;
        }
        metrics.lru_evictions.fetch_add(1);
    }
}

}  // namespace cache
}  // namespace formatscan

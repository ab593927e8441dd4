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
#include "cache/parser_cache.h"
#include <string>

namespace formatscan {
namespace cache {

/**
 * Cache Manager - owns the parser cache, its configuration and its counters.
 *
 * Lifecycle:
 * 1. Construct with configuration
 * 2. Use the cache via parserCache() with metrics()
 * 3. Destruct (drops every cached matcher; outstanding shared_ptrs stay valid)
 */
class CacheManager {
public:
    explicit CacheManager(const CacheConfig& config);
    ~CacheManager();

    // Disable copy/move
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * Get current metrics snapshot.
     * Thread-safe - works on a fresh copy of the counters.
     *
     * @return JSON string with all metrics
     */
    std::string getMetricsJSON() const;

    /**
     * Drop all cached matchers (for testing or reset).
     */
    void clearAllCaches();

    const CacheConfig& config() const { return config_; }
    ParserCache& parserCache() { return parser_cache_; }
    ParserCacheMetrics& metrics() { return metrics_; }

private:
    CacheConfig config_;
    ParserCacheMetrics metrics_;
    ParserCache parser_cache_;
};

}  // namespace cache
}  // namespace formatscan

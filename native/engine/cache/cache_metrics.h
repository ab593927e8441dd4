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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace formatscan {
namespace cache {

/**
 * Metrics for the compiled parser cache.
 */
struct ParserCacheMetrics {
    // Hit/Miss
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};

    // Errors (compilation_timeouts is a subset of compilation_errors)
    std::atomic<uint64_t> compilation_errors{0};
    std::atomic<uint64_t> compilation_timeouts{0};

    // Evictions
    std::atomic<uint64_t> lru_evictions{0};

    // Capacity (snapshot under lock)
    uint64_t current_entry_count = 0;
    uint64_t max_entries = 0;
    double utilization_ratio = 0.0;

    // Implementation info (snapshot)
    bool using_tbb = false;

    /**
     * Hit percentage over all lookups (0.0 when there were none).
     */
    double hit_rate() const;

    /**
     * Copy the atomic counters (not the snapshot fields) from another instance.
     */
    void copyCountersFrom(const ParserCacheMetrics& other);

    std::string toJson() const;
};

/**
 * Point-in-time metrics report for the facade.
 */
struct CacheMetrics {
    ParserCacheMetrics parser_cache;

    std::chrono::system_clock::time_point generated_at;

    /**
     * Serialize all metrics to JSON.
     *
     * @return JSON string with all metrics
     */
    std::string toJson() const;
};

}  // namespace cache
}  // namespace formatscan

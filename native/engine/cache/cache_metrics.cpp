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

#include "cache/cache_metrics.h"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace formatscan {
namespace cache {

// Helper to format ISO 8601 timestamp
static std::string formatISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

//============================================================================
// Parser Cache Metrics
//============================================================================

double ParserCacheMetrics::hit_rate() const {
    uint64_t h = hits.load();
    uint64_t m = misses.load();
    return (h + m) > 0 ? (100.0 * h) / (h + m) : 0.0;
}

void ParserCacheMetrics::copyCountersFrom(const ParserCacheMetrics& other) {
    hits.store(other.hits.load());
    misses.store(other.misses.load());
    compilation_errors.store(other.compilation_errors.load());
    compilation_timeouts.store(other.compilation_timeouts.load());
    lru_evictions.store(other.lru_evictions.load());
}

std::string ParserCacheMetrics::toJson() const {
    json j;

    j["hits"] = hits.load();
    j["misses"] = misses.load();
    j["hit_rate"] = hit_rate();

    json errors;
    errors["compilation"] = compilation_errors.load();
    errors["timeouts"] = compilation_timeouts.load();
    j["errors"] = errors;

    json evictions;
    evictions["lru"] = lru_evictions.load();
    j["evictions"] = evictions;

    json capacity;
    capacity["entry_count"] = current_entry_count;
    capacity["max_entries"] = max_entries;
    capacity["utilization_ratio"] = utilization_ratio;
    j["capacity"] = capacity;

    j["using_tbb"] = using_tbb;

    return j.dump();
}

//============================================================================
// Combined report
//============================================================================

std::string CacheMetrics::toJson() const {
    json j;
    j["parser_cache"] = json::parse(parser_cache.toJson());
    j["generated_at"] = formatISO8601(generated_at);
    return j.dump(2);
}

}  // namespace cache
}  // namespace formatscan

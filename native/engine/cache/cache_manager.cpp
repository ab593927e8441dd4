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

#include "cache/cache_manager.h"

namespace formatscan {
namespace cache {

CacheManager::CacheManager(const CacheConfig& config)
    : config_(config),
      parser_cache_(config_) {}

CacheManager::~CacheManager() {
    parser_cache_.clear();
}

std::string CacheManager::getMetricsJSON() const {
    // Fresh snapshot so concurrent callers never share snapshot fields
    CacheMetrics snapshot;

    snapshot.parser_cache.copyCountersFrom(metrics_);
    parser_cache_.snapshotMetrics(snapshot.parser_cache);

    snapshot.generated_at = std::chrono::system_clock::now();

    return snapshot.toJson();
}

void CacheManager::clearAllCaches() {
    parser_cache_.clear();
}

}  // namespace cache
}  // namespace formatscan

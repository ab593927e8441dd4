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

#include <cstddef>
#include <string>

namespace formatscan {
namespace cache {

/**
 * Configuration for the compiled parser cache.
 *
 * All parameters configurable via JSON; missing keys take defaults.
 */
struct CacheConfig {
    bool cache_enabled = true;

    // LRU bound on cached matchers
    size_t max_entries = 1000;

    bool use_tbb = false;  // Use TBB concurrent_hash_map (default: false)

    /**
     * Parse configuration from JSON string.
     *
     * @param json JSON configuration string (empty string for defaults)
     * @return parsed configuration with defaults applied
     * @throws std::runtime_error if JSON invalid
     * @throws std::invalid_argument if validation fails
     */
    static CacheConfig fromJson(const std::string& json);

    /**
     * Validate configuration parameters.
     *
     * @throws std::invalid_argument if configuration invalid
     */
    void validate() const;

    /**
     * Serialize configuration to JSON (for debugging).
     *
     * @return JSON string
     */
    std::string toJson() const;
};

}  // namespace cache
}  // namespace formatscan

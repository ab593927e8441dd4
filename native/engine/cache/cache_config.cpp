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

#include "cache/cache_config.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace formatscan {
namespace cache {

CacheConfig CacheConfig::fromJson(const std::string& json_str) {
    CacheConfig config;

    if (json_str.empty()) {
        return config;
    }

    try {
        json j = json::parse(json_str);

        config.cache_enabled = j.value("cache_enabled", true);
        config.max_entries = j.value("max_entries", static_cast<size_t>(1000));
        config.use_tbb = j.value("use_tbb", false);

    } catch (const json::parse_error& e) {
        std::ostringstream msg;
        msg << "Failed to parse cache configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    } catch (const json::type_error& e) {
        std::ostringstream msg;
        msg << "Invalid type in cache configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    }

    config.validate();
    return config;
}

void CacheConfig::validate() const {
    // If cache disabled, nothing else matters
    if (!cache_enabled) {
        return;
    }

    if (max_entries == 0) {
        throw std::invalid_argument("max_entries must be > 0 when cache enabled");
    }
}

std::string CacheConfig::toJson() const {
    json j;
    j["cache_enabled"] = cache_enabled;
    j["max_entries"] = max_entries;
    j["use_tbb"] = use_tbb;
    return j.dump(2);
}

}  // namespace cache
}  // namespace formatscan

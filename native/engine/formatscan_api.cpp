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

#include "formatscan_api.h"
#include "cache/cache_manager.h"
#include "parser_options.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>

namespace formatscan {
namespace api {

//============================================================================
// Global State (NO Lazy Init - Explicit Only)
//============================================================================

static std::atomic<cache::CacheManager*> g_cache_manager{nullptr};
static std::mutex g_init_mutex;

static thread_local ErrorCode t_last_error = ErrorCode::kOk;

namespace {

void succeed(std::string& error_out) {
    t_last_error = ErrorCode::kOk;
    error_out.clear();
}

void fail(ErrorCode code, const char* message, std::string& error_out) {
    t_last_error = code;
    error_out = message;
}

std::shared_ptr<const CompiledMatcher> compileOrThrow(const std::string& pattern,
                                                      const std::string& options_json) {
    ParserOptions options = ParserOptions::fromJson(options_json);

    cache::CacheManager* mgr = g_cache_manager.load(std::memory_order_acquire);

    if (mgr == nullptr) {
        // NO CACHE - compile directly
        return CompiledMatcher::compile(pattern, options, typeRegistry());
    }

    // CACHE ENABLED
    return mgr->parserCache().getOrCompile(pattern, options, typeRegistry(), mgr->metrics());
}

/**
 * Run fn, translating every exception into error_out + lastErrorCode().
 */
template <typename Result, typename Fn>
Result guarded(std::string& error_out, Result on_error, Fn&& fn) {
    try {
        Result result = fn();
        succeed(error_out);
        return result;
    } catch (const FormatScanError& e) {
        fail(e.code(), e.what(), error_out);
    } catch (const std::exception& e) {
        // Option/configuration errors (std::invalid_argument, std::runtime_error)
        fail(ErrorCode::kInvalidArgument, e.what(), error_out);
    }
    return on_error;
}

}  // namespace

//============================================================================
// Public API
//============================================================================

pattern::TypeRegistry& typeRegistry() {
    static pattern::TypeRegistry registry;
    return registry;
}

std::shared_ptr<const CompiledMatcher> compile(
    const std::string& pattern,
    const std::string& options_json,
    std::string& error_out) {

    return guarded<std::shared_ptr<const CompiledMatcher>>(error_out, nullptr, [&]() {
        return compileOrThrow(pattern, options_json);
    });
}

std::optional<MatchResult> parse(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out) {

    return guarded<std::optional<MatchResult>>(error_out, std::nullopt, [&]() {
        return compileOrThrow(pattern, options_json)->parse(text);
    });
}

std::optional<MatchResult> search(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out) {

    return guarded<std::optional<MatchResult>>(error_out, std::nullopt, [&]() {
        return compileOrThrow(pattern, options_json)->search(text);
    });
}

std::optional<RawMatch> parseRaw(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out) {

    return guarded<std::optional<RawMatch>>(error_out, std::nullopt, [&]() {
        return compileOrThrow(pattern, options_json)->parseRaw(text);
    });
}

std::optional<RawMatch> searchRaw(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out) {

    return guarded<std::optional<RawMatch>>(error_out, std::nullopt, [&]() {
        return compileOrThrow(pattern, options_json)->searchRaw(text);
    });
}

std::vector<MatchResult> findAll(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out) {

    return guarded<std::vector<MatchResult>>(error_out, {}, [&]() {
        return compileOrThrow(pattern, options_json)->findAll(text).toVector();
    });
}

bool registerType(
    const std::string& id,
    const std::string& sub_pattern,
    pattern::Converter converter,
    std::string& error_out) {

    return guarded<bool>(error_out, false, [&]() {
        typeRegistry().registerCustom(id, sub_pattern, std::move(converter));
        return true;
    });
}

ErrorCode lastErrorCode() {
    return t_last_error;
}

std::string getMetricsJSON() {
    cache::CacheManager* mgr = g_cache_manager.load(std::memory_order_acquire);

    if (!mgr) {
        // Cache not initialized - return empty metrics
        cache::CacheMetrics empty;
        empty.generated_at = std::chrono::system_clock::now();
        return empty.toJson();
    }

    return mgr->getMetricsJSON();
}

//============================================================================
// Cache lifecycle
//============================================================================

void initCache(const std::string& json_config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_cache_manager.load(std::memory_order_acquire) != nullptr) {
        throw std::runtime_error("Cache already initialized");
    }

    // Empty string yields defaults
    cache::CacheConfig config = cache::CacheConfig::fromJson(json_config);

    cache::CacheManager* new_mgr = new cache::CacheManager(config);
    g_cache_manager.store(new_mgr, std::memory_order_release);
}

void shutdownCache() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    cache::CacheManager* mgr = g_cache_manager.exchange(nullptr, std::memory_order_acq_rel);

    if (mgr) {
        delete mgr;  // Destructor clears the cache
    }
}

bool isCacheInitialized() {
    return g_cache_manager.load(std::memory_order_acquire) != nullptr;
}

}  // namespace api
}  // namespace formatscan

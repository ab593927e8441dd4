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

#include "compiled_matcher.h"
#include "errors.h"
#include "match_result.h"
#include "pattern/type_registry.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formatscan {
namespace api {

/**
 * High-level C++ API for language bindings.
 *
 * No exception crosses this layer: failures return null / std::nullopt /
 * false, describe themselves in error_out and set lastErrorCode() for the
 * calling thread. A successful call that simply finds no match returns
 * std::nullopt with lastErrorCode() == ErrorCode::kOk.
 *
 * Features:
 * - NO automatic lazy init (explicit initCache() call required for caching)
 * - If no initCache() called: every compile goes straight to the engine
 * - One process-wide type registry shared by every call
 *
 * Typical usage:
 *   initCache();
 *   auto m = compile("{name}: {age:d}", "", error);
 *   auto r = m->parse("alice: 42");
 *   shutdownCache();
 *
 * shutdownCache() must not race with in-flight calls on other threads.
 * Matchers already handed out remain valid after shutdown.
 */

/**
 * Enable the process-wide parser cache.
 *
 * @param json_config CacheConfig JSON (empty = defaults)
 * @throws std::runtime_error if already initialized or the JSON is invalid
 * @throws std::invalid_argument if the configuration is invalid
 */
void initCache(const std::string& json_config = "");

/**
 * Disable the cache and drop every cached matcher. Safe to call twice.
 */
void shutdownCache();

bool isCacheInitialized();

/**
 * Compile a pattern, through the cache when it is initialized.
 *
 * @param pattern pattern text
 * @param options_json ParserOptions JSON (empty = defaults)
 * @param error_out set to the error message on failure
 * @return shared matcher, or nullptr on error
 */
std::shared_ptr<const CompiledMatcher> compile(
    const std::string& pattern,
    const std::string& options_json,
    std::string& error_out);

/**
 * One-shot: compile (or fetch) the pattern and match the whole text.
 *
 * @return values, or std::nullopt on no match or error (see lastErrorCode())
 */
std::optional<MatchResult> parse(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out);

/**
 * One-shot: first match anywhere in text.
 */
std::optional<MatchResult> search(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out);

/**
 * One-shot parse that leaves every field as captured text (no converters).
 */
std::optional<RawMatch> parseRaw(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out);

/**
 * One-shot search that leaves every field as captured text (no converters).
 */
std::optional<RawMatch> searchRaw(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out);

/**
 * One-shot: every non-overlapping match, materialized.
 *
 * @return matches (empty on no match or error)
 */
std::vector<MatchResult> findAll(
    const std::string& pattern,
    std::string_view text,
    const std::string& options_json,
    std::string& error_out);

/**
 * Register a custom type in the process-wide registry.
 *
 * Cached matchers compiled before the registration are never served again
 * (the registry generation is part of the cache key).
 *
 * @return true on success
 */
bool registerType(
    const std::string& id,
    const std::string& sub_pattern,
    pattern::Converter converter,
    std::string& error_out);

/**
 * Outcome of the calling thread's most recent facade call.
 */
ErrorCode lastErrorCode();

/**
 * Cache metrics as JSON (zeroed counters when the cache is not initialized).
 */
std::string getMetricsJSON();

/**
 * The process-wide type registry.
 */
pattern::TypeRegistry& typeRegistry();

}  // namespace api
}  // namespace formatscan

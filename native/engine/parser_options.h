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

#include <re2/re2.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace formatscan {

/**
 * Options controlling how a pattern is compiled and what limits apply.
 *
 * Used for:
 * 1. Configuring the synthesized RE2 expression
 * 2. Security limits enforced before and during compilation
 * 3. Cache key generation (different options = different cache entry)
 * 4. JSON serialization (bindings send options as JSON)
 *
 * All fields optional in JSON - missing fields use defaults.
 */
struct ParserOptions {
    // ========== MATCHING ==========
    bool case_sensitive = false;    // Literal text and type sub-patterns match case
    bool dot_nl = true;             // Untyped fields may span newlines

    // ========== SECURITY LIMITS ==========
    size_t max_pattern_length = 10000;
    size_t max_input_length = 10000000;
    size_t max_fields = 100;
    size_t max_field_name_length = 200;
    size_t max_repeat = 1000;       // Largest width/precision (RE2 repeat ceiling)

    // Wall-clock budget for constructing the RE2 object
    std::chrono::microseconds compile_timeout = std::chrono::milliseconds(200);

    // ========== RE2 MEMORY LIMIT ==========
    int64_t max_mem = 8388608;      // 8MB default

    /**
     * Convert to RE2::Options.
     *
     * Errors are never logged by RE2; they are reported as exceptions.
     *
     * @return RE2::Options for the synthesized expression
     */
    RE2::Options toRE2Options() const;

    /**
     * Stable textual fingerprint of every option (part of cache keys).
     *
     * @return fingerprint string, equal for equal options
     */
    std::string fingerprint() const;

    /**
     * Parse options from JSON string.
     *
     * JSON format:
     * {
     *   "case_sensitive": false,
     *   "dot_nl": true,
     *   "max_pattern_length": 10000,
     *   "max_input_length": 10000000,
     *   "max_fields": 100,
     *   "max_field_name_length": 200,
     *   "max_repeat": 1000,
     *   "compile_timeout_ms": 200,
     *   "max_mem": 8388608
     * }
     *
     * All fields optional - missing fields use defaults. An empty string
     * yields defaults.
     *
     * @param json JSON string with options
     * @return validated ParserOptions
     * @throws std::runtime_error if JSON invalid
     * @throws std::invalid_argument if a value is out of range
     */
    static ParserOptions fromJson(const std::string& json);

    /**
     * Validate option values.
     *
     * @throws std::invalid_argument if any limit is zero or the timeout is not positive
     */
    void validate() const;

    /**
     * Serialize options to JSON (for debugging and round-tripping).
     *
     * @return JSON string
     */
    std::string toJson() const;

    bool operator==(const ParserOptions& other) const = default;
};

}  // namespace formatscan

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

#include "pattern/value.h"
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace formatscan {

using Span = std::pair<size_t, size_t>;   // [start, end) byte offsets

/**
 * Values extracted by one successful match. Owned by the caller.
 */
struct MatchResult {
    std::vector<pattern::Value> fixed;              // Positional fields, pattern order
    std::map<std::string, pattern::Value> named;    // Named fields
    Span span{0, 0};                                // Whole match

    // Per-field span (padding included), keyed by name or decimal index
    std::map<std::string, Span> field_spans;

    /**
     * Positional value by appearance order.
     * @throws std::out_of_range if i >= fixed.size()
     */
    const pattern::Value& operator[](size_t i) const { return fixed.at(i); }

    /**
     * Named value.
     * @throws std::out_of_range if no field has that name
     */
    const pattern::Value& operator[](const std::string& name) const { return named.at(name); }

    bool contains(const std::string& name) const { return named.count(name) != 0; }

    /**
     * Serialize to JSON (date/time values as ISO 8601 strings).
     */
    std::string toJson() const;

    /**
     * Named values as a JSON object, with bracketed names nested:
     * "user[name]" and "user[id]" become {"user": {"name": ..., "id": ...}}.
     * A later path that runs through an existing leaf replaces the leaf.
     */
    std::string namedTreeJson() const;

    bool operator==(const MatchResult& other) const = default;
};

/**
 * Captured field text of one match, before any converter has run.
 *
 * Padding is already removed; CompiledMatcher::evaluate() turns it into a
 * MatchResult.
 */
struct RawMatch {
    std::vector<std::string> fixed;
    std::map<std::string, std::string> named;
    Span span{0, 0};
    std::map<std::string, Span> field_spans;

    bool operator==(const RawMatch& other) const = default;
};

}  // namespace formatscan

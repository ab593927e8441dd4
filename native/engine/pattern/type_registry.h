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

#include "pattern/field_spec.h"
#include "pattern/value.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace formatscan {
namespace pattern {

/**
 * How a field's ".precision" applies to a type.
 */
enum class PrecisionMode {
    kMaxLength,     // String-like: at most N characters of char_class
    kFractional,    // Float-like: at most N fractional digits
    kIgnored        // Integers, date/time and custom types
};

/**
 * Everything the compiler needs to know about one type code.
 */
struct TypeEntry {
    std::string code;
    std::string sub_pattern;            // RE2 fragment without capturing groups
    Converter converter;                // Null for plain string types
    PrecisionMode precision_mode = PrecisionMode::kIgnored;
    Alignment default_align = Alignment::kRight;
    bool numeric = false;               // Accepts the ' ' sign flag

    // kMaxLength: single-character class repeated up to precision times
    std::string char_class;

    // kFractional: fragment limited to the given number of fractional digits
    std::function<std::string(size_t)> precise_pattern;

    bool custom = false;
};

using TypeTable = std::unordered_map<std::string, std::shared_ptr<const TypeEntry>>;

/**
 * Immutable view of a registry at one generation.
 *
 * Compilation resolves every field through a single snapshot, so a
 * concurrent registration never yields a half-old, half-new matcher.
 */
class RegistrySnapshot {
public:
    RegistrySnapshot(std::shared_ptr<const TypeTable> table, uint64_t registry_id, uint64_t generation)
        : table_(std::move(table)), registry_id_(registry_id), generation_(generation) {}

    /**
     * Resolve a type code.
     *
     * Strftime-style codes (starting with '%', other than "%" itself) are
     * built on demand unless a custom registration shadows them.
     *
     * @param code type code from a format spec ("" for the default type)
     * @return entry, or nullptr when the code is unknown
     */
    std::shared_ptr<const TypeEntry> lookup(std::string_view code) const;

    uint64_t registryId() const { return registry_id_; }
    uint64_t generation() const { return generation_; }

private:
    std::shared_ptr<const TypeTable> table_;
    uint64_t registry_id_;
    uint64_t generation_;
};

/**
 * Type Registry - maps type codes to sub-patterns and converters.
 *
 * Built-in codes are installed on construction. Custom registrations are
 * serialized by a mutex and published as a new immutable table (copy on
 * write); readers never block writers for longer than a pointer copy.
 *
 * Each registry has a process-unique id, and every registration bumps the
 * generation. Both are part of parser cache keys.
 */
class TypeRegistry {
public:
    TypeRegistry();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /**
     * Resolve a type code against the current table.
     *
     * @return entry, or nullptr when the code is unknown
     */
    std::shared_ptr<const TypeEntry> lookup(std::string_view code) const;

    /**
     * Register (or replace) a custom type.
     *
     * The fragment must compile on its own; its capturing groups are
     * rewritten to non-capturing ones. A custom code may shadow a built-in.
     *
     * @param id type identifier, [A-Za-z][A-Za-z0-9_]*
     * @param sub_pattern RE2 fragment matching the type's text
     * @param converter text to value (must not be null)
     * @throws InvalidSubPatternError if id, fragment or converter is invalid
     */
    void registerCustom(const std::string& id, const std::string& sub_pattern, Converter converter);

    /**
     * Current immutable view (table + id + generation).
     */
    RegistrySnapshot snapshot() const;

    uint64_t id() const { return id_; }
    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

private:
    const uint64_t id_;
    std::atomic<uint64_t> generation_{0};

    std::mutex write_mutex_;                    // Serializes registrations
    mutable std::shared_mutex table_mutex_;     // Guards the table_ pointer swap
    std::shared_ptr<const TypeTable> table_;
};

/**
 * The built-in type table.
 */
std::shared_ptr<const TypeTable> builtinTypeTable();

}  // namespace pattern
}  // namespace formatscan

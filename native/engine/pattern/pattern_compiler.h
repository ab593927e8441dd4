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
#include "pattern/type_registry.h"
#include "security_guard.h"
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace formatscan {
namespace pattern {

struct LiteralSegment {
    std::string text;
};

struct FieldSegment {
    FieldSpec spec;
    std::shared_ptr<const TypeEntry> type;
};

using Segment = std::variant<LiteralSegment, FieldSegment>;

/**
 * Tokenized pattern: literal runs (adjacent text merged) and fields with
 * their resolved types, in pattern order.
 */
struct PatternAST {
    std::vector<Segment> segments;
    size_t field_count = 0;
};

/**
 * Tokenize a pattern and resolve every field's type.
 *
 * Grammar:
 * - "{{" and "}}" are literal braces
 * - "{" opens a field closed by the next "}"; a nested "{" is an error
 * - the field interior splits at the first ':' into name/index and format spec
 * - empty name: next auto index; all digits: explicit index; otherwise a name
 *   matching [A-Za-z_][A-Za-z0-9_.\[\]-]*
 *
 * Limits (pattern size, field count, name length, width/precision) are
 * enforced through the guard while scanning, before any regex work.
 *
 * @param text pattern text
 * @param registry registry snapshot used for every lookup
 * @param guard limit checks
 * @return tokenized pattern
 * @throws PatternSyntaxError for malformed patterns, unknown types, duplicates
 * @throws LimitExceededError when a limit is exceeded
 */
PatternAST compilePattern(std::string_view text,
                          const RegistrySnapshot& registry,
                          const SecurityGuard& guard);

}  // namespace pattern
}  // namespace formatscan

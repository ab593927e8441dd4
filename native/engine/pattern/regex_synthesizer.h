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

#include "pattern/pattern_compiler.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formatscan {
namespace pattern {

/**
 * How one field appears in the synthesized expression.
 */
struct FieldCapture {
    FieldSpec spec;
    std::shared_ptr<const TypeEntry> type;

    int span_group = 0;     // Whole field, padding included
    int value_group = 0;    // Value only

    Alignment align = Alignment::kNone;     // Effective alignment
    std::string fill = " ";                 // Effective fill code point

    // Width is counted into the expression; the value group then holds the
    // padded span and the value is recovered by valueText()
    bool trim_fill = false;
};

/**
 * Expression text plus the group layout needed to read a match.
 */
struct ExpressionSource {
    std::string expression;
    std::vector<FieldCapture> fields;   // Pattern order
    int group_count = 0;
};

/**
 * Assemble one RE2 expression for a tokenized pattern.
 *
 * Literals are quoted. Each field becomes "(pad(value)pad)": an outer group
 * spanning the whole field and an inner group holding the value. Type
 * content is wrapped in (?:...) so alternations stay local.
 *
 * A width on an aligned plain string field is a minimum code point count
 * for the whole field. It is written as counted repetitions over the padded
 * span, so every assignment RE2 tries already satisfies it. Other types
 * take their padding without a minimum.
 *
 * The expression is not anchored; callers choose ANCHOR_BOTH or UNANCHORED
 * at match time.
 */
ExpressionSource synthesize(const PatternAST& ast);

/**
 * Value text of a field given the text captured by its value group.
 *
 * Strips the fill from the padded side(s) when the field carries a counted
 * width; otherwise returns the capture unchanged.
 */
std::string_view valueText(const FieldCapture& field, std::string_view captured);

}  // namespace pattern
}  // namespace formatscan

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

#include "pattern/regex_synthesizer.h"
#include "pattern/regex_util.h"
#include <re2/re2.h>

namespace formatscan {
namespace pattern {

namespace {

Alignment effectiveAlignment(const FieldSpec& spec, const TypeEntry& type) {
    if (spec.align != Alignment::kNone) {
        return spec.align;
    }
    if (spec.zero_pad) {
        return Alignment::kZeroPad;
    }
    if (spec.width) {
        return type.default_align;
    }
    return Alignment::kNone;
}

std::string effectiveFill(const FieldSpec& spec) {
    if (spec.fill) {
        return *spec.fill;
    }
    return spec.zero_pad ? "0" : " ";
}

// Plain string content that cannot begin or end with the fill character.
std::string fillBoundedString(const std::string& not_fill, std::optional<size_t> precision) {
    if (!precision) {
        return not_fill + "(?:.*?" + not_fill + ")?";
    }
    if (*precision == 0) {
        return "";
    }
    if (*precision == 1) {
        return not_fill;
    }
    return not_fill + "(?:.{0," + std::to_string(*precision - 2) + "}" + not_fill + ")?";
}

// "atom{n}", or nothing when n is zero
std::string exactly(const std::string& atom, size_t n) {
    if (n == 0) {
        return "";
    }
    return atom + "{" + std::to_string(n) + "}";
}

std::string atLeast(const std::string& atom, size_t n) {
    if (n == 0) {
        return atom + "*";
    }
    return atom + "{" + std::to_string(n) + ",}";
}

std::string upTo(const std::string& atom, size_t n) {
    if (n == 0) {
        return "";
    }
    return atom + "{0," + std::to_string(n) + "}";
}

// At least min code points; with the trailing fill run removed, at most max remain.
std::string paddedTail(const std::string& not_fill, const std::string& fill,
                       size_t min, std::optional<size_t> max) {
    if (!max) {
        return exactly(".", min) + "(?:.*?" + not_fill + ")??" + fill + "*";
    }
    if (*max < min) {
        return exactly(".", *max) + atLeast(fill, min - *max);
    }
    if (*max == min) {
        return exactly(".", min) + fill + "*";
    }
    return exactly(".", min) + "(?:" + upTo(".", *max - min - 1) + not_fill + ")??" + fill + "*";
}

// Mirror of paddedTail for a leading fill run.
std::string paddedHead(const std::string& not_fill, const std::string& fill,
                       size_t min, std::optional<size_t> max) {
    if (!max) {
        return fill + "*(?:" + not_fill + ".*?)??" + exactly(".", min);
    }
    if (*max < min) {
        return atLeast(fill, min - *max) + exactly(".", *max);
    }
    if (*max == min) {
        return fill + "*" + exactly(".", min);
    }
    return fill + "*(?:" + not_fill + upTo(".", *max - min - 1) + ")??" + exactly(".", min);
}

/**
 * Padded span of a plain string field with a width.
 *
 * The span is at least width code points, the value (span minus fill on
 * the padded side) begins and ends with a non-fill code point and holds at
 * most precision code points. Centered fields enumerate the position of the
 * first non-fill code point, so their program grows with width squared.
 */
std::string countedSpan(const FieldCapture& field, size_t width) {
    const std::string fill = escapeCodePoint(field.fill);
    const std::string not_fill = "[^" + fill + "]";

    std::optional<size_t> precision = field.spec.precision;
    if (precision && *precision == 0) {
        return atLeast(fill, width);
    }

    // Budget for the value after its first (or last) code point
    std::optional<size_t> rest;
    if (precision) {
        rest = *precision - 1;
    }

    switch (field.align) {
        case Alignment::kLeft:
            return not_fill + paddedTail(not_fill, fill, width - 1, rest);
        case Alignment::kRight:
            return paddedHead(not_fill, fill, width - 1, rest) + not_fill;
        default: {
            std::string alternatives;
            for (size_t lead = 0; lead + 1 < width; ++lead) {
                alternatives += exactly(fill, lead) + not_fill +
                                paddedTail(not_fill, fill, width - 1 - lead, rest) + "|";
            }
            alternatives += atLeast(fill, width - 1) + not_fill + paddedTail(not_fill, fill, 0, rest);
            return "(?:" + alternatives + ")";
        }
    }
}

bool hasCountedWidth(const FieldCapture& field) {
    bool plain_string = field.type->precision_mode == PrecisionMode::kMaxLength &&
                        field.type->char_class == ".";
    bool padded = field.align == Alignment::kLeft || field.align == Alignment::kRight ||
                  field.align == Alignment::kCenter;
    return plain_string && padded && field.spec.width && *field.spec.width > 0;
}

std::string fieldContent(const FieldCapture& field) {
    const FieldSpec& spec = field.spec;
    const TypeEntry& type = *field.type;

    bool plain_string = type.precision_mode == PrecisionMode::kMaxLength && type.char_class == ".";
    if (plain_string && field.align != Alignment::kNone) {
        std::string not_fill = "[^" + escapeCodePoint(field.fill) + "]";
        return fillBoundedString(not_fill, spec.precision);
    }

    if (spec.precision) {
        switch (type.precision_mode) {
            case PrecisionMode::kMaxLength:
                if (*spec.precision == 0) {
                    return "";
                }
                return type.char_class + "{1," + std::to_string(*spec.precision) + "}";
            case PrecisionMode::kFractional:
                return type.precise_pattern(*spec.precision);
            default:
                break;
        }
    }

    return type.sub_pattern;
}

}  // namespace

ExpressionSource synthesize(const PatternAST& ast) {
    ExpressionSource out;
    int group = 0;

    for (const auto& segment : ast.segments) {
        if (const auto* literal = std::get_if<LiteralSegment>(&segment)) {
            out.expression += RE2::QuoteMeta(literal->text);
            continue;
        }

        const auto& field_segment = std::get<FieldSegment>(segment);

        FieldCapture field;
        field.spec = field_segment.spec;
        field.type = field_segment.type;
        field.align = effectiveAlignment(field.spec, *field.type);
        field.fill = effectiveFill(field.spec);

        field.span_group = ++group;
        field.value_group = ++group;

        if (hasCountedWidth(field)) {
            field.trim_fill = true;
            out.expression += "((" + countedSpan(field, *field.spec.width) + "))";
            out.fields.push_back(std::move(field));
            continue;
        }

        std::string value = "(?:" + fieldContent(field) + ")";
        if (field.spec.sign == ' ' && field.type->numeric) {
            value = " ?" + value;
        }

        std::string pad = "(?:" + escapeCodePoint(field.fill) + ")*";

        switch (field.align) {
            case Alignment::kLeft:
                out.expression += "((" + value + ")" + pad + ")";
                break;
            case Alignment::kRight:
                out.expression += "(" + pad + "(" + value + "))";
                break;
            case Alignment::kCenter:
                out.expression += "(" + pad + "(" + value + ")" + pad + ")";
                break;
            case Alignment::kZeroPad:
                // Fill sits between the sign and the digits; stripped before conversion
                out.expression += "(([-+]?" + pad + value + "))";
                break;
            case Alignment::kNone:
                out.expression += "((" + value + "))";
                break;
        }

        out.fields.push_back(std::move(field));
    }

    out.group_count = group;
    return out;
}

std::string_view valueText(const FieldCapture& field, std::string_view captured) {
    if (!field.trim_fill || field.fill.empty()) {
        return captured;
    }
    if (field.align != Alignment::kRight) {
        while (captured.ends_with(field.fill)) {
            captured.remove_suffix(field.fill.size());
        }
    }
    if (field.align != Alignment::kLeft) {
        while (captured.starts_with(field.fill)) {
            captured.remove_prefix(field.fill.size());
        }
    }
    return captured;
}

}  // namespace pattern
}  // namespace formatscan

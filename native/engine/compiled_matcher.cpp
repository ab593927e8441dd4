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

#include "compiled_matcher.h"
#include "errors.h"
#include "security_guard.h"
#include "pattern/pattern_compiler.h"
#include <algorithm>
#include <stdexcept>

namespace formatscan {

namespace {

std::string_view view(const re2::StringPiece& piece) {
    return std::string_view(piece.data(), piece.size());
}

size_t nextCodePoint(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return pos + 1;
    }
    size_t length = pattern::utf8SequenceLength(static_cast<unsigned char>(text[pos]));
    return std::min(pos + length, text.size());
}

// '=' alignment: the fill sits between the sign and the digits
std::string stripZeroPadding(std::string_view raw, const std::string& fill) {
    std::string result;
    if (!raw.empty() && (raw.front() == '+' || raw.front() == '-')) {
        result.push_back(raw.front());
        raw.remove_prefix(1);
    }
    while (!fill.empty() && raw.size() > fill.size() && raw.substr(0, fill.size()) == fill) {
        raw.remove_prefix(fill.size());
    }
    result.append(raw);
    return result;
}

pattern::Value convertField(const pattern::FieldCapture& field, const std::string& text) {
    if (!field.type->converter) {
        return text;
    }
    try {
        return field.type->converter(text);
    } catch (const FormatScanError&) {
        throw;
    } catch (const std::exception& e) {
        const std::string& code = field.spec.type_code.empty() ? field.type->code
                                                                : field.spec.type_code;
        throw ConversionError(field.spec.key(), code, text, e.what());
    }
}

}  // namespace

//============================================================================
// Compilation
//============================================================================

CompiledMatcher::CompiledMatcher(std::string pattern,
                                 ParserOptions options,
                                 pattern::ExpressionSource source,
                                 std::unique_ptr<RE2> regex)
    : pattern_(std::move(pattern)),
      options_(std::move(options)),
      source_(std::move(source)),
      regex_(std::move(regex)) {}

std::shared_ptr<const CompiledMatcher> CompiledMatcher::compile(
    const std::string& pattern,
    const ParserOptions& options,
    const pattern::RegistrySnapshot& registry) {

    SecurityGuard guard(options);
    pattern::PatternAST ast = pattern::compilePattern(pattern, registry, guard);
    pattern::ExpressionSource source = pattern::synthesize(ast);
    std::unique_ptr<RE2> regex = guard.compileExpression(source.expression);

    if (regex->NumberOfCapturingGroups() != source.group_count) {
        throw std::logic_error("synthesized expression has " +
                               std::to_string(regex->NumberOfCapturingGroups()) +
                               " groups, expected " + std::to_string(source.group_count));
    }

    // Constructor is private, so no make_shared
    return std::shared_ptr<const CompiledMatcher>(
        new CompiledMatcher(pattern, options, std::move(source), std::move(regex)));
}

std::shared_ptr<const CompiledMatcher> CompiledMatcher::compile(
    const std::string& pattern,
    const ParserOptions& options,
    const pattern::TypeRegistry& registry) {
    return compile(pattern, options, registry.snapshot());
}

std::vector<std::string> CompiledMatcher::namedFields() const {
    std::vector<std::string> names;
    for (const auto& field : source_.fields) {
        if (field.spec.isNamed()) {
            names.push_back(*field.spec.name);
        }
    }
    return names;
}

//============================================================================
// Matching
//============================================================================

std::optional<MatchResult> CompiledMatcher::parse(std::string_view text) const {
    std::optional<RawMatch> raw = parseRaw(text);
    if (!raw) {
        return std::nullopt;
    }
    return evaluate(*raw);
}

std::optional<MatchResult> CompiledMatcher::search(std::string_view text,
                                                   size_t pos,
                                                   size_t endpos) const {
    std::optional<RawMatch> raw = searchRaw(text, pos, endpos);
    if (!raw) {
        return std::nullopt;
    }
    return evaluate(*raw);
}

std::optional<RawMatch> CompiledMatcher::parseRaw(std::string_view text) const {
    SecurityGuard(options_).checkInput(pattern::codePointCount(text));
    return match(text, 0, text.size(), RE2::ANCHOR_BOTH);
}

std::optional<RawMatch> CompiledMatcher::searchRaw(std::string_view text,
                                                   size_t pos,
                                                   size_t endpos) const {
    SecurityGuard(options_).checkInput(pattern::codePointCount(text));
    endpos = std::min(endpos, text.size());
    if (pos > endpos) {
        return std::nullopt;
    }
    return match(text, pos, endpos, RE2::UNANCHORED);
}

MatchRange CompiledMatcher::findAll(std::string_view text) const {
    SecurityGuard(options_).checkInput(pattern::codePointCount(text));
    return MatchRange(shared_from_this(), text);
}

std::optional<RawMatch> CompiledMatcher::match(std::string_view text,
                                               size_t pos,
                                               size_t endpos,
                                               RE2::Anchor anchor) const {
    const int n = source_.group_count + 1;
    std::vector<re2::StringPiece> groups(n);
    re2::StringPiece input(text.data(), text.size());

    if (!regex_->Match(input, pos, endpos, anchor, groups.data(), n)) {
        return std::nullopt;
    }
    return capture(text, groups);
}

RawMatch CompiledMatcher::capture(std::string_view text,
                                  const std::vector<re2::StringPiece>& groups) const {
    auto offsetOf = [&](const re2::StringPiece& piece, size_t fallback) -> Span {
        if (piece.data() == nullptr) {
            return {fallback, fallback};
        }
        size_t start = static_cast<size_t>(piece.data() - text.data());
        return {start, start + piece.size()};
    };

    RawMatch raw;
    raw.span = offsetOf(groups[0], 0);

    for (const auto& field : source_.fields) {
        std::string_view captured = pattern::valueText(field, view(groups[field.value_group]));
        std::string value_text = field.align == pattern::Alignment::kZeroPad
                                     ? stripZeroPadding(captured, field.fill)
                                     : std::string(captured);

        std::string key = field.spec.key();
        raw.field_spans[key] = offsetOf(groups[field.span_group], raw.span.first);

        if (field.spec.isNamed()) {
            raw.named.emplace(std::move(key), std::move(value_text));
        } else {
            raw.fixed.push_back(std::move(value_text));
        }
    }

    return raw;
}

MatchResult CompiledMatcher::evaluate(const RawMatch& raw) const {
    MatchResult result;
    result.span = raw.span;
    result.field_spans = raw.field_spans;

    size_t next_fixed = 0;
    for (const auto& field : source_.fields) {
        if (field.spec.isNamed()) {
            const std::string& name = *field.spec.name;
            result.named.emplace(name, convertField(field, raw.named.at(name)));
        } else {
            result.fixed.push_back(convertField(field, raw.fixed.at(next_fixed++)));
        }
    }

    return result;
}

//============================================================================
// MatchRange
//============================================================================

MatchRange::iterator::iterator(std::shared_ptr<const CompiledMatcher> matcher, std::string_view text)
    : matcher_(std::move(matcher)), text_(text) {
    advance();
}

void MatchRange::iterator::advance() {
    if (!matcher_ || pos_ > text_.size()) {
        current_.reset();
        return;
    }

    current_ = matcher_->search(text_, pos_);
    if (!current_) {
        return;
    }

    auto [start, end] = current_->span;
    pos_ = end == start ? nextCodePoint(text_, end) : end;
}

std::vector<MatchResult> MatchRange::toVector() const {
    std::vector<MatchResult> results;
    for (auto it = begin(); it != end(); ++it) {
        results.push_back(*it);
    }
    return results;
}

}  // namespace formatscan

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

#include "match_result.h"
#include "parser_options.h"
#include "pattern/regex_synthesizer.h"
#include "pattern/type_registry.h"
#include <re2/re2.h>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formatscan {

class CompiledMatcher;

/**
 * Lazy sequence of non-overlapping matches, left to right.
 *
 * Every begin() starts a fresh scan; iterators share no state. The
 * referenced text must outlive the range and its iterators.
 */
class MatchRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MatchResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const MatchResult*;
        using reference = const MatchResult&;

        iterator() = default;   // End sentinel

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        iterator operator++(int) {
            iterator previous = *this;
            advance();
            return previous;
        }

        bool operator==(const iterator& other) const {
            if (!current_ || !other.current_) {
                return !current_ && !other.current_;
            }
            return matcher_ == other.matcher_ && current_->span == other.current_->span;
        }

    private:
        friend class MatchRange;

        iterator(std::shared_ptr<const CompiledMatcher> matcher, std::string_view text);

        void advance();

        std::shared_ptr<const CompiledMatcher> matcher_;
        std::string_view text_;
        size_t pos_ = 0;
        std::optional<MatchResult> current_;
    };

    MatchRange(std::shared_ptr<const CompiledMatcher> matcher, std::string_view text)
        : matcher_(std::move(matcher)), text_(text) {}

    iterator begin() const { return iterator(matcher_, text_); }
    iterator end() const { return iterator(); }

    /**
     * Drain a fresh scan into a vector.
     */
    std::vector<MatchResult> toVector() const;

private:
    std::shared_ptr<const CompiledMatcher> matcher_;
    std::string_view text_;
};

/**
 * Compiled Matcher - immutable product of compiling one pattern.
 *
 * Owns the RE2 expression, the field layout and the resolved converters.
 * Always held through std::shared_ptr<const CompiledMatcher>; safe to use
 * from any number of threads without locking.
 */
class CompiledMatcher : public std::enable_shared_from_this<CompiledMatcher> {
public:
    /**
     * Run the full pipeline: size checks, tokenizing, type resolution,
     * synthesis and time-bounded RE2 compilation.
     *
     * @param pattern pattern text
     * @param options limits and matching options
     * @param registry registry snapshot used for every type lookup
     * @return compiled matcher
     * @throws PatternSyntaxError, LimitExceededError, CompilationTimeoutError
     */
    static std::shared_ptr<const CompiledMatcher> compile(
        const std::string& pattern,
        const ParserOptions& options,
        const pattern::RegistrySnapshot& registry);

    static std::shared_ptr<const CompiledMatcher> compile(
        const std::string& pattern,
        const ParserOptions& options,
        const pattern::TypeRegistry& registry);

    CompiledMatcher(const CompiledMatcher&) = delete;
    CompiledMatcher& operator=(const CompiledMatcher&) = delete;

    /**
     * The whole input must match.
     *
     * @return values, or std::nullopt when the text does not conform
     * @throws LimitExceededError if the input is too long
     * @throws ConversionError if a field matched but its converter rejected it
     */
    std::optional<MatchResult> parse(std::string_view text) const;

    /**
     * First match of the pattern inside text[pos, endpos).
     *
     * Spans in the result are offsets into the whole text.
     *
     * @return values, or std::nullopt when nothing matches
     * @throws LimitExceededError if the input is too long
     * @throws ConversionError if a field matched but its converter rejected it
     */
    std::optional<MatchResult> search(std::string_view text,
                                      size_t pos = 0,
                                      size_t endpos = std::string_view::npos) const;

    /**
     * Like parse(), but returns the captured text of every field without
     * running any converter.
     *
     * @return raw captures, or std::nullopt when the text does not conform
     * @throws LimitExceededError if the input is too long
     */
    std::optional<RawMatch> parseRaw(std::string_view text) const;

    /**
     * Like search(), without running converters.
     */
    std::optional<RawMatch> searchRaw(std::string_view text,
                                      size_t pos = 0,
                                      size_t endpos = std::string_view::npos) const;

    /**
     * Run the converters over a raw match produced by this matcher.
     *
     * @throws ConversionError if a converter rejects its text
     * @throws std::out_of_range if raw came from a different pattern
     */
    MatchResult evaluate(const RawMatch& raw) const;

    /**
     * Lazy, restartable sequence of non-overlapping matches. After a
     * zero-length match the scan moves forward one code point.
     *
     * @throws LimitExceededError if the input is too long
     */
    MatchRange findAll(std::string_view text) const;

    const std::string& pattern() const { return pattern_; }
    const std::string& expression() const { return source_.expression; }
    const ParserOptions& options() const { return options_; }
    size_t fieldCount() const { return source_.fields.size(); }
    const std::vector<pattern::FieldCapture>& fieldSpecs() const { return source_.fields; }

    /**
     * Names of the named fields, in pattern order.
     */
    std::vector<std::string> namedFields() const;

private:
    CompiledMatcher(std::string pattern,
                    ParserOptions options,
                    pattern::ExpressionSource source,
                    std::unique_ptr<RE2> regex);

    std::optional<RawMatch> match(std::string_view text, size_t pos, size_t endpos,
                                  RE2::Anchor anchor) const;

    RawMatch capture(std::string_view text, const std::vector<re2::StringPiece>& groups) const;

    std::string pattern_;
    ParserOptions options_;
    pattern::ExpressionSource source_;
    std::unique_ptr<RE2> regex_;
};

}  // namespace formatscan

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
#include <gtest/gtest.h>
#include <re2/re2.h>

using namespace formatscan;
using namespace formatscan::pattern;

/**
 * Synthesizer tests: group layout, effective alignment/fill and the
 * resulting RE2 behavior.
 */
class RegexSynthesizerTest : public ::testing::Test {
protected:
    TypeRegistry registry;
    ParserOptions options;

    ExpressionSource synth(const std::string& pattern) {
        SecurityGuard guard(options);
        return synthesize(compilePattern(pattern, registry.snapshot(), guard));
    }

    // Value of the first field when the whole text matches, else nullopt
    std::optional<std::string> fullMatchValue(const std::string& pattern, const std::string& text) {
        ExpressionSource src = synth(pattern);
        RE2 re(src.expression, options.toRE2Options());
        EXPECT_TRUE(re.ok()) << re.error();

        std::vector<re2::StringPiece> groups(src.group_count + 1);
        if (!re.Match(text, 0, text.size(), RE2::ANCHOR_BOTH, groups.data(),
                      static_cast<int>(groups.size()))) {
            return std::nullopt;
        }
        const auto& value = groups[src.fields.at(0).value_group];
        return std::string(valueText(src.fields.at(0), std::string_view(value.data(), value.size())));
    }
};

TEST_F(RegexSynthesizerTest, LiteralsQuoted) {
    ExpressionSource src = synth("a.b*c");

    EXPECT_EQ(src.group_count, 0);
    EXPECT_TRUE(src.fields.empty());

    RE2 re(src.expression);
    EXPECT_TRUE(RE2::FullMatch("a.b*c", re));
    EXPECT_FALSE(RE2::FullMatch("axbbc", re));
}

TEST_F(RegexSynthesizerTest, TwoGroupsPerField) {
    ExpressionSource src = synth("{a} {b:d} {c}");

    ASSERT_EQ(src.fields.size(), 3u);
    EXPECT_EQ(src.group_count, 6);
    for (size_t i = 0; i < src.fields.size(); ++i) {
        EXPECT_EQ(src.fields[i].span_group, static_cast<int>(2 * i + 1));
        EXPECT_EQ(src.fields[i].value_group, static_cast<int>(2 * i + 2));
    }

    RE2 re(src.expression);
    ASSERT_TRUE(re.ok()) << re.error();
    EXPECT_EQ(re.NumberOfCapturingGroups(), src.group_count);
}

TEST_F(RegexSynthesizerTest, EffectiveAlignment) {
    EXPECT_EQ(synth("{}").fields[0].align, Alignment::kNone);
    EXPECT_EQ(synth("{:10}").fields[0].align, Alignment::kLeft);     // String default
    EXPECT_EQ(synth("{:5d}").fields[0].align, Alignment::kRight);    // Numeric default
    EXPECT_EQ(synth("{:05d}").fields[0].align, Alignment::kZeroPad);
    EXPECT_EQ(synth("{:^5}").fields[0].align, Alignment::kCenter);
    EXPECT_EQ(synth("{:<5d}").fields[0].align, Alignment::kLeft);
}

TEST_F(RegexSynthesizerTest, EffectiveFill) {
    EXPECT_EQ(synth("{:>5}").fields[0].fill, " ");
    EXPECT_EQ(synth("{:*>5}").fields[0].fill, "*");
    EXPECT_EQ(synth("{:05d}").fields[0].fill, "0");
}

TEST_F(RegexSynthesizerTest, WidthCountedIntoStringFields) {
    EXPECT_TRUE(synth("{:>7}").fields[0].trim_fill);
    EXPECT_TRUE(synth("{:7}").fields[0].trim_fill);
    EXPECT_FALSE(synth("{:>}").fields[0].trim_fill);
    EXPECT_FALSE(synth("{:>7d}").fields[0].trim_fill);
    EXPECT_FALSE(synth("{:7l}").fields[0].trim_fill);

    ExpressionSource src = synth("{:>7}");
    RE2 re(src.expression);
    ASSERT_TRUE(re.ok()) << re.error();
    EXPECT_EQ(re.NumberOfCapturingGroups(), src.group_count);
}

TEST_F(RegexSynthesizerTest, WidthIsMinimumSpanLength) {
    EXPECT_EQ(fullMatchValue("{:5}", "abcde"), "abcde");
    EXPECT_EQ(fullMatchValue("{:5}", "abcdefgh"), "abcdefgh");
    EXPECT_EQ(fullMatchValue("{:5}", "ab   "), "ab");
    EXPECT_EQ(fullMatchValue("{:5}", "ab  "), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:>5}", "  ab"), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:^5}", " ab "), std::nullopt);
}

TEST_F(RegexSynthesizerTest, WidthWithPrecision) {
    // Precision below width: padding makes up the difference
    EXPECT_EQ(fullMatchValue("{:<5.2}", "ab   "), "ab");
    EXPECT_EQ(fullMatchValue("{:<5.2}", "abc  "), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:>5.2}", "   ab"), "ab");
    EXPECT_EQ(fullMatchValue("{:>5.2}", "  abc"), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:^5.1}", "  a  "), "a");
    EXPECT_EQ(fullMatchValue("{:^5.1}", " ab  "), std::nullopt);

    // Precision above width: the value may overflow the width up to precision
    EXPECT_EQ(fullMatchValue("{:<2.5}", "abcde"), "abcde");
    EXPECT_EQ(fullMatchValue("{:<2.5}", "abcdef"), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:>2.5}", "  abcde"), "abcde");
    EXPECT_EQ(fullMatchValue("{:^3.4}", " abcd "), "abcd");
    EXPECT_EQ(fullMatchValue("{:^3.4}", " abcde "), std::nullopt);
}

TEST_F(RegexSynthesizerTest, WidthWithZeroPrecisionIsAllFill) {
    EXPECT_EQ(fullMatchValue("{:<3.0}", "    "), "");
    EXPECT_EQ(fullMatchValue("{:<3.0}", "  "), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:<3.0}", " a "), std::nullopt);
}

TEST_F(RegexSynthesizerTest, RightAlignedValueExcludesPadding) {
    EXPECT_EQ(fullMatchValue("{:>10}", "     hello"), "hello");
    EXPECT_EQ(fullMatchValue("{:.>4.4}", "...a"), "a");
    EXPECT_EQ(fullMatchValue("{:>4.4}", " aaa "), std::nullopt);
}

TEST_F(RegexSynthesizerTest, LeftAlignedValueExcludesPadding) {
    EXPECT_EQ(fullMatchValue("{:<10}", "hello     "), "hello");
    EXPECT_EQ(fullMatchValue("{:.<4.4}", "a..."), "a");
}

TEST_F(RegexSynthesizerTest, CenterAligned) {
    EXPECT_EQ(fullMatchValue("{:^4.4}", " aaa "), "aaa");
    EXPECT_EQ(fullMatchValue("{:*^9}", "**abc****"), "abc");
}

TEST_F(RegexSynthesizerTest, StringPrecisionIsMaxLength) {
    EXPECT_EQ(fullMatchValue("{:.4}", "abcd"), "abcd");
    EXPECT_EQ(fullMatchValue("{:.4}", "abcde"), std::nullopt);
    EXPECT_EQ(fullMatchValue("{:.2l}", "ab"), "ab");
    EXPECT_EQ(fullMatchValue("{:.2l}", "a1"), std::nullopt);
}

TEST_F(RegexSynthesizerTest, FloatPrecisionLimitsFractionDigits) {
    EXPECT_EQ(fullMatchValue("{:.2f}", "3.14"), "3.14");
    EXPECT_EQ(fullMatchValue("{:.2f}", "3.1"), "3.1");
    EXPECT_EQ(fullMatchValue("{:.2f}", "3.14159"), std::nullopt);
}

TEST_F(RegexSynthesizerTest, IntegerPrecisionIgnored) {
    EXPECT_EQ(fullMatchValue("{:.2d}", "12345"), "12345");
}

TEST_F(RegexSynthesizerTest, ZeroPadKeepsSignInValue) {
    // Fill stripping happens at conversion time
    EXPECT_EQ(fullMatchValue("{:05d}", "-0042"), "-0042");
    EXPECT_EQ(fullMatchValue("{:05d}", "00042"), "00042");
}

TEST_F(RegexSynthesizerTest, SpaceSignAllowsLeadingSpace) {
    EXPECT_EQ(fullMatchValue("{: d}", " 42"), " 42");
    EXPECT_EQ(fullMatchValue("{: d}", "-42"), "-42");
    EXPECT_EQ(fullMatchValue("{:d}", " 42"), std::nullopt);
}

TEST_F(RegexSynthesizerTest, MultiByteFill) {
    EXPECT_EQ(fullMatchValue("{:\xC3\xA9^7}", "\xC3\xA9\xC3\xA9" "abc" "\xC3\xA9\xC3\xA9"), "abc");
}

TEST_F(RegexSynthesizerTest, FillCharactersAreEscaped) {
    // '.' and '*' are regex metacharacters
    EXPECT_EQ(fullMatchValue("{:.>5}", "..abc"), "abc");
    EXPECT_EQ(fullMatchValue("{:.>5}", "xxabc"), "xxabc");
}

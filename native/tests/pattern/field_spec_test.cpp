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

#include "pattern/field_spec.h"
#include "errors.h"
#include <gtest/gtest.h>

using namespace formatscan;
using namespace formatscan::pattern;

/**
 * Format spec grammar: [[fill]align][sign][0][width][.precision][type]
 */
class FieldSpecTest : public ::testing::Test {};

TEST_F(FieldSpecTest, EmptySpec) {
    FieldSpec spec = parseFormatSpec("", 0);

    EXPECT_EQ(spec.align, Alignment::kNone);
    EXPECT_FALSE(spec.fill.has_value());
    EXPECT_FALSE(spec.sign.has_value());
    EXPECT_FALSE(spec.zero_pad);
    EXPECT_FALSE(spec.width.has_value());
    EXPECT_FALSE(spec.precision.has_value());
    EXPECT_EQ(spec.type_code, "");
}

TEST_F(FieldSpecTest, TypeOnly) {
    FieldSpec spec = parseFormatSpec("d", 0);
    EXPECT_EQ(spec.type_code, "d");
    EXPECT_EQ(spec.align, Alignment::kNone);

    EXPECT_EQ(parseFormatSpec("ti", 0).type_code, "ti");
}

TEST_F(FieldSpecTest, AlignAndWidth) {
    FieldSpec spec = parseFormatSpec(">10", 0);

    EXPECT_EQ(spec.align, Alignment::kRight);
    EXPECT_FALSE(spec.fill.has_value());
    ASSERT_TRUE(spec.width.has_value());
    EXPECT_EQ(*spec.width, 10u);
    EXPECT_EQ(spec.type_code, "");
}

TEST_F(FieldSpecTest, FillAlignWidthType) {
    FieldSpec spec = parseFormatSpec("*^8s", 0);

    EXPECT_EQ(spec.align, Alignment::kCenter);
    ASSERT_TRUE(spec.fill.has_value());
    EXPECT_EQ(*spec.fill, "*");
    EXPECT_EQ(*spec.width, 8u);
    EXPECT_EQ(spec.type_code, "s");
}

TEST_F(FieldSpecTest, MultiByteFill) {
    FieldSpec spec = parseFormatSpec("\xC3\xA9<5", 0);   // "é<5"

    EXPECT_EQ(spec.align, Alignment::kLeft);
    EXPECT_EQ(*spec.fill, "\xC3\xA9");
    EXPECT_EQ(*spec.width, 5u);
}

TEST_F(FieldSpecTest, SignZeroWidthPrecision) {
    FieldSpec spec = parseFormatSpec("+08.3f", 0);

    EXPECT_EQ(spec.sign, '+');
    EXPECT_TRUE(spec.zero_pad);
    EXPECT_EQ(*spec.width, 8u);
    EXPECT_EQ(*spec.precision, 3u);
    EXPECT_EQ(spec.type_code, "f");
}

TEST_F(FieldSpecTest, SpaceSign) {
    FieldSpec spec = parseFormatSpec(" d", 0);
    EXPECT_EQ(spec.sign, ' ');
    EXPECT_EQ(spec.type_code, "d");
}

TEST_F(FieldSpecTest, PrecisionWithoutWidth) {
    FieldSpec spec = parseFormatSpec(".4", 0);
    EXPECT_FALSE(spec.width.has_value());
    EXPECT_EQ(*spec.precision, 4u);
    EXPECT_EQ(spec.type_code, "");
}

TEST_F(FieldSpecTest, ZeroFillIsNotZeroFlag) {
    // '0' followed by an align char is a fill, not the zero flag
    FieldSpec spec = parseFormatSpec("0>2.2", 0);
    EXPECT_EQ(*spec.fill, "0");
    EXPECT_EQ(spec.align, Alignment::kRight);
    EXPECT_FALSE(spec.zero_pad);
    EXPECT_EQ(*spec.width, 2u);
    EXPECT_EQ(*spec.precision, 2u);
}

TEST_F(FieldSpecTest, StrftimeType) {
    FieldSpec spec = parseFormatSpec("%Y-%m-%d", 0);
    EXPECT_EQ(spec.type_code, "%Y-%m-%d");

    EXPECT_EQ(parseFormatSpec(".1%", 0).type_code, "%");
}

TEST_F(FieldSpecTest, DotWithoutPrecision) {
    EXPECT_THROW(parseFormatSpec("5.", 0), PatternSyntaxError);
}

TEST_F(FieldSpecTest, LeftoverText) {
    EXPECT_THROW(parseFormatSpec("10.2.3", 0), PatternSyntaxError);
    EXPECT_THROW(parseFormatSpec("5!x", 0), PatternSyntaxError);
    EXPECT_THROW(parseFormatSpec("d-", 0), PatternSyntaxError);
}

TEST_F(FieldSpecTest, ErrorPositionIsAbsolute) {
    try {
        parseFormatSpec("5!x", 10);
        FAIL() << "Expected PatternSyntaxError";
    } catch (const PatternSyntaxError& e) {
        EXPECT_EQ(e.position(), 11u);
    }
}

TEST_F(FieldSpecTest, Key) {
    FieldSpec named;
    named.name = "user";
    EXPECT_EQ(named.key(), "user");
    EXPECT_TRUE(named.isNamed());

    FieldSpec indexed;
    indexed.index = 3;
    EXPECT_EQ(indexed.key(), "3");
    EXPECT_FALSE(indexed.isNamed());
}

TEST_F(FieldSpecTest, FieldNames) {
    EXPECT_TRUE(isValidFieldName("name"));
    EXPECT_TRUE(isValidFieldName("_private"));
    EXPECT_TRUE(isValidFieldName("a.b"));
    EXPECT_TRUE(isValidFieldName("items[0]"));
    EXPECT_TRUE(isValidFieldName("x-y"));

    EXPECT_FALSE(isValidFieldName(""));
    EXPECT_FALSE(isValidFieldName("1abc"));
    EXPECT_FALSE(isValidFieldName("a b"));
    EXPECT_FALSE(isValidFieldName("a:b"));
}

TEST_F(FieldSpecTest, Utf8Helpers) {
    EXPECT_EQ(utf8SequenceLength('a'), 1u);
    EXPECT_EQ(utf8SequenceLength(0xC3), 2u);
    EXPECT_EQ(utf8SequenceLength(0xE2), 3u);
    EXPECT_EQ(utf8SequenceLength(0xF0), 4u);
    EXPECT_EQ(utf8SequenceLength(0x80), 1u);  // Stray continuation byte

    EXPECT_EQ(decodeFirstCodePoint("a"), U'a');
    EXPECT_EQ(decodeFirstCodePoint("\xC3\xA9"), 0xE9u);           // é
    EXPECT_EQ(decodeFirstCodePoint("\xE2\x82\xAC"), 0x20ACu);     // €
}

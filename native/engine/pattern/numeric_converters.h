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
#include <string_view>

namespace formatscan {
namespace pattern {

/**
 * Numeric converters for the built-in number types.
 *
 * Each converter receives the text captured for a field (surrounding
 * whitespace allowed) and throws std::invalid_argument for text it cannot
 * read, or std::out_of_range when the value does not fit.
 */

/**
 * Integer with optional sign and 0x / 0o / 0b prefix (base 10 otherwise).
 */
Value convertInteger(std::string_view text);

/**
 * Integer in a fixed base (2, 8 or 16); the matching prefix is optional.
 */
Value convertIntegerBase(std::string_view text, int base);

/**
 * Integer written with ',' or '.' thousands separators.
 */
Value convertThousands(std::string_view text);

/**
 * Floating point, including exponent notation, nan and inf.
 */
Value convertFloat(std::string_view text);

/**
 * Percentage ("50%" -> 0.5).
 */
Value convertPercent(std::string_view text);

/**
 * General number: int64_t when the text is integral, double otherwise.
 */
Value convertGeneral(std::string_view text);

/**
 * Strip ASCII whitespace from both ends.
 */
std::string_view trimWhitespace(std::string_view text);

}  // namespace pattern
}  // namespace formatscan

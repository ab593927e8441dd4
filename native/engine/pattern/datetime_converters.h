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
#include <string>
#include <string_view>
#include <vector>

namespace formatscan {
namespace pattern {

/**
 * A date/time sub-grammar: the capturing expression that reads one
 * component per group, and the converter built on it.
 *
 * The field sub-pattern is capture_pattern with its groups made
 * non-capturing, so what a field matches is exactly what the converter reads.
 */
struct DateTimeGrammar {
    std::string code;
    std::string capture_pattern;
    Converter converter;
};

/**
 * Fixed-format grammars:
 * - ti  ISO 8601            2011-11-21T10:21:36.5+01:00
 * - te  RFC 2822            Mon, 21 Nov 2011 10:21:36 +1000
 * - tg  global (day first)  21/11/2011 10:21:36 AM +1000
 * - ta  US (month first)    11/21/2011 10:21:36 PM -0500
 * - tc  ctime               Mon Nov 21 10:21:36 2011
 * - th  HTTP log            21/Nov/2011:10:21:36 +1000
 * - tt  time of day         10:21:36 PM -5:30
 * - ts  syslog (this year)  Nov 21 10:21:36
 */
const std::vector<DateTimeGrammar>& builtinDateTimeGrammars();

/**
 * Build the grammar for a strftime-style format such as "%Y-%m-%d".
 *
 * Supported directives: Y y m d H I M S f p z b h B a A w j U W c x X %%.
 * Unknown directives match lazily and are ignored. The converter yields a
 * Date, TimeOfDay or DateTime depending on which components the format has.
 *
 * @param format format string (starts with '%')
 */
DateTimeGrammar strftimeGrammar(std::string_view format);

}  // namespace pattern
}  // namespace formatscan

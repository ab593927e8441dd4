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

#include <string>
#include <string_view>

namespace formatscan {
namespace pattern {

/**
 * Rewrite every capturing group in an RE2 fragment to a non-capturing one.
 *
 * Handles "(...)", "(?P<name>...)" and "(?<name>...)". Escaped parentheses
 * and parentheses inside character classes are left alone.
 *
 * @param fragment RE2 syntax fragment
 * @return equivalent fragment with no capturing groups
 */
std::string rewriteCapturingGroups(std::string_view fragment);

/**
 * RE2 escape for one code point, usable inside and outside classes ("\x{2E}").
 *
 * @param fill UTF-8 text of a single code point
 */
std::string escapeCodePoint(std::string_view fill);

}  // namespace pattern
}  // namespace formatscan

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

#include "pattern/regex_util.h"
#include "pattern/field_spec.h"
#include <cstdio>

namespace formatscan {
namespace pattern {

std::string rewriteCapturingGroups(std::string_view fragment) {
    std::string out;
    out.reserve(fragment.size() + 8);

    bool in_class = false;
    size_t i = 0;
    while (i < fragment.size()) {
        char c = fragment[i];

        if (c == '\\' && i + 1 < fragment.size() && fragment[i + 1] == 'Q') {
            // \Q...\E quotes everything up to \E (or the end)
            size_t close = fragment.find("\\E", i + 2);
            size_t stop = close == std::string_view::npos ? fragment.size() : close + 2;
            out.append(fragment.substr(i, stop - i));
            i = stop;
            continue;
        }

        if (c == '\\') {
            // Escape: copy it and the escaped byte verbatim
            out.push_back(c);
            if (i + 1 < fragment.size()) {
                out.push_back(fragment[i + 1]);
            }
            i += 2;
            continue;
        }

        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
            out.push_back(c);
            ++i;
            continue;
        }

        if (c == '[') {
            in_class = true;
            out.push_back(c);
            ++i;
            // A ']' right after '[' or '[^' is a literal member
            if (i < fragment.size() && fragment[i] == '^') {
                out.push_back('^');
                ++i;
            }
            if (i < fragment.size() && fragment[i] == ']') {
                out.push_back(']');
                ++i;
            }
            continue;
        }

        if (c == '(') {
            std::string_view rest = fragment.substr(i + 1);
            if (rest.empty() || rest.front() != '?') {
                out += "(?:";
                ++i;
                continue;
            }

            bool named = rest.substr(0, 3) == "?P<" ||
                         (rest.substr(0, 2) == "?<" && rest.size() > 2 &&
                          rest[2] != '=' && rest[2] != '!');
            if (named) {
                size_t close = rest.find('>');
                if (close != std::string_view::npos) {
                    out += "(?:";
                    i += 1 + close + 1;
                    continue;
                }
            }
        }

        out.push_back(c);
        ++i;
    }

    return out;
}

std::string escapeCodePoint(std::string_view fill) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "\\x{%X}", static_cast<unsigned>(decodeFirstCodePoint(fill)));
    return buf;
}

}  // namespace pattern
}  // namespace formatscan

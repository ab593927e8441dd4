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
#include <charconv>

namespace formatscan {
namespace pattern {

namespace {

bool isAlignChar(char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
}

Alignment toAlignment(char c) {
    switch (c) {
        case '<': return Alignment::kLeft;
        case '>': return Alignment::kRight;
        case '^': return Alignment::kCenter;
        default:  return Alignment::kZeroPad;
    }
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Reads a run of digits at spec[pos...], advancing pos.
std::optional<size_t> readNumber(std::string_view spec, size_t& pos,
                                 size_t base_position, const char* what) {
    size_t start = pos;
    while (pos < spec.size() && isDigit(spec[pos])) {
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(spec.data() + start, spec.data() + pos, value);
    if (ec != std::errc()) {
        throw PatternSyntaxError(std::string(what) + " is out of range", base_position + start);
    }
    return value;
}

bool isValidTypeCode(std::string_view type) {
    if (type.empty()) {
        return true;
    }
    if (type.front() == '%') {
        return true;  // "%" (percentage) or a strftime-style format
    }
    if (!isAlpha(type.front())) {
        return false;
    }
    for (char c : type) {
        if (!isAlpha(c) && !isDigit(c) && c != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string FieldSpec::key() const {
    if (name) {
        return *name;
    }
    return index ? std::to_string(*index) : std::string();
}

size_t utf8SequenceLength(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

char32_t decodeFirstCodePoint(std::string_view text) {
    auto lead = static_cast<unsigned char>(text[0]);
    size_t len = utf8SequenceLength(lead);
    if (len == 1 || len > text.size()) {
        return lead;
    }

    char32_t cp = lead & (0x7F >> len);
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return cp;
}

size_t codePointCount(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> splitFieldPath(std::string_view name) {
    std::vector<std::string> path;
    std::string current;
    bool in_brackets = false;

    for (char c : name) {
        if (c == '[') {
            if (!current.empty()) {
                path.push_back(std::move(current));
                current.clear();
            }
            in_brackets = true;
        } else if (c == ']' && in_brackets) {
            path.push_back(std::move(current));
            current.clear();
            in_brackets = false;
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        path.push_back(std::move(current));
    }
    return path;
}

bool isValidFieldName(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    if (!isAlpha(text.front()) && text.front() != '_') {
        return false;
    }
    for (char c : text.substr(1)) {
        if (!isAlpha(c) && !isDigit(c) && c != '_' && c != '.' &&
            c != '[' && c != ']' && c != '-') {
            return false;
        }
    }
    return true;
}

FieldSpec parseFormatSpec(std::string_view spec, size_t position) {
    FieldSpec out;
    size_t pos = 0;

    if (spec.empty()) {
        return out;
    }

    // [[fill]align]
    size_t fill_len = utf8SequenceLength(static_cast<unsigned char>(spec[0]));
    if (fill_len < spec.size() && isAlignChar(spec[fill_len])) {
        out.fill = std::string(spec.substr(0, fill_len));
        out.align = toAlignment(spec[fill_len]);
        pos = fill_len + 1;
    } else if (isAlignChar(spec[0])) {
        out.align = toAlignment(spec[0]);
        pos = 1;
    }

    // [sign]
    if (pos < spec.size() && (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' ')) {
        out.sign = spec[pos];
        ++pos;
    }

    // [0]
    if (pos < spec.size() && spec[pos] == '0') {
        out.zero_pad = true;
        ++pos;
    }

    // [width]
    out.width = readNumber(spec, pos, position, "width");

    // [.precision]
    if (pos < spec.size() && spec[pos] == '.') {
        ++pos;
        out.precision = readNumber(spec, pos, position, "precision");
        if (!out.precision) {
            throw PatternSyntaxError("'.' must be followed by a precision", position + pos);
        }
    }

    // [type]
    std::string_view type = spec.substr(pos);
    if (!isValidTypeCode(type)) {
        throw PatternSyntaxError("invalid format specifier '" + std::string(spec) + "'",
                                 position + pos);
    }
    out.type_code = std::string(type);

    return out;
}

}  // namespace pattern
}  // namespace formatscan

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

#include "pattern/numeric_converters.h"
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace formatscan {
namespace pattern {

namespace {

struct SignedText {
    bool negative = false;
    std::string_view digits;
};

SignedText splitSign(std::string_view text) {
    SignedText out;
    text = trimWhitespace(text);
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        out.negative = text.front() == '-';
        text.remove_prefix(1);
    }
    out.digits = text;
    return out;
}

int prefixBase(std::string_view digits) {
    if (digits.size() < 3 || digits[0] != '0') {
        return 0;
    }
    switch (digits[1]) {
        case 'x': case 'X': return 16;
        case 'o': case 'O': return 8;
        case 'b': case 'B': return 2;
        default: return 0;
    }
}

uint64_t parseMagnitude(std::string_view digits, int base) {
    if (digits.empty()) {
        throw std::invalid_argument("no digits");
    }

    uint64_t value = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value, base);
    if (ec == std::errc::result_out_of_range) {
        throw std::out_of_range("integer does not fit in 64 bits");
    }
    if (ec != std::errc() || ptr != end) {
        throw std::invalid_argument("not a base-" + std::to_string(base) + " integer");
    }
    return value;
}

int64_t applySign(uint64_t magnitude, bool negative) {
    constexpr uint64_t kMaxPositive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

    if (negative) {
        if (magnitude > kMaxPositive + 1) {
            throw std::out_of_range("integer does not fit in 64 bits");
        }
        if (magnitude == kMaxPositive + 1) {
            return std::numeric_limits<int64_t>::min();
        }
        return -static_cast<int64_t>(magnitude);
    }

    if (magnitude > kMaxPositive) {
        throw std::out_of_range("integer does not fit in 64 bits");
    }
    return static_cast<int64_t>(magnitude);
}

double parseDouble(std::string_view text) {
    text = trimWhitespace(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        throw std::invalid_argument("no digits");
    }

    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec == std::errc::result_out_of_range) {
        throw std::out_of_range("float out of range");
    }
    if (ec != std::errc() || ptr != end) {
        throw std::invalid_argument("not a number");
    }
    return value;
}

}  // namespace

std::string_view trimWhitespace(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    size_t first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(kSpace);
    return text.substr(first, last - first + 1);
}

Value convertInteger(std::string_view text) {
    SignedText st = splitSign(text);
    int base = prefixBase(st.digits);
    if (base != 0) {
        st.digits.remove_prefix(2);
    } else {
        base = 10;
    }
    return applySign(parseMagnitude(st.digits, base), st.negative);
}

Value convertIntegerBase(std::string_view text, int base) {
    SignedText st = splitSign(text);
    int prefixed = prefixBase(st.digits);
    if (prefixed == base) {
        st.digits.remove_prefix(2);
    }
    return applySign(parseMagnitude(st.digits, base), st.negative);
}

Value convertThousands(std::string_view text) {
    SignedText st = splitSign(text);
    std::string digits;
    digits.reserve(st.digits.size());
    for (char c : st.digits) {
        if (c != ',' && c != '.') {
            digits.push_back(c);
        }
    }
    return applySign(parseMagnitude(digits, 10), st.negative);
}

Value convertFloat(std::string_view text) {
    return parseDouble(text);
}

Value convertPercent(std::string_view text) {
    text = trimWhitespace(text);
    if (!text.empty() && text.back() == '%') {
        text.remove_suffix(1);
    }
    return parseDouble(text) / 100.0;
}

Value convertGeneral(std::string_view text) {
    SignedText st = splitSign(text);
    bool integral = !st.digits.empty();
    for (char c : st.digits) {
        if (c < '0' || c > '9') {
            integral = false;
            break;
        }
    }
    if (integral) {
        return applySign(parseMagnitude(st.digits, 10), st.negative);
    }
    return parseDouble(text);
}

}  // namespace pattern
}  // namespace formatscan

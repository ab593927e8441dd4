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

#include "pattern/value.h"
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace formatscan {
namespace pattern {

namespace {

void writeDate(std::ostringstream& out, const Date& d) {
    out << std::setfill('0') << std::setw(4) << d.year << '-'
        << std::setw(2) << d.month << '-'
        << std::setw(2) << d.day;
}

void writeTime(std::ostringstream& out, const TimeOfDay& t) {
    out << std::setfill('0') << std::setw(2) << t.hour << ':'
        << std::setw(2) << t.minute << ':'
        << std::setw(2) << t.second;
    if (t.microsecond != 0) {
        out << '.' << std::setw(6) << t.microsecond;
    }
    if (t.utc_offset_minutes) {
        int offset = *t.utc_offset_minutes;
        out << (offset < 0 ? '-' : '+');
        offset = std::abs(offset);
        out << std::setw(2) << offset / 60 << ':' << std::setw(2) << offset % 60;
    }
}

}  // namespace

std::string toString(const Value& value) {
    std::ostringstream out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            out << v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out << v;
        } else if constexpr (std::is_same_v<T, double>) {
            out << std::setprecision(17) << v;
        } else if constexpr (std::is_same_v<T, Date>) {
            writeDate(out, v);
        } else if constexpr (std::is_same_v<T, TimeOfDay>) {
            writeTime(out, v);
        } else {
            writeDate(out, v.date);
            out << 'T';
            writeTime(out, v.time);
        }
    }, value);
    return out.str();
}

const char* valueTypeName(const Value& value) {
    switch (value.index()) {
        case 0: return "string";
        case 1: return "int";
        case 2: return "float";
        case 3: return "date";
        case 4: return "time";
        default: return "datetime";
    }
}

}  // namespace pattern
}  // namespace formatscan

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

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace formatscan {
namespace pattern {

struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const Date& other) const = default;
};

struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;
    std::optional<int> utc_offset_minutes;  // Set when the text carried a zone

    bool operator==(const TimeOfDay& other) const = default;
};

struct DateTime {
    Date date;
    TimeOfDay time;

    bool operator==(const DateTime& other) const = default;
};

/**
 * Typed value produced by a field converter.
 */
using Value = std::variant<std::string, int64_t, double, Date, TimeOfDay, DateTime>;

/**
 * Turns the text captured for a field into a Value.
 *
 * Throws (any std::exception) to reject the text; the matcher reports the
 * rejection as a ConversionError naming the field.
 */
using Converter = std::function<Value(std::string_view)>;

/**
 * Render a value as text (ISO 8601 for date/time values).
 */
std::string toString(const Value& value);

/**
 * Name of the held alternative: "string", "int", "float", "date", "time", "datetime".
 */
const char* valueTypeName(const Value& value);

}  // namespace pattern
}  // namespace formatscan

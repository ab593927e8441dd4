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

#include "pattern/datetime_converters.h"
#include <re2/re2.h>
#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>
#include <memory>
#include <optional>
#include <stdexcept>

namespace formatscan {
namespace pattern {

namespace {

const char* const kMonthNames[12] = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

const std::string kMonthAlternation =
    "(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)";
const std::string kWeekdayAlternation =
    "(?:Mon|Tue|Wed|Thu|Fri|Sat|Sun)";

using Groups = std::vector<std::string_view>;

std::shared_ptr<const RE2> compileCapture(const std::string& capture_pattern) {
    RE2::Options opts;
    opts.set_log_errors(false);
    opts.set_case_sensitive(false);

    auto re = std::make_shared<const RE2>(capture_pattern, opts);
    if (!re->ok()) {
        throw std::invalid_argument("date/time grammar does not compile: " + re->error());
    }
    return re;
}

Groups captureGroups(const RE2& re, std::string_view text) {
    int n = re.NumberOfCapturingGroups() + 1;
    std::vector<re2::StringPiece> sub(n);
    if (!re.Match(text, 0, text.size(), RE2::ANCHOR_BOTH, sub.data(), n)) {
        throw std::invalid_argument("text does not match the date/time format");
    }

    Groups out;
    out.reserve(n);
    for (const auto& piece : sub) {
        out.emplace_back(piece.data() ? std::string_view(piece.data(), piece.size())
                                      : std::string_view());
    }
    return out;
}

int toInt(std::string_view digits) {
    int value = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (digits.empty() || ec != std::errc() || ptr != end) {
        throw std::invalid_argument("bad number '" + std::string(digits) + "'");
    }
    return value;
}

int monthFromName(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (int i = 0; i < 12; ++i) {
        std::string_view full = kMonthNames[i];
        if (lower == full || (lower.size() == 3 && full.substr(0, 3) == lower)) {
            return i + 1;
        }
    }
    throw std::invalid_argument("unknown month name '" + std::string(name) + "'");
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

Date makeDate(int year, int month, int day) {
    if (year < 1 || year > 9999) {
        throw std::invalid_argument("year out of range");
    }
    if (month < 1 || month > 12) {
        throw std::invalid_argument("month out of range");
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        throw std::invalid_argument("day out of range for month");
    }
    return Date{year, month, day};
}

int applyMeridiem(int hour, std::string_view meridiem) {
    if (meridiem.empty()) {
        return hour;
    }
    if (hour < 1 || hour > 12) {
        throw std::invalid_argument("hour out of range for AM/PM");
    }
    bool pm = std::tolower(static_cast<unsigned char>(meridiem.front())) == 'p';
    if (hour == 12) {
        return pm ? 12 : 0;
    }
    return pm ? hour + 12 : hour;
}

// Fractional seconds: first six digits, right-padded to microseconds.
int parseFraction(std::string_view digits) {
    if (digits.empty()) {
        return 0;
    }
    std::string micro(digits.substr(0, 6));
    micro.resize(6, '0');
    return toInt(micro);
}

std::optional<int> parseOffset(std::string_view sign, std::string_view hours,
                               std::string_view minutes) {
    if (sign.empty()) {
        return std::nullopt;
    }
    int h = toInt(hours);
    int m = toInt(minutes);
    if (h > 23 || m > 59) {
        throw std::invalid_argument("UTC offset out of range");
    }
    int total = h * 60 + m;
    return sign.front() == '-' ? -total : total;
}

TimeOfDay makeTime(int hour, int minute, int second, int microsecond,
                   std::optional<int> offset) {
    if (hour < 0 || hour > 23) {
        throw std::invalid_argument("hour out of range");
    }
    if (minute < 0 || minute > 59) {
        throw std::invalid_argument("minute out of range");
    }
    if (second < 0 || second > 59) {
        throw std::invalid_argument("second out of range");
    }
    return TimeOfDay{hour, minute, second, microsecond, offset};
}

int optionalInt(std::string_view digits) {
    return digits.empty() ? 0 : toInt(digits);
}

int currentYear() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    gmtime_r(&now, &tm);
    return tm.tm_year + 1900;
}

DateTimeGrammar makeGrammar(std::string code, std::string capture_pattern,
                            Value (*read)(const Groups&)) {
    auto re = compileCapture(capture_pattern);
    Converter converter = [re, read](std::string_view text) -> Value {
        return read(captureGroups(*re, text));
    };
    return DateTimeGrammar{std::move(code), std::move(capture_pattern), std::move(converter)};
}

//============================================================================
// Fixed-format readers (group numbers follow each capture pattern)
//============================================================================

Value readIso8601(const Groups& g) {
    Date date = makeDate(toInt(g[1]), toInt(g[2]), toInt(g[3]));
    if (g[4].empty()) {
        return date;
    }
    std::optional<int> offset = g[8].empty() ? parseOffset(g[9], g[10], g[11]) : std::optional<int>(0);
    return DateTime{date, makeTime(toInt(g[4]), toInt(g[5]), optionalInt(g[6]),
                                   parseFraction(g[7]), offset)};
}

Value readRfc2822(const Groups& g) {
    Date date = makeDate(toInt(g[3]), monthFromName(g[2]), toInt(g[1]));
    return DateTime{date, makeTime(toInt(g[4]), toInt(g[5]), toInt(g[6]), 0,
                                   parseOffset(g[7], g[8], g[9]))};
}

Value readNumericDate(const Groups& g, bool day_first) {
    int first = toInt(g[1]);
    int second = toInt(g[2]);
    Date date = day_first ? makeDate(toInt(g[3]), second, first)
                          : makeDate(toInt(g[3]), first, second);
    if (g[4].empty()) {
        return date;
    }
    int hour = applyMeridiem(toInt(g[4]), g[7]);
    return DateTime{date, makeTime(hour, toInt(g[5]), optionalInt(g[6]), 0,
                                   parseOffset(g[8], g[9], g[10]))};
}

Value readGlobal(const Groups& g) {
    return readNumericDate(g, true);
}

Value readUS(const Groups& g) {
    return readNumericDate(g, false);
}

Value readCtime(const Groups& g) {
    Date date = makeDate(toInt(g[6]), monthFromName(g[1]), toInt(g[2]));
    return DateTime{date, makeTime(toInt(g[3]), toInt(g[4]), toInt(g[5]), 0, std::nullopt)};
}

Value readHttpLog(const Groups& g) {
    Date date = makeDate(toInt(g[3]), monthFromName(g[2]), toInt(g[1]));
    return DateTime{date, makeTime(toInt(g[4]), toInt(g[5]), toInt(g[6]), 0,
                                   parseOffset(g[7], g[8], g[9]))};
}

Value readTimeOfDay(const Groups& g) {
    int hour = applyMeridiem(toInt(g[1]), g[4]);
    return makeTime(hour, toInt(g[2]), optionalInt(g[3]), 0, parseOffset(g[5], g[6], g[7]));
}

Value readSyslog(const Groups& g) {
    Date date = makeDate(currentYear(), monthFromName(g[1]), toInt(g[2]));
    return DateTime{date, makeTime(toInt(g[3]), toInt(g[4]), toInt(g[5]), 0, std::nullopt)};
}

std::vector<DateTimeGrammar> buildFixedGrammars() {
    const std::string numeric_date =
        R"((\d{1,2})[-/](\d{1,2})[-/](\d{4}))"
        R"((?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?(?:\s+([AP]M))?(?:\s+([+-])(\d{2}):?(\d{2}))?)?)";

    std::vector<DateTimeGrammar> grammars;
    grammars.push_back(makeGrammar("ti",
        R"((\d{4})-(\d{2})-(\d{2}))"
        R"((?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d+))?)?)?)"
        R"((?:\s*([Zz])|\s*([+-])(\d{2}):?(\d{2}))?)",
        readIso8601));
    grammars.push_back(makeGrammar("te",
        "(?:" + kWeekdayAlternation + R"(,\s+)?(\d{1,2})\s+)" + kMonthAlternation +
        R"(\s+(\d{4})\s+(\d{2}):(\d{2}):(\d{2})\s+([+-])(\d{2}):?(\d{2}))",
        readRfc2822));
    grammars.push_back(makeGrammar("tg", numeric_date, readGlobal));
    grammars.push_back(makeGrammar("ta", numeric_date, readUS));
    grammars.push_back(makeGrammar("tc",
        kWeekdayAlternation + R"(\s+)" + kMonthAlternation +
        R"(\s+(\d{1,2})\s+(\d{2}):(\d{2}):(\d{2})\s+(\d{4}))",
        readCtime));
    grammars.push_back(makeGrammar("th",
        R"((\d{2})/([A-Za-z]{3})/(\d{4}):(\d{2}):(\d{2}):(\d{2})\s+([+-])(\d{2}):?(\d{2}))",
        readHttpLog));
    grammars.push_back(makeGrammar("tt",
        R"((\d{1,2}):(\d{2})(?::(\d{2}))?(?:\s+([AP]M))?(?:\s+([+-])(\d{1,2}):?(\d{2}))?)",
        readTimeOfDay));
    grammars.push_back(makeGrammar("ts",
        kMonthAlternation + R"(\s+(\d{1,2})\s+(\d{2}):(\d{2}):(\d{2}))",
        readSyslog));
    return grammars;
}

//============================================================================
// strftime-style formats
//============================================================================

enum class Part {
    kYear4, kYear2, kMonth, kMonthName, kDay,
    kHour24, kHour12, kMinute, kSecond, kFraction, kMeridiem, kZone
};

struct Directive {
    const char* expression;
    std::optional<Part> part;   // Unset: matched but not read
};

Directive directiveFor(char c) {
    switch (c) {
        case 'Y': return {R"((\d{4}))", Part::kYear4};
        case 'y': return {R"((\d{2}))", Part::kYear2};
        case 'm': return {R"((\d{1,2}))", Part::kMonth};
        case 'd': return {R"((\d{1,2}))", Part::kDay};
        case 'H': return {R"((\d{1,2}))", Part::kHour24};
        case 'I': return {R"((\d{1,2}))", Part::kHour12};
        case 'M': return {R"((\d{2}))", Part::kMinute};
        case 'S': return {R"((\d{2}))", Part::kSecond};
        case 'f': return {R"((\d{1,6}))", Part::kFraction};
        case 'p': return {R"(([AP]M))", Part::kMeridiem};
        case 'z': return {R"((Z|[+-]\d{2}:?\d{2}))", Part::kZone};
        case 'b':
        case 'h': return {R"(([A-Za-z]{3}))", Part::kMonthName};
        case 'B': return {R"(([A-Za-z]+))", Part::kMonthName};
        case 'a': return {R"([A-Za-z]{3})", std::nullopt};
        case 'A': return {R"([A-Za-z]+)", std::nullopt};
        case 'w': return {R"(\d)", std::nullopt};
        case 'j': return {R"(\d{3})", std::nullopt};
        case 'U':
        case 'W': return {R"(\d{2})", std::nullopt};
        case 'c':
        case 'x':
        case 'X': return {".+", std::nullopt};
        case '%': return {"%", std::nullopt};
        default:  return {".+?", std::nullopt};
    }
}

Value readStrftime(const std::vector<Part>& parts, const Groups& g) {
    int year = 1900, month = 1, day = 1;
    int hour = 0, minute = 0, second = 0, micro = 0;
    std::string_view meridiem;
    std::optional<int> offset;
    bool has_date = false;
    bool has_time = false;

    for (size_t i = 0; i < parts.size(); ++i) {
        std::string_view text = g[i + 1];
        switch (parts[i]) {
            case Part::kYear4:
                year = toInt(text);
                has_date = true;
                break;
            case Part::kYear2: {
                int yy = toInt(text);
                year = yy < 69 ? 2000 + yy : 1900 + yy;
                has_date = true;
                break;
            }
            case Part::kMonth:
                month = toInt(text);
                has_date = true;
                break;
            case Part::kMonthName:
                month = monthFromName(text);
                has_date = true;
                break;
            case Part::kDay:
                day = toInt(text);
                has_date = true;
                break;
            case Part::kHour24:
            case Part::kHour12:
                hour = toInt(text);
                has_time = true;
                break;
            case Part::kMinute:
                minute = toInt(text);
                has_time = true;
                break;
            case Part::kSecond:
                second = toInt(text);
                has_time = true;
                break;
            case Part::kFraction:
                micro = parseFraction(text);
                has_time = true;
                break;
            case Part::kMeridiem:
                meridiem = text;
                has_time = true;
                break;
            case Part::kZone:
                if (text == "Z" || text == "z") {
                    offset = 0;
                } else {
                    offset = parseOffset(text.substr(0, 1), text.substr(1, 2),
                                         text.substr(text.size() - 2));
                }
                has_time = true;
                break;
        }
    }

    hour = applyMeridiem(hour, meridiem);
    Date date = makeDate(year, month, day);
    TimeOfDay time = makeTime(hour, minute, second, micro, offset);

    if (has_date && has_time) {
        return DateTime{date, time};
    }
    if (has_time) {
        return time;
    }
    return date;
}

}  // namespace

const std::vector<DateTimeGrammar>& builtinDateTimeGrammars() {
    static const std::vector<DateTimeGrammar> grammars = buildFixedGrammars();
    return grammars;
}

DateTimeGrammar strftimeGrammar(std::string_view format) {
    std::string capture_pattern;
    std::vector<Part> parts;
    std::string literal;

    auto flushLiteral = [&]() {
        if (!literal.empty()) {
            capture_pattern += RE2::QuoteMeta(literal);
            literal.clear();
        }
    };

    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%' || i + 1 == format.size()) {
            literal.push_back(format[i]);
            continue;
        }

        flushLiteral();
        Directive d = directiveFor(format[++i]);
        capture_pattern += d.expression;
        if (d.part) {
            parts.push_back(*d.part);
        }
    }
    flushLiteral();

    auto re = compileCapture(capture_pattern);
    Converter converter = [re, parts](std::string_view text) -> Value {
        return readStrftime(parts, captureGroups(*re, text));
    };
    return DateTimeGrammar{std::string(format), std::move(capture_pattern), std::move(converter)};
}

}  // namespace pattern
}  // namespace formatscan

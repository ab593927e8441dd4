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

#include "pattern/type_registry.h"
#include "errors.h"
#include "pattern/datetime_converters.h"
#include "pattern/numeric_converters.h"
#include "pattern/regex_util.h"
#include <re2/re2.h>
#include <stdexcept>

namespace formatscan {
namespace pattern {

namespace {

std::atomic<uint64_t> g_next_registry_id{1};

std::shared_ptr<const TypeEntry> makeString(const std::string& code,
                                            const std::string& sub_pattern,
                                            const std::string& char_class) {
    auto entry = std::make_shared<TypeEntry>();
    entry->code = code;
    entry->sub_pattern = sub_pattern;
    entry->precision_mode = PrecisionMode::kMaxLength;
    entry->default_align = Alignment::kLeft;
    entry->char_class = char_class;
    return entry;
}

std::shared_ptr<const TypeEntry> makeInteger(const std::string& code,
                                             const std::string& sub_pattern,
                                             Converter converter) {
    auto entry = std::make_shared<TypeEntry>();
    entry->code = code;
    entry->sub_pattern = sub_pattern;
    entry->converter = std::move(converter);
    entry->precision_mode = PrecisionMode::kIgnored;
    entry->numeric = true;
    return entry;
}

std::shared_ptr<const TypeEntry> makeFractional(const std::string& code,
                                                const std::string& sub_pattern,
                                                Converter converter,
                                                std::function<std::string(size_t)> precise) {
    auto entry = std::make_shared<TypeEntry>();
    entry->code = code;
    entry->sub_pattern = sub_pattern;
    entry->converter = std::move(converter);
    entry->precision_mode = PrecisionMode::kFractional;
    entry->numeric = true;
    entry->precise_pattern = std::move(precise);
    return entry;
}

std::shared_ptr<const TypeEntry> makeDateTime(const DateTimeGrammar& grammar) {
    auto entry = std::make_shared<TypeEntry>();
    entry->code = grammar.code;
    entry->sub_pattern = rewriteCapturingGroups(grammar.capture_pattern);
    entry->converter = grammar.converter;
    entry->precision_mode = PrecisionMode::kIgnored;
    return entry;
}

std::string fractionDigits(size_t precision) {
    return R"(\d*\.\d{1,)" + std::to_string(precision) + "}";
}

std::string preciseFloat(size_t precision) {
    if (precision == 0) {
        return R"([+-]?\d+\.?)";
    }
    return "[+-]?" + fractionDigits(precision);
}

std::string preciseScientific(size_t precision) {
    if (precision == 0) {
        return R"([+-]?\d+\.?[eE][-+]?\d+)";
    }
    return "[+-]?" + fractionDigits(precision) + R"([eE][-+]?\d+)";
}

std::string preciseGeneral(size_t precision) {
    if (precision == 0) {
        return R"([+-]?\d+\.?(?:[eE][-+]?\d+)?)";
    }
    return "[+-]?(?:" + fractionDigits(precision) + R"(|\d+)(?:[eE][-+]?\d+)?)";
}

std::string precisePercent(size_t precision) {
    if (precision == 0) {
        return R"([+-]?\d+%)";
    }
    return "[+-]?" + fractionDigits(precision) + "%";
}

bool isValidTypeId(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    if (!alpha(id.front())) {
        return false;
    }
    for (char c : id) {
        if (!alpha(c) && !(c >= '0' && c <= '9') && c != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace

//============================================================================
// Built-in types
//============================================================================

std::shared_ptr<const TypeTable> builtinTypeTable() {
    static const std::shared_ptr<const TypeTable> table = [] {
        auto t = std::make_shared<TypeTable>();

        const std::string kInteger = R"([+-]?(?:0[xX][0-9a-fA-F]+|0[oO][0-7]+|0[bB][01]+|\d+))";
        const std::string kFloat = R"([+-]?(?:\d+\.\d+|\.\d+|\d+\.)(?:[eE][+-]?\d+)?)";
        const std::string kScientific = R"([+-]?\d*\.?\d+[eE][-+]?\d+|nan|NAN|[-+]?inf|[-+]?INF)";
        const std::string kGeneral = R"([+-]?(?:\d+\.\d+|\.\d+|\d+\.|\d+)(?:[eE][+-]?\d+)?)";

        // Strings
        (*t)[""] = makeString("", ".+?", ".");
        (*t)["s"] = makeString("s", ".+?", ".");
        (*t)["l"] = makeString("l", "[a-zA-Z]+", "[a-zA-Z]");
        (*t)["w"] = makeString("w", R"(\w+)", R"(\w)");
        (*t)["W"] = makeString("W", "[^a-zA-Z]+", "[^a-zA-Z]");
        (*t)["S"] = makeString("S", R"(\S+)", R"(\S)");
        (*t)["D"] = makeString("D", "[^0-9]+", "[^0-9]");

        // Integers
        (*t)["d"] = makeInteger("d", kInteger, convertInteger);
        (*t)["i"] = makeInteger("i", kInteger, convertInteger);
        (*t)["b"] = makeInteger("b", "[+-]?(?:0[bB])?[01]+",
                                [](std::string_view s) { return convertIntegerBase(s, 2); });
        (*t)["o"] = makeInteger("o", "[+-]?(?:0[oO])?[0-7]+",
                                [](std::string_view s) { return convertIntegerBase(s, 8); });
        for (const char* code : {"x", "X"}) {
            (*t)[code] = makeInteger(code, "[+-]?(?:0[xX])?[0-9a-fA-F]+",
                                     [](std::string_view s) { return convertIntegerBase(s, 16); });
        }
        (*t)["n"] = makeInteger("n", R"([+-]?(?:\d{1,3}(?:[.,]\d{3})+|\d+))", convertThousands);

        // Floating point
        for (const char* code : {"f", "F"}) {
            (*t)[code] = makeFractional(code, kFloat, convertFloat, preciseFloat);
        }
        for (const char* code : {"e", "E"}) {
            (*t)[code] = makeFractional(code, kScientific, convertFloat, preciseScientific);
        }
        for (const char* code : {"g", "G"}) {
            (*t)[code] = makeFractional(code, kGeneral, convertGeneral, preciseGeneral);
        }
        (*t)["%"] = makeFractional("%", R"([+-]?(?:\d+\.\d+|\.\d+|\d+)%)", convertPercent,
                                   precisePercent);

        // Date/time
        for (const auto& grammar : builtinDateTimeGrammars()) {
            (*t)[grammar.code] = makeDateTime(grammar);
        }

        return std::shared_ptr<const TypeTable>(std::move(t));
    }();
    return table;
}

//============================================================================
// RegistrySnapshot
//============================================================================

std::shared_ptr<const TypeEntry> RegistrySnapshot::lookup(std::string_view code) const {
    auto it = table_->find(std::string(code));
    if (it != table_->end()) {
        return it->second;
    }

    if (code.size() > 1 && code.front() == '%') {
        try {
            return makeDateTime(strftimeGrammar(code));
        } catch (const std::invalid_argument& e) {
            throw PatternSyntaxError("invalid date/time format '" + std::string(code) + "': " + e.what());
        }
    }

    return nullptr;
}

//============================================================================
// TypeRegistry
//============================================================================

TypeRegistry::TypeRegistry()
    : id_(g_next_registry_id.fetch_add(1)),
      table_(builtinTypeTable()) {}

std::shared_ptr<const TypeEntry> TypeRegistry::lookup(std::string_view code) const {
    return snapshot().lookup(code);
}

RegistrySnapshot TypeRegistry::snapshot() const {
    std::shared_lock lock(table_mutex_);
    return RegistrySnapshot(table_, id_, generation_.load(std::memory_order_acquire));
}

void TypeRegistry::registerCustom(const std::string& id,
                                  const std::string& sub_pattern,
                                  Converter converter) {
    if (!isValidTypeId(id)) {
        throw InvalidSubPatternError(id, "type id must match [A-Za-z][A-Za-z0-9_]*");
    }
    if (sub_pattern.empty()) {
        throw InvalidSubPatternError(id, "sub-pattern must not be empty");
    }
    if (!converter) {
        throw InvalidSubPatternError(id, "converter must not be empty");
    }

    RE2::Options opts;
    opts.set_log_errors(false);

    // Must compile standalone
    RE2 original(sub_pattern, opts);
    if (!original.ok()) {
        throw InvalidSubPatternError(id, original.error());
    }

    // Rewritten form must still compile and capture nothing
    std::string rewritten = rewriteCapturingGroups(sub_pattern);
    RE2 check(rewritten, opts);
    if (!check.ok()) {
        throw InvalidSubPatternError(id, check.error());
    }
    if (check.NumberOfCapturingGroups() != 0) {
        throw InvalidSubPatternError(id, "capturing groups could not be removed");
    }

    auto entry = std::make_shared<TypeEntry>();
    entry->code = id;
    entry->sub_pattern = std::move(rewritten);
    entry->converter = std::move(converter);
    entry->precision_mode = PrecisionMode::kIgnored;
    entry->custom = true;

    std::lock_guard<std::mutex> write_lock(write_mutex_);

    auto next = std::make_shared<TypeTable>(*table_);
    (*next)[id] = std::move(entry);

    std::unique_lock lock(table_mutex_);
    table_ = std::move(next);
    generation_.fetch_add(1, std::memory_order_acq_rel);
}

}  // namespace pattern
}  // namespace formatscan

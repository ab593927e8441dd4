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

#include "pattern/pattern_compiler.h"
#include "errors.h"
#include <charconv>
#include <set>

namespace formatscan {
namespace pattern {

namespace {

bool allDigits(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

/**
 * Per-pattern scanning state.
 */
class Scanner {
public:
    Scanner(std::string_view text, const RegistrySnapshot& registry, const SecurityGuard& guard)
        : text_(text), registry_(registry), guard_(guard) {}

    PatternAST run() {
        std::string literal;
        size_t pos = 0;

        while (pos < text_.size()) {
            char c = text_[pos];

            if (c == '{') {
                if (pos + 1 < text_.size() && text_[pos + 1] == '{') {
                    literal.push_back('{');
                    pos += 2;
                    continue;
                }
                flushLiteral(literal);
                pos = readField(pos);
                continue;
            }

            if (c == '}') {
                if (pos + 1 < text_.size() && text_[pos + 1] == '}') {
                    literal.push_back('}');
                    pos += 2;
                    continue;
                }
                throw PatternSyntaxError("single '}' encountered; use '}}' for a literal brace", pos);
            }

            literal.push_back(c);
            ++pos;
        }

        flushLiteral(literal);
        return std::move(ast_);
    }

private:
    std::string_view text_;
    const RegistrySnapshot& registry_;
    const SecurityGuard& guard_;

    PatternAST ast_;
    size_t next_auto_index_ = 0;
    std::set<std::string> names_;
    std::set<size_t> indices_;

    void flushLiteral(std::string& literal) {
        if (!literal.empty()) {
            ast_.segments.emplace_back(LiteralSegment{std::move(literal)});
            literal.clear();
        }
    }

    // Reads the field opening at `open`; returns the position after its '}'.
    size_t readField(size_t open) {
        size_t close = open + 1;
        while (close < text_.size() && text_[close] != '}') {
            if (text_[close] == '{') {
                throw PatternSyntaxError("nested '{' inside a field", close);
            }
            ++close;
        }
        if (close >= text_.size()) {
            throw PatternSyntaxError("unterminated field; missing '}'", open);
        }

        ++ast_.field_count;
        guard_.checkFieldCount(ast_.field_count);

        std::string_view interior = text_.substr(open + 1, close - open - 1);
        size_t colon = interior.find(':');
        std::string_view ident = interior.substr(0, colon);
        std::string_view spec_text = colon == std::string_view::npos
                                         ? std::string_view()
                                         : interior.substr(colon + 1);

        FieldSpec spec = spec_text.empty() ? FieldSpec()
                                           : parseFormatSpec(spec_text, open + 1 + colon + 1);
        spec.position = open;
        assignIdentity(spec, ident, open);
        resolveType(spec, open);

        return close + 1;
    }

    void assignIdentity(FieldSpec& spec, std::string_view ident, size_t open) {
        if (ident.find('!') != std::string_view::npos) {
            throw PatternSyntaxError("conversion flags ('!') are not supported", open);
        }

        if (ident.empty()) {
            // Skip indices already taken explicitly
            while (indices_.count(next_auto_index_) != 0) {
                ++next_auto_index_;
            }
            spec.index = next_auto_index_++;
            indices_.insert(*spec.index);
            return;
        }

        guard_.checkFieldName(codePointCount(ident));

        if (allDigits(ident)) {
            size_t index = 0;
            auto [ptr, ec] = std::from_chars(ident.data(), ident.data() + ident.size(), index);
            if (ec != std::errc()) {
                throw PatternSyntaxError("field index is out of range", open + 1);
            }
            if (!indices_.insert(index).second) {
                throw PatternSyntaxError("duplicate field index " + std::string(ident), open + 1);
            }
            spec.index = index;
            return;
        }

        if (!isValidFieldName(ident)) {
            throw PatternSyntaxError("invalid field name '" + std::string(ident) + "'", open + 1);
        }
        std::string name(ident);
        if (!names_.insert(name).second) {
            throw PatternSyntaxError("duplicate field name '" + name + "'", open + 1);
        }
        spec.name = std::move(name);
    }

    void resolveType(FieldSpec& spec, size_t open) {
        auto type = registry_.lookup(spec.type_code);
        if (!type) {
            throw PatternSyntaxError("unknown type code '" + spec.type_code + "'", open);
        }

        if (spec.precision) {
            guard_.checkRepeat(*spec.precision);
        }
        if (spec.width) {
            guard_.checkRepeat(*spec.width);
        }

        if (type->custom) {
            spec.custom_type_id = type->code;
        }

        ast_.segments.emplace_back(FieldSegment{std::move(spec), std::move(type)});
    }
};

}  // namespace

PatternAST compilePattern(std::string_view text,
                          const RegistrySnapshot& registry,
                          const SecurityGuard& guard) {
    guard.checkPattern(codePointCount(text));
    return Scanner(text, registry, guard).run();
}

}  // namespace pattern
}  // namespace formatscan

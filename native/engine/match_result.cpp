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

#include "match_result.h"
#include "pattern/field_spec.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace formatscan {

namespace {

json valueToJson(const pattern::Value& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return pattern::toString(value);
}

json spanToJson(const Span& span) {
    return json::array({span.first, span.second});
}

}  // namespace

std::string MatchResult::toJson() const {
    json j;

    json fixed_json = json::array();
    for (const auto& value : fixed) {
        fixed_json.push_back(valueToJson(value));
    }
    j["fixed"] = fixed_json;

    json named_json = json::object();
    for (const auto& [name, value] : named) {
        named_json[name] = valueToJson(value);
    }
    j["named"] = named_json;

    j["span"] = spanToJson(span);

    json spans_json = json::object();
    for (const auto& [key, field_span] : field_spans) {
        spans_json[key] = spanToJson(field_span);
    }
    j["field_spans"] = spans_json;

    return j.dump();
}

std::string MatchResult::namedTreeJson() const {
    json tree = json::object();

    for (const auto& [name, value] : named) {
        std::vector<std::string> path = pattern::splitFieldPath(name);
        if (path.empty()) {
            continue;
        }

        json* node = &tree;
        for (size_t i = 0; i + 1 < path.size(); ++i) {
            json& child = (*node)[path[i]];
            if (!child.is_object()) {
                child = json::object();
            }
            node = &child;
        }
        (*node)[path.back()] = valueToJson(value);
    }

    return tree.dump();
}

}  // namespace formatscan

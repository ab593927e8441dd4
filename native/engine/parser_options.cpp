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

#include "parser_options.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace formatscan {

RE2::Options ParserOptions::toRE2Options() const {
    RE2::Options opts;

    opts.set_log_errors(false);
    opts.set_case_sensitive(case_sensitive);
    opts.set_dot_nl(dot_nl);
    opts.set_encoding(RE2::Options::EncodingUTF8);
    opts.set_max_mem(max_mem);

    return opts;
}

std::string ParserOptions::fingerprint() const {
    std::ostringstream fp;
    fp << (case_sensitive ? 'C' : 'c')
       << (dot_nl ? 'D' : 'd')
       << ':' << max_pattern_length
       << ':' << max_input_length
       << ':' << max_fields
       << ':' << max_field_name_length
       << ':' << max_repeat
       << ':' << compile_timeout.count()
       << ':' << max_mem;
    return fp.str();
}

ParserOptions ParserOptions::fromJson(const std::string& json_str) {
    ParserOptions opts;
    if (json_str.empty()) {
        return opts;
    }

    try {
        json j = json::parse(json_str);

        opts.case_sensitive = j.value("case_sensitive", opts.case_sensitive);
        opts.dot_nl = j.value("dot_nl", opts.dot_nl);

        opts.max_pattern_length = j.value("max_pattern_length", opts.max_pattern_length);
        opts.max_input_length = j.value("max_input_length", opts.max_input_length);
        opts.max_fields = j.value("max_fields", opts.max_fields);
        opts.max_field_name_length = j.value("max_field_name_length", opts.max_field_name_length);
        opts.max_repeat = j.value("max_repeat", opts.max_repeat);

        if (j.contains("compile_timeout_ms")) {
            opts.compile_timeout = std::chrono::milliseconds(j["compile_timeout_ms"].get<int64_t>());
        }
        // Finer-grained override, mostly for tests
        if (j.contains("compile_timeout_us")) {
            opts.compile_timeout = std::chrono::microseconds(j["compile_timeout_us"].get<int64_t>());
        }

        opts.max_mem = j.value("max_mem", opts.max_mem);

    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse parser options JSON: ") + e.what());
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid type in parser options JSON: ") + e.what());
    }

    opts.validate();
    return opts;
}

void ParserOptions::validate() const {
    if (max_pattern_length == 0) {
        throw std::invalid_argument("max_pattern_length must be > 0");
    }
    if (max_input_length == 0) {
        throw std::invalid_argument("max_input_length must be > 0");
    }
    if (max_fields == 0) {
        throw std::invalid_argument("max_fields must be > 0");
    }
    if (max_field_name_length == 0) {
        throw std::invalid_argument("max_field_name_length must be > 0");
    }
    if (max_repeat == 0) {
        throw std::invalid_argument("max_repeat must be > 0");
    }
    if (compile_timeout.count() <= 0) {
        throw std::invalid_argument("compile_timeout must be > 0");
    }
    if (max_mem <= 0) {
        throw std::invalid_argument("max_mem must be > 0");
    }
}

std::string ParserOptions::toJson() const {
    json j;

    j["case_sensitive"] = case_sensitive;
    j["dot_nl"] = dot_nl;

    j["max_pattern_length"] = max_pattern_length;
    j["max_input_length"] = max_input_length;
    j["max_fields"] = max_fields;
    j["max_field_name_length"] = max_field_name_length;
    j["max_repeat"] = max_repeat;
    j["compile_timeout_us"] = compile_timeout.count();

    j["max_mem"] = max_mem;

    return j.dump(2);
}

}  // namespace formatscan

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

#include "security_guard.h"
#include "errors.h"
#include <future>
#include <iostream>
#include <thread>

namespace formatscan {

//============================================================================
// Size limits
//============================================================================

void SecurityGuard::checkPattern(size_t length) const {
    if (length > options_.max_pattern_length) {
        throw LimitExceededError("max_pattern_length", length, options_.max_pattern_length);
    }
}

void SecurityGuard::checkInput(size_t length) const {
    if (length > options_.max_input_length) {
        throw LimitExceededError("max_input_length", length, options_.max_input_length);
    }
}

void SecurityGuard::checkFieldCount(size_t count) const {
    if (count > options_.max_fields) {
        throw LimitExceededError("max_fields", count, options_.max_fields);
    }
}

void SecurityGuard::checkFieldName(size_t length) const {
    if (length > options_.max_field_name_length) {
        throw LimitExceededError("max_field_name_length", length, options_.max_field_name_length);
    }
}

void SecurityGuard::checkRepeat(size_t value) const {
    if (value > options_.max_repeat) {
        throw LimitExceededError("max_repeat", value, options_.max_repeat);
    }
}

//============================================================================
// Time-bounded compilation
//============================================================================

std::unique_ptr<RE2> SecurityGuard::compileExpression(const std::string& expression) const {
    RE2::Options re2_opts = options_.toRE2Options();

    // Shared so the worker keeps the task alive after we stop waiting
    auto task = std::make_shared<std::packaged_task<std::unique_ptr<RE2>()>>(
        [expression, re2_opts]() {
            return std::make_unique<RE2>(expression, re2_opts);
        });
    std::future<std::unique_ptr<RE2>> result = task->get_future();

    std::thread worker([task]() { (*task)(); });
    worker.detach();

    if (result.wait_for(options_.compile_timeout) == std::future_status::timeout) {
        // For now, stderr is acceptable for abandoned-compilation warnings
        std::cerr << "FORMATSCAN WARNING: regex compilation exceeded "
                  << options_.compile_timeout.count() << "us budget ("
                  << expression.size() << " byte expression), abandoning" << std::endl;
        throw CompilationTimeoutError(options_.compile_timeout);
    }

    std::unique_ptr<RE2> regex = result.get();

    if (!regex->ok()) {
        switch (regex->error_code()) {
            case RE2::ErrorPatternTooLarge:
            case RE2::ErrorRepeatSize:
                throw LimitExceededError("Expression rejected by RE2: " + regex->error());
            default:
                throw PatternSyntaxError("expression rejected by RE2: " + regex->error());
        }
    }

    return regex;
}

}  // namespace formatscan

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

#include "parser_options.h"
#include <re2/re2.h>
#include <cstddef>
#include <memory>
#include <string>

namespace formatscan {

/**
 * Security Guard - enforces size limits and bounds regex compilation time.
 *
 * Every check throws LimitExceededError naming the limit, so callers can
 * fail fast before any regex work. Stateless apart from the options copy;
 * safe to share across threads.
 */
class SecurityGuard {
public:
    explicit SecurityGuard(const ParserOptions& options) : options_(options) {}

    // Lengths are counted in code points
    void checkPattern(size_t length) const;
    void checkInput(size_t length) const;
    void checkFieldCount(size_t count) const;
    void checkFieldName(size_t length) const;

    /**
     * Width and precision end up as RE2 repetition counts;
     * both are bounded by max_repeat.
     */
    void checkRepeat(size_t value) const;

    /**
     * Construct the RE2 object under the compile budget.
     *
     * Construction runs on a worker thread. If it does not finish within
     * options.compile_timeout the attempt is abandoned (the worker finishes
     * in the background and its result is dropped) and a
     * CompilationTimeoutError is thrown. There is no retry.
     *
     * @param expression synthesized expression text
     * @return compiled expression
     * @throws CompilationTimeoutError when the budget expires
     * @throws LimitExceededError when RE2 reports the program too large
     * @throws PatternSyntaxError for any other RE2 error
     */
    std::unique_ptr<RE2> compileExpression(const std::string& expression) const;

    const ParserOptions& options() const { return options_; }

private:
    ParserOptions options_;
};

}  // namespace formatscan

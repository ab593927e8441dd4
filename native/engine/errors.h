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

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace formatscan {

/**
 * Error categories surfaced at the binding boundary.
 *
 * No-match is not an error and has no code: parse/search return an empty
 * optional instead.
 */
enum class ErrorCode {
    kOk = 0,
    kPatternSyntax,
    kLimitExceeded,
    kCompilationTimeout,
    kConversion,
    kInvalidSubPattern,
    kInvalidArgument
};

/**
 * Stable name for an error code (used by bindings and metrics JSON).
 */
const char* errorCodeName(ErrorCode code);

/**
 * Base class of every error raised by the engine.
 */
class FormatScanError : public std::runtime_error {
public:
    FormatScanError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * Malformed field or format spec, unmatched brace, duplicate field name,
 * unknown type code, or an expression RE2 refused to parse.
 */
class PatternSyntaxError : public FormatScanError {
public:
    /**
     * @param message description of the problem
     * @param position byte offset in the pattern, or npos when unknown
     */
    explicit PatternSyntaxError(const std::string& message,
                                size_t position = std::string::npos);

    size_t position() const noexcept { return position_; }

private:
    size_t position_;
};

/**
 * A configured size limit was exceeded. Always raised before regex work.
 */
class LimitExceededError : public FormatScanError {
public:
    LimitExceededError(const std::string& limit_name, size_t actual, size_t maximum);

    /**
     * Raised when RE2 itself rejects the program as too large.
     */
    explicit LimitExceededError(const std::string& message);

    const std::string& limitName() const noexcept { return limit_name_; }
    size_t actual() const noexcept { return actual_; }
    size_t maximum() const noexcept { return maximum_; }

private:
    std::string limit_name_;
    size_t actual_ = 0;
    size_t maximum_ = 0;
};

/**
 * Regex construction did not finish inside the compile budget.
 */
class CompilationTimeoutError : public FormatScanError {
public:
    explicit CompilationTimeoutError(std::chrono::microseconds budget);

    std::chrono::microseconds budget() const noexcept { return budget_; }

private:
    std::chrono::microseconds budget_;
};

/**
 * A field matched syntactically but its converter rejected the text.
 */
class ConversionError : public FormatScanError {
public:
    ConversionError(const std::string& field, const std::string& type_code,
                    const std::string& text, const std::string& reason);

    const std::string& field() const noexcept { return field_; }
    const std::string& typeCode() const noexcept { return type_code_; }
    const std::string& text() const noexcept { return text_; }

private:
    std::string field_;
    std::string type_code_;
    std::string text_;
};

/**
 * A custom type registration was refused.
 */
class InvalidSubPatternError : public FormatScanError {
public:
    InvalidSubPatternError(const std::string& type_id, const std::string& reason);

    const std::string& typeId() const noexcept { return type_id_; }

private:
    std::string type_id_;
};

}  // namespace formatscan

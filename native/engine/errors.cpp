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

#include "errors.h"
#include <sstream>

namespace formatscan {

namespace {

std::string syntaxMessage(const std::string& message, size_t position) {
    if (position == std::string::npos) {
        return "Invalid pattern: " + message;
    }
    std::ostringstream msg;
    msg << "Invalid pattern at position " << position << ": " << message;
    return msg.str();
}

std::string limitMessage(const std::string& limit_name, size_t actual, size_t maximum) {
    std::ostringstream msg;
    if (limit_name == "max_fields") {
        msg << "Field count " << actual << " exceeds the maximum allowed count of " << maximum;
    } else if (limit_name == "max_repeat") {
        msg << "Width or precision " << actual
            << " exceeds the maximum allowed repeat count of " << maximum;
    } else {
        const char* label = "Value";
        if (limit_name == "max_pattern_length") {
            label = "Pattern";
        } else if (limit_name == "max_input_length") {
            label = "Input";
        } else if (limit_name == "max_field_name_length") {
            label = "Field name";
        }
        msg << label << " length " << actual << " exceeds maximum allowed length of " << maximum;
    }
    return msg.str();
}

}  // namespace

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:                 return "OK";
        case ErrorCode::kPatternSyntax:      return "PATTERN_SYNTAX";
        case ErrorCode::kLimitExceeded:      return "LIMIT_EXCEEDED";
        case ErrorCode::kCompilationTimeout: return "COMPILATION_TIMEOUT";
        case ErrorCode::kConversion:         return "CONVERSION";
        case ErrorCode::kInvalidSubPattern:  return "INVALID_SUB_PATTERN";
        case ErrorCode::kInvalidArgument:    return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

PatternSyntaxError::PatternSyntaxError(const std::string& message, size_t position)
    : FormatScanError(ErrorCode::kPatternSyntax, syntaxMessage(message, position)),
      position_(position) {}

LimitExceededError::LimitExceededError(const std::string& limit_name, size_t actual, size_t maximum)
    : FormatScanError(ErrorCode::kLimitExceeded, limitMessage(limit_name, actual, maximum)),
      limit_name_(limit_name),
      actual_(actual),
      maximum_(maximum) {}

LimitExceededError::LimitExceededError(const std::string& message)
    : FormatScanError(ErrorCode::kLimitExceeded, message),
      limit_name_("max_mem") {}

CompilationTimeoutError::CompilationTimeoutError(std::chrono::microseconds budget)
    : FormatScanError(ErrorCode::kCompilationTimeout,
                      "Regex compilation exceeded time budget of " +
                          std::to_string(budget.count()) + "us"),
      budget_(budget) {}

ConversionError::ConversionError(const std::string& field, const std::string& type_code,
                                 const std::string& text, const std::string& reason)
    : FormatScanError(ErrorCode::kConversion,
                      "Cannot convert field '" + field + "' (type '" + type_code +
                          "') from text '" + text + "': " + reason),
      field_(field),
      type_code_(type_code),
      text_(text) {}

InvalidSubPatternError::InvalidSubPatternError(const std::string& type_id, const std::string& reason)
    : FormatScanError(ErrorCode::kInvalidSubPattern,
                      "Invalid sub-pattern for type '" + type_id + "': " + reason),
      type_id_(type_id) {}

}  // namespace formatscan

// Copyright 2025 Fidesinnova.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// error.hpp
// Error type shared by every zkattest component. One exception class carries
// an ErrorCode; the code maps to a coarse category for callers that only
// care about the kind of failure.

#pragma once
#include <stdexcept>
#include <string>

namespace zkattest {

enum class ErrorCode {
    InvalidInput,
    UnauthorizedAttester,
    InvalidProof,
    InvalidTimestamp,
    InvalidSignalType,
    ModelAlreadyAttested,
    SignalAlreadyAttested,
    ModelNotFound,
    SetupFailure,
    KeyMismatch,
    JournalFailure,
};

enum class ErrorCategory {
    InputValidation,
    Authorization,
    ProofInvalid,
    Temporal,
    Integrity,
    Setup,
    Storage,
};

inline const char* to_string(ErrorCode c){
    switch(c){
        case ErrorCode::InvalidInput:          return "InvalidInput";
        case ErrorCode::UnauthorizedAttester:  return "UnauthorizedAttester";
        case ErrorCode::InvalidProof:          return "InvalidProof";
        case ErrorCode::InvalidTimestamp:      return "InvalidTimestamp";
        case ErrorCode::InvalidSignalType:     return "InvalidSignalType";
        case ErrorCode::ModelAlreadyAttested:  return "ModelAlreadyAttested";
        case ErrorCode::SignalAlreadyAttested: return "SignalAlreadyAttested";
        case ErrorCode::ModelNotFound:         return "ModelNotFound";
        case ErrorCode::SetupFailure:          return "SetupFailure";
        case ErrorCode::KeyMismatch:           return "KeyMismatch";
        case ErrorCode::JournalFailure:        return "JournalFailure";
    }
    return "Unknown";
}

inline ErrorCategory category_of(ErrorCode c){
    switch(c){
        case ErrorCode::InvalidInput:
        case ErrorCode::InvalidSignalType:     return ErrorCategory::InputValidation;
        case ErrorCode::UnauthorizedAttester:  return ErrorCategory::Authorization;
        case ErrorCode::InvalidProof:          return ErrorCategory::ProofInvalid;
        case ErrorCode::InvalidTimestamp:      return ErrorCategory::Temporal;
        case ErrorCode::ModelAlreadyAttested:
        case ErrorCode::SignalAlreadyAttested:
        case ErrorCode::ModelNotFound:         return ErrorCategory::Integrity;
        case ErrorCode::SetupFailure:
        case ErrorCode::KeyMismatch:           return ErrorCategory::Setup;
        case ErrorCode::JournalFailure:        return ErrorCategory::Storage;
    }
    return ErrorCategory::InputValidation;
}

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return category_of(code_); }

private:
    ErrorCode code_;
};

} // namespace zkattest

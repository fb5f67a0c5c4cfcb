#pragma once
/*
================================================================================
Core: Error Taxonomy
FILE: cpp/maintopt/core/error.hpp

Purpose:
  - One exception type for every validation and numerical failure in the
    engine, tagged with a stable code so callers can branch on the kind.
  - Carries file/line/function of the throw site.

Codes map 1:1 onto the failure kinds the CLI and callers distinguish:
  InvalidTransitionMatrix, InvalidCostModel, InvalidPolicyLength,
  SingularFundamentalMatrix, InvalidSimulationConfig, InvalidOptimizerConfig.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace maintopt {

enum class ErrorCode : int {
  kInvalidTransitionMatrix   = 1,
  kInvalidCostModel          = 2,
  kInvalidPolicyLength       = 3,
  kSingularFundamentalMatrix = 4,
  kInvalidSimulationConfig   = 5,
  kInvalidOptimizerConfig    = 6,
  kInvalidArgument           = 7,
  kInternal                  = 8,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidTransitionMatrix:   return "InvalidTransitionMatrix";
    case ErrorCode::kInvalidCostModel:          return "InvalidCostModel";
    case ErrorCode::kInvalidPolicyLength:       return "InvalidPolicyLength";
    case ErrorCode::kSingularFundamentalMatrix: return "SingularFundamentalMatrix";
    case ErrorCode::kInvalidSimulationConfig:   return "InvalidSimulationConfig";
    case ErrorCode::kInvalidOptimizerConfig:    return "InvalidOptimizerConfig";
    case ErrorCode::kInvalidArgument:           return "InvalidArgument";
    case ErrorCode::kInternal:                  return "Internal";
    default:                                    return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[maintopt::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace maintopt

#define MAINTOPT_THROW(CODE, MSG) ::maintopt::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define MAINTOPT_ENSURE(EXPR, CODE, MSG) ::maintopt::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)

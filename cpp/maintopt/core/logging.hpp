#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/maintopt/core/logging.hpp
===========================================================
Purpose:
  - Minimal logging shared by all engine modules and the CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe: optimizer workers may log concurrently.
  - WARN/ERROR go to stderr, everything else to stdout.
===========================================================
*/

#include <sstream>
#include <string>

namespace maintopt {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

bool log_enabled(LogLevel lvl) noexcept;

// Accepts "debug", "info", "warn", "error" (case-insensitive).
// Returns false and leaves *out untouched on anything else.
bool parse_log_level(const std::string& s, LogLevel* out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

}  // namespace maintopt

// Stream-style helper; the message is only formatted when the level is enabled.
#define MAINTOPT_LOG(LVL, EXPR)                                  \
  do {                                                           \
    if (::maintopt::log_enabled(::maintopt::LogLevel::LVL)) {    \
      std::ostringstream maintopt_log_oss_;                      \
      maintopt_log_oss_ << EXPR;                                 \
      ::maintopt::log(::maintopt::LogLevel::LVL,                 \
                      maintopt_log_oss_.str());                  \
    }                                                            \
  } while (0)

#pragma once
/*
  Framework-free selftest helpers shared by the *_selftest executables.

  Each executable calls the expect_* helpers, then returns finish("name"):
  non-zero when any expectation failed. No Catch2/GoogleTest required.
*/

#include "maintopt/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

namespace maintopt::selftest {

inline int& fail_count() {
  static int n = 0;
  return n;
}

inline void fail(std::string_view msg) {
  ++fail_count();
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

// Approximate equality, relative with an absolute floor.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

inline void expect_near(double got, double exp, double abs_tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= abs_tol)) {
    fail(msg);
    std::cerr.precision(17);
    std::cerr << "  got " << got << ", expected " << exp << " +/- " << abs_tol << "\n";
  } else {
    pass(msg);
  }
}

// fn() must throw maintopt::Error with the given code.
template <class Fn>
void expect_error(ErrorCode code, Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() == code) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  wrong code: " << e.what() << "\n";
    }
    return;
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  unexpected exception: " << e.what() << "\n";
    return;
  }
  fail(msg);
  std::cerr << "  expected " << to_string(code) << ", nothing thrown\n";
}

template <class Fn>
void expect_no_error(Fn&& fn, std::string_view msg) {
  try {
    fn();
    pass(msg);
  } catch (const std::exception& e) {
    fail(msg);
    std::cerr << "  threw: " << e.what() << "\n";
  }
}

inline int finish(std::string_view suite) {
  if (fail_count() != 0) {
    std::cerr << "\n" << suite << ": " << fail_count() << " selftest failure(s)\n";
    return 1;
  }
  std::cerr << "\n" << suite << ": all selftests passed.\n";
  return 0;
}

}  // namespace maintopt::selftest

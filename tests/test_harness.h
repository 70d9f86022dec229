#pragma once

#include <cmath>
#include <iostream>

// Minimal test helper to keep individual test files tidy.
//
// Usage:
//   int failures = 0;
//   CHECK(expr);
//   CHECK_NEAR(a, b, eps);
//
// The macros increment `failures` in the current scope and print a message.

#ifndef CHECK
#define CHECK(expr)                                                                             \
  do {                                                                                          \
    if (!(expr)) {                                                                              \
      std::cerr << "[shipcalc_tests] CHECK failed: " #expr " (" << __FILE__ << ":" << __LINE__ \
                << ")\n";                                                                      \
      ++failures;                                                                               \
    }                                                                                           \
  } while (0)
#endif

#ifndef CHECK_NEAR
#define CHECK_NEAR(a, b, eps)                                                                   \
  do {                                                                                          \
    const double check_a_ = (double)(a);                                                        \
    const double check_b_ = (double)(b);                                                        \
    if (!(std::fabs(check_a_ - check_b_) <= (eps))) {                                           \
      std::cerr << "[shipcalc_tests] CHECK_NEAR failed: " #a " ~= " #b " got=" << check_a_     \
                << " expected=" << check_b_ << " (" << __FILE__ << ":" << __LINE__ << ")\n";   \
      ++failures;                                                                               \
    }                                                                                           \
  } while (0)
#endif

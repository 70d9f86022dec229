#pragma once

#include <cstdlib>
#include <string_view>

namespace shipcalc::core {

// Reports a caller-side programming defect and terminates with SIGABRT.
// Logs "PANIC: <message> (<file basename>:<line>)" at Error level first; a second
// panic raised while that line is being logged aborts immediately.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace shipcalc::core

#define SHIPCALC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::shipcalc::core::panic("Assertion failed: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define SHIPCALC_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::shipcalc::core::panic((msg), __FILE__, __LINE__); \
    } \
  } while (0)

#define SHIPCALC_PANIC(msg) ::shipcalc::core::panic((msg), __FILE__, __LINE__)

#pragma once

#include <cstdlib>
#include <string_view>

namespace parkwise::core {

// Minimal assert helper. Kept small on purpose.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace parkwise::core

#define PARKWISE_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::parkwise::core::panic("Assertion failed: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define PARKWISE_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::parkwise::core::panic((msg), __FILE__, __LINE__); \
    } \
  } while (0)

#include "parkwise/core/Assert.h"
#include "parkwise/core/Log.h"

#include <sstream>

namespace parkwise::core {

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  std::ostringstream oss;
  oss << "PANIC: " << message << " (" << file << ":" << line << ")";
  log(LogLevel::Error, oss.str());
  std::abort();
}

} // namespace parkwise::core

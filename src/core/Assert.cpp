#include "shipcalc/core/Assert.h"
#include "shipcalc/core/Log.h"

#include <atomic>
#include <sstream>

namespace shipcalc::core {

static std::atomic<bool> g_panicking{false};

// "/a/b/src/vessel/Engine.cpp" -> "Engine.cpp"
static std::string_view fileBasename(const char* file) {
  if (!file) return "?";
  const std::string_view path(file);
  const std::size_t slash = path.find_last_of("/\\");
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  // A sink that panics while the first report is being logged must not recurse.
  if (g_panicking.exchange(true)) std::abort();

  std::ostringstream oss;
  oss << "PANIC: " << message << " (" << fileBasename(file) << ":" << line << ")";
  log(LogLevel::Error, oss.str());
  std::abort();
}

} // namespace shipcalc::core

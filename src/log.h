#pragma once

#include <format>
#include <functional>
#include <iostream>
#include <string_view>
#include <utility>

namespace transit_router {

// Sink for human readable progress messages, one line per call.
using TextLogger = std::function<void(std::string_view)>;

inline TextLogger OstreamLogger(std::ostream& os) {
  return [&os](std::string_view line) { os << line << '\n'; };
}

// Discards everything. The default for library calls.
inline TextLogger NullLogger() {
  return [](std::string_view) {};
}

// Build a line with std::format and pass it to `logger`. An empty logger is
// treated like NullLogger, and the arguments are not formatted.
template <typename... Args>
void Logf(
    const TextLogger& logger, std::format_string<Args...> fmt, Args&&... args
) {
  if (!logger) {
    return;
  }
  logger(std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace transit_router

#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace benefactor::common {

/// Log a fatal condition, flush every sink and terminate the process.
///
/// Reserved for broken storage or codec invariants; business rule failures
/// travel as transaction error codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace benefactor::common

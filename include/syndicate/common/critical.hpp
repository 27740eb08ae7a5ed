#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace syndicate::common {

/// Log an unrecoverable infrastructure fault and terminate the process.
///
/// Reserved for storage and decoding failures; scheme business errors are
/// reported through operation results instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace syndicate::common

#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace warden::common {

/// Log an unrecoverable infrastructure failure and terminate the process.
///
/// Reserved for storage and decoding faults; operation-level failures are
/// reported through `warden::schema::operation_result_t` instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace warden::common

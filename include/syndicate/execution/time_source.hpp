#pragma once

#include <syndicate/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace syndicate::execution {

/// Clock sampled once per scheme operation, in seconds.
using time_source_t = std::function<syndicate::schema::timestamp_seconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<syndicate::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace syndicate::execution

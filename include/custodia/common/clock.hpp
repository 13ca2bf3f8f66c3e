#pragma once

#include <custodia/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace custodia::common {

/// Source of commit and policy timestamps; injected so tests control time.
using clock_fn_t = std::function<custodia::schema::timestamp_milliseconds_t()>;

inline custodia::schema::timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<custodia::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace custodia::common

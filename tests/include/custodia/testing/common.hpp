#pragma once

#include <custodia/common/clock.hpp>
#include <custodia/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace custodia::testing {

inline constexpr auto kMillisecondsPerHour =
    custodia::schema::duration_milliseconds_t{60 * 60 * 1000};

inline custodia::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = custodia::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Hand-advanced time source shared by the components under test.
class manual_clock final {
 public:
  explicit manual_clock(
      const custodia::schema::timestamp_milliseconds_t start = 1'700'000'000'000)
      : now_{std::make_shared<custodia::schema::timestamp_milliseconds_t>(
            start)} {}

  custodia::schema::timestamp_milliseconds_t now() const { return *now_; }

  void advance(const custodia::schema::duration_milliseconds_t by) {
    *now_ += by;
  }

  void advance_hours(const double hours) {
    *now_ += static_cast<custodia::schema::duration_milliseconds_t>(
        hours * static_cast<double>(kMillisecondsPerHour));
  }

  custodia::common::clock_fn_t function() const {
    return [now = now_] { return *now; };
  }

 private:
  std::shared_ptr<custodia::schema::timestamp_milliseconds_t> now_;
};

}  // namespace custodia::testing

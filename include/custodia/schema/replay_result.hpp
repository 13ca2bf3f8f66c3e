#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: replay result.
// Recomputation of the event log commitment against the committed root.
namespace custodia::schema {

template <uint16_t Version>
struct replay_result;

template <>
struct replay_result<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t event_count{};
  uint64_t last_sequence{};
  hash32_t log_root{};
  std::string error;
};

using replay_result_t = replay_result<1>;

}  // namespace custodia::schema

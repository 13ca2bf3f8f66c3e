#pragma once

#include <custodia/schema/primitives.hpp>
#include <custodia/schema/tamper_source.hpp>
#include <cstdint>
#include <string>

namespace custodia::schema {

template <uint16_t Version>
struct tamper_event_record;

template <>
struct tamper_event_record<1> final {
  uint16_t version{1};
  uint64_t id{};
  evidence_id_t evidence_id{};
  tamper_source_t detected_by{};
  std::string reason;
  uint8_t risk_score{};  // 0-100
  timestamp_milliseconds_t recorded_at{};
};

using tamper_event_record_t = tamper_event_record<1>;

}  // namespace custodia::schema

#pragma once

#include <custodia/schema/evidence_status.hpp>
#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: evidence record.
// Only `status` and `custody_event_count` change after creation.
namespace custodia::schema {

template <uint16_t Version>
struct evidence_record;

template <>
struct evidence_record<1> final {
  uint16_t version{1};
  evidence_id_t id{};
  hash32_t fingerprint{};
  std::string case_id;
  identity_t collector;
  timestamp_milliseconds_t registered_at{};
  evidence_status_t status{};
  uint64_t custody_event_count{};
};

using evidence_record_t = evidence_record<1>;

}  // namespace custodia::schema

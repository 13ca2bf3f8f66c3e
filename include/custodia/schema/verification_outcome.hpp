#pragma once

#include <custodia/schema/evidence_status.hpp>
#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: verification outcome.
// Result of comparing a submitted fingerprint with the registered one.
// `event_index` is set only on the passing branch (the VERIFIED custody
// event); a mismatch appends no custody event.
namespace custodia::schema {

template <uint16_t Version>
struct verification_outcome;

template <>
struct verification_outcome<1> final {
  uint16_t version{1};
  evidence_id_t evidence_id{};
  bool passed{};
  hash32_t expected_fingerprint{};
  hash32_t submitted_fingerprint{};
  evidence_status_t status{};
  std::optional<uint64_t> event_index;
  uint64_t sequence{};
};

using verification_outcome_t = verification_outcome<1>;

}  // namespace custodia::schema

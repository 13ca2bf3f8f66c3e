#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>

// Schema type: attestation record.
// An independent verifier's confirmation (or denial) of an evidence item's
// integrity. At most one per (evidence, verifier).
namespace custodia::schema {

template <uint16_t Version>
struct attestation_record;

template <>
struct attestation_record<1> final {
  uint16_t version{1};
  evidence_id_t evidence_id{};
  uint64_t index{};
  identity_t verifier;
  bool verified{};
  timestamp_milliseconds_t timestamp{};
};

using attestation_record_t = attestation_record<1>;

}  // namespace custodia::schema

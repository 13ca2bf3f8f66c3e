#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>

// Schema type: custody event record.
// One immutable entry in an evidence item's ordered chain-of-custody log.
// `action` holds the action fingerprint (see actions::action_fingerprint);
// a zero `metadata_hash` means no off-ledger details were supplied.
namespace custodia::schema {

template <uint16_t Version>
struct custody_event_record;

template <>
struct custody_event_record<1> final {
  uint16_t version{1};
  evidence_id_t evidence_id{};
  uint64_t index{};
  identity_t handler;
  hash32_t action{};
  timestamp_milliseconds_t timestamp{};
  hash32_t metadata_hash{};
};

using custody_event_record_t = custody_event_record<1>;

}  // namespace custodia::schema

#pragma once

#include <custodia/schema/ledger_event_type.hpp>
#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: ledger event record.
// Persisted outbound notification. `sequence` is the position in the global
// append-only log; `recorded_at` is the commit timestamp.
//
// Field use by type:
//   EvidenceRegistered    actor=collector, fingerprint, detail=case id
//   CustodyEventLogged    actor=handler, action, event_index, metadata_hash
//   VerificationPassed    actor=verifier, fingerprint
//   TamperDetected        actor=verifier, fingerprint=expected, submitted
//   VerificationAttested  actor=verifier, event_index, verified
//   PolicyViolation       actor=handler, event_index, metadata_hash,
//                         detail="<kind>: <reason>"
namespace custodia::schema {

template <uint16_t Version>
struct ledger_event_record;

template <>
struct ledger_event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  ledger_event_type_t type{};
  evidence_id_t evidence_id{};
  identity_t actor;
  std::optional<hash32_t> fingerprint;
  std::optional<hash32_t> submitted_fingerprint;
  std::optional<hash32_t> action;
  std::optional<uint64_t> event_index;
  std::optional<hash32_t> metadata_hash;
  std::optional<bool> verified;
  std::string detail;
  timestamp_milliseconds_t recorded_at{};
};

using ledger_event_record_t = ledger_event_record<1>;

}  // namespace custodia::schema

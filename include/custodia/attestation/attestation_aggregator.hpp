#pragma once

#include <custodia/ledger/ledger_store.hpp>
#include <custodia/schema/attestation_record.hpp>
#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>

namespace custodia::attestation {

struct attestation_summary final {
  uint64_t total{};
  uint64_t confirmed{};
};

/// Collects independent verifier confirmations per evidence item.
///
/// Eligibility is a persisted verifier registry; the attestations themselves
/// live on the ledger. No consensus threshold is applied here: callers derive
/// confirmed / total from summarize().
class attestation_aggregator final {
 public:
  attestation_aggregator(
      custodia::ledger::ledger_store::encoder_t& encoder,
      custodia::ledger::ledger_store::storage_t& storage,
      custodia::ledger::ledger_store& store);

  /// Idempotent. The value is true when the identity was newly registered.
  custodia::schema::operation_result<bool> register_verifier(
      const custodia::schema::identity_t& verifier);

  bool is_registered_verifier(
      const custodia::schema::identity_t& verifier) const;

  custodia::schema::operation_result<uint64_t> attest(
      custodia::schema::evidence_id_t id,
      const custodia::schema::identity_t& verifier,
      bool verified);

  custodia::schema::operation_result<uint64_t> get_attestation_count(
      custodia::schema::evidence_id_t id) const;

  custodia::schema::operation_result<custodia::schema::attestation_record_t>
  get_attestation(custodia::schema::evidence_id_t id, uint64_t index) const;

  custodia::schema::operation_result<attestation_summary> summarize(
      custodia::schema::evidence_id_t id) const;

 private:
  mutable std::mutex mutex_;
  custodia::ledger::ledger_store::encoder_t& encoder_;
  custodia::ledger::ledger_store::storage_t& storage_;
  custodia::ledger::ledger_store& store_;
};

}  // namespace custodia::attestation

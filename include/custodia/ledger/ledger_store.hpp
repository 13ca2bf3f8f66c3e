#pragma once

#include <custodia/common/clock.hpp>
#include <custodia/schema/attestation_record.hpp>
#include <custodia/schema/custody_event_record.hpp>
#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/schema/error_code.hpp>
#include <custodia/schema/evidence_record.hpp>
#include <custodia/schema/ledger_event_record.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/primitives.hpp>
#include <custodia/schema/replay_result.hpp>
#include <custodia/schema/verification_outcome.hpp>
#include <custodia/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace custodia::ledger {

/// Invoked once per committed notification, after the batch is durable and
/// outside the store lock. Delivery is at-most-once; a throwing listener is
/// logged and does not affect the committed operation.
using notification_listener_t =
    std::function<void(const custodia::schema::ledger_event_record_t&)>;

/// Authoritative append-only store for evidence, custody logs and
/// attestations.
///
/// Every mutating operation is validated under a single lock and applied as
/// one storage batch together with the notifications it produces and the new
/// log head, so no partial application is ever observable. The store appends
/// what it is told to append; custody policy is enforced in front of it.
class ledger_store final {
 public:
  using encoder_t = custodia::schema::encoding::scale_encoder_t;
  using storage_t =
      custodia::storage::storage<custodia::storage::rocksdb_storage_tag>;

  explicit ledger_store(
      encoder_t& encoder,
      storage_t& storage,
      custodia::common::clock_fn_t clock =
          custodia::common::system_clock_milliseconds);

  ledger_store(const ledger_store&) = delete;
  ledger_store& operator=(const ledger_store&) = delete;

  /// Create an evidence record and its automatic COLLECTED custody event.
  ///
  /// Fails with InvalidFingerprint (zero value), InvalidCaseId (empty),
  /// InvalidInput (empty collector) or DuplicateFingerprint.
  custodia::schema::operation_result<custodia::schema::evidence_id_t>
  register_evidence(const custodia::schema::hash32_t& fingerprint,
                    const std::string& case_id,
                    const custodia::schema::identity_t& collector);

  /// Append a custody event at the next index and return that index.
  custodia::schema::operation_result<uint64_t> append_custody_event(
      custodia::schema::evidence_id_t id,
      const custodia::schema::hash32_t& action,
      const custodia::schema::identity_t& handler,
      const std::optional<custodia::schema::hash32_t>& metadata_hash =
          std::nullopt);

  /// Append a VIOLATION custody event recording a rejected attempt.
  ///
  /// Emits CustodyEventLogged and PolicyViolation in the same batch.
  custodia::schema::operation_result<uint64_t> append_violation(
      custodia::schema::evidence_id_t id,
      const custodia::schema::identity_t& handler,
      custodia::schema::error_code_t violation,
      const std::string& detail,
      const custodia::schema::hash32_t& metadata_hash);

  /// Compare `submitted` with the registered fingerprint.
  ///
  /// Match: status VERIFIED, a VERIFIED custody event carrying the submitted
  /// fingerprint, VerificationPassed. Mismatch: status FLAGGED and
  /// TamperDetected only; no custody event is appended.
  custodia::schema::operation_result<custodia::schema::verification_outcome_t>
  record_verification(custodia::schema::evidence_id_t id,
                      const custodia::schema::hash32_t& submitted,
                      const custodia::schema::identity_t& verifier);

  /// Append an attestation; at most one per (evidence, verifier).
  custodia::schema::operation_result<uint64_t> append_attestation(
      custodia::schema::evidence_id_t id,
      const custodia::schema::identity_t& verifier,
      bool verified);

  custodia::schema::operation_result<custodia::schema::evidence_record_t>
  get_evidence(custodia::schema::evidence_id_t id) const;

  custodia::schema::operation_result<custodia::schema::custody_event_record_t>
  get_custody_event(custodia::schema::evidence_id_t id, uint64_t index) const;

  custodia::schema::operation_result<uint64_t> get_custody_event_count(
      custodia::schema::evidence_id_t id) const;

  /// Full ordered custody log of one evidence item.
  custodia::schema::operation_result<
      std::vector<custodia::schema::custody_event_record_t>>
  custody_events(custodia::schema::evidence_id_t id) const;

  /// The zero fingerprint is never registrable and fails with
  /// InvalidFingerprint.
  custodia::schema::operation_result<bool> is_fingerprint_registered(
      const custodia::schema::hash32_t& fingerprint) const;

  uint64_t get_evidence_count() const;

  custodia::schema::operation_result<uint64_t> get_attestation_count(
      custodia::schema::evidence_id_t id) const;

  custodia::schema::operation_result<custodia::schema::attestation_record_t>
  get_attestation(custodia::schema::evidence_id_t id, uint64_t index) const;

  /// Notifications with sequence in [from_sequence, to_sequence].
  std::vector<custodia::schema::ledger_event_record_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  /// Sequence and BLAKE3 root of the last committed notification.
  custodia::storage::committed_state committed_state() const;

  /// Recompute the log root from the persisted notifications and compare it
  /// with the committed head.
  custodia::schema::replay_result_t verify_event_log() const;

  void add_listener(notification_listener_t listener);

 private:
  struct pending_commit final {
    std::vector<custodia::storage::key_value_entry_t> entries;
    std::vector<custodia::schema::ledger_event_record_t> events;
  };

  template <typename T>
  void stage(pending_commit& pending,
             const custodia::schema::bytes_t& key,
             const T& value);

  /// Queue a notification; sequence and commit time are assigned here.
  void stage_event(pending_commit& pending,
                   custodia::schema::ledger_event_record_t event,
                   custodia::schema::timestamp_milliseconds_t now);

  /// Write the batch and advance the log head. Caller holds mutex_.
  bool commit_locked(pending_commit& pending);

  void notify(const std::vector<custodia::schema::ledger_event_record_t>& events,
              const std::vector<notification_listener_t>& listeners) const;

  std::optional<custodia::schema::evidence_record_t> load_evidence(
      custodia::schema::evidence_id_t id) const;

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  custodia::common::clock_fn_t clock_;
  uint64_t evidence_count_{};
  custodia::storage::committed_state head_{};
  std::vector<notification_listener_t> listeners_;
};

}  // namespace custodia::ledger

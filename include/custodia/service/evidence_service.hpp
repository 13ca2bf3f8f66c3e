#pragma once

#include <custodia/attestation/attestation_aggregator.hpp>
#include <custodia/common/clock.hpp>
#include <custodia/ledger/ledger_store.hpp>
#include <custodia/policy/custody_policy_validator.hpp>
#include <custodia/schema/custody_event_record.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/primitives.hpp>
#include <custodia/schema/verification_outcome.hpp>
#include <custodia/tamper/tamper_ledger.hpp>
#include <custodia/verification/verification_engine.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace custodia::service {

/// The custody event actually written: the proposed action, or VIOLATION
/// when policy rejected it.
struct custody_receipt final {
  custodia::schema::evidence_id_t evidence_id{};
  uint64_t event_index{};
  std::string action;
  custodia::schema::hash32_t metadata_hash{};
};

struct custody_history_entry final {
  custodia::schema::custody_event_record_t event;
  std::string action_name;
};

/// Caller-facing orchestration: fingerprinting, the policy gate in front of
/// the ledger, violation records, verification and attestation.
///
/// Wires the tamper ledger to the store's notifications on construction.
/// The policy decision, the append it gates and any rollback for one
/// evidence id run under a single per-id lock, so the custody log commits in
/// decision order.
class evidence_service final {
 public:
  evidence_service(custodia::ledger::ledger_store& store,
                   custodia::policy::custody_policy_validator& validator,
                   custodia::verification::verification_engine& engine,
                   custodia::attestation::attestation_aggregator& aggregator,
                   custodia::tamper::tamper_ledger& tamper,
                   custodia::common::clock_fn_t clock =
                       custodia::common::system_clock_milliseconds);

  evidence_service(const evidence_service&) = delete;
  evidence_service& operator=(const evidence_service&) = delete;

  /// Fingerprint the raw bytes and register them.
  custodia::schema::operation_result<custodia::schema::evidence_id_t>
  register_evidence(const custodia::schema::bytes_view_t& raw,
                    const std::string& case_id,
                    const custodia::schema::identity_t& collector);

  /// Register an already computed fingerprint.
  custodia::schema::operation_result<custodia::schema::evidence_id_t>
  register_evidence(const custodia::schema::hash32_t& fingerprint,
                    const std::string& case_id,
                    const custodia::schema::identity_t& collector);

  /// Validate and append a custody action.
  ///
  /// On a policy rejection the proposed event is not written; a VIOLATION
  /// event is appended instead and the result carries the violation code,
  /// its detail, and the receipt of that VIOLATION event.
  custodia::schema::operation_result<custody_receipt> log_custody_action(
      custodia::schema::evidence_id_t id,
      const std::string& action,
      const custodia::schema::identity_t& handler,
      const std::optional<nlohmann::json>& details = std::nullopt);

  custodia::schema::operation_result<custodia::schema::verification_outcome_t>
  verify(custodia::schema::evidence_id_t id,
         const custodia::verification::verification_input_t& input,
         const custodia::schema::identity_t& verifier);

  custodia::schema::operation_result<bool> register_verifier(
      const custodia::schema::identity_t& verifier);

  /// Attest on behalf of `verifier`. An unregistered verifier is a policy
  /// violation and is recorded on the evidence's custody log.
  custodia::schema::operation_result<uint64_t> attest(
      custodia::schema::evidence_id_t id,
      const custodia::schema::identity_t& verifier,
      bool verified);

  custodia::schema::operation_result<std::vector<custody_history_entry>>
  custody_history(custodia::schema::evidence_id_t id) const;

  /// Rebuild the validator's runtime state from every custody log.
  void restore_policy_state();

 private:
  custodia::schema::operation_result<custody_receipt> record_violation(
      custodia::schema::evidence_id_t id,
      const custodia::schema::identity_t& handler,
      custodia::schema::error_code_t violation,
      const std::string& detail);

  void restore_policy_state(custodia::schema::evidence_id_t id);

  /// Serializes policy decisions and the writes they gate for one id.
  std::unique_lock<std::mutex> lock_evidence(
      custodia::schema::evidence_id_t id);

  custodia::ledger::ledger_store& store_;
  custodia::policy::custody_policy_validator& validator_;
  custodia::verification::verification_engine& engine_;
  custodia::attestation::attestation_aggregator& aggregator_;
  custodia::common::clock_fn_t clock_;
  std::mutex evidence_locks_mutex_;
  std::unordered_map<custodia::schema::evidence_id_t,
                     std::unique_ptr<std::mutex>>
      evidence_locks_;
};

}  // namespace custodia::service

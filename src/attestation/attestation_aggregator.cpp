#include <spdlog/spdlog.h>
#include <custodia/attestation/attestation_aggregator.hpp>
#include <custodia/schema/key/ledger_keys.hpp>

using namespace custodia::schema;

namespace custodia::attestation {

attestation_aggregator::attestation_aggregator(
    custodia::ledger::ledger_store::encoder_t& encoder,
    custodia::ledger::ledger_store::storage_t& storage,
    custodia::ledger::ledger_store& store)
    : encoder_{encoder}, storage_{storage}, store_{store} {}

operation_result<bool> attestation_aggregator::register_verifier(
    const identity_t& verifier) {
  if (verifier.empty()) {
    return make_error<bool>(error_code_t::invalid_input,
                            "verifier identity must not be empty");
  }
  auto lock = std::scoped_lock{mutex_};
  auto verifier_key = key::make_verifier_key(encoder_, verifier);
  if (storage_.contains(verifier_key)) {
    return make_ok(false);
  }
  auto entries = std::vector<custodia::storage::key_value_entry_t>{
      {verifier_key, encoder_.encode(true)}};
  if (!storage_.commit(entries)) {
    return make_error<bool>(error_code_t::commit_failed,
                            "verifier registration did not commit");
  }
  spdlog::info("Registered verifier '{}'", verifier);
  return make_ok(true);
}

bool attestation_aggregator::is_registered_verifier(
    const identity_t& verifier) const {
  return !verifier.empty() &&
         storage_.contains(key::make_verifier_key(encoder_, verifier));
}

operation_result<uint64_t> attestation_aggregator::attest(
    const evidence_id_t id,
    const identity_t& verifier,
    const bool verified) {
  if (!is_registered_verifier(verifier)) {
    spdlog::warn("Rejected attestation on evidence {} by unregistered '{}'",
                 id, verifier);
    return make_error<uint64_t>(error_code_t::not_registered_verifier,
                                "verifier '" + verifier +
                                    "' is not registered");
  }
  return store_.append_attestation(id, verifier, verified);
}

operation_result<uint64_t> attestation_aggregator::get_attestation_count(
    const evidence_id_t id) const {
  return store_.get_attestation_count(id);
}

operation_result<attestation_record_t> attestation_aggregator::get_attestation(
    const evidence_id_t id,
    const uint64_t index) const {
  return store_.get_attestation(id, index);
}

operation_result<attestation_summary> attestation_aggregator::summarize(
    const evidence_id_t id) const {
  auto count = store_.get_attestation_count(id);
  if (!count.ok()) {
    return forward_error<attestation_summary>(count);
  }
  auto summary = attestation_summary{.total = *count.value, .confirmed = 0};
  for (uint64_t index = 0; index < summary.total; ++index) {
    auto attestation = store_.get_attestation(id, index);
    if (!attestation.ok()) {
      return forward_error<attestation_summary>(attestation);
    }
    if (attestation.value->verified) {
      summary.confirmed += 1;
    }
  }
  return make_ok(summary);
}

}  // namespace custodia::attestation

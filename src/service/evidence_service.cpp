#include <spdlog/spdlog.h>
#include <custodia/actions/action_registry.hpp>
#include <custodia/fingerprint/fingerprint.hpp>
#include <custodia/service/evidence_service.hpp>
#include <iterator>
#include <utility>

using namespace custodia::schema;

namespace custodia::service {

evidence_service::evidence_service(
    custodia::ledger::ledger_store& store,
    custodia::policy::custody_policy_validator& validator,
    custodia::verification::verification_engine& engine,
    custodia::attestation::attestation_aggregator& aggregator,
    custodia::tamper::tamper_ledger& tamper,
    custodia::common::clock_fn_t clock)
    : store_{store},
      validator_{validator},
      engine_{engine},
      aggregator_{aggregator},
      clock_{std::move(clock)} {
  store_.add_listener(tamper.listener());
}

operation_result<evidence_id_t> evidence_service::register_evidence(
    const bytes_view_t& raw,
    const std::string& case_id,
    const identity_t& collector) {
  return register_evidence(custodia::fingerprint::digest(raw), case_id,
                           collector);
}

operation_result<evidence_id_t> evidence_service::register_evidence(
    const hash32_t& fingerprint,
    const std::string& case_id,
    const identity_t& collector) {
  auto registered = store_.register_evidence(fingerprint, case_id, collector);
  if (registered.ok()) {
    auto guard = lock_evidence(*registered.value);
    // A concurrent action on the new id may have synced from the log first.
    if (!validator_.current_step(*registered.value)) {
      // The automatic COLLECTED event opens the lifecycle; it is never gated.
      validator_.validate(*registered.value, custodia::actions::kCollected,
                          collector);
    }
  }
  return registered;
}

operation_result<custody_receipt> evidence_service::record_violation(
    const evidence_id_t id,
    const identity_t& handler,
    const error_code_t violation,
    const std::string& detail) {
  auto metadata = custodia::fingerprint::digest_structured(
      nlohmann::json{{"violationType", std::string{to_string(violation)}},
                     {"details", detail},
                     {"timestamp", clock_()}});
  if (!metadata.ok()) {
    return forward_error<custody_receipt>(metadata);
  }
  auto appended =
      store_.append_violation(id, handler, violation, detail, *metadata.value);
  if (!appended.ok()) {
    return forward_error<custody_receipt>(appended);
  }
  return operation_result<custody_receipt>{
      .code = violation,
      .detail = detail,
      .value = custody_receipt{
          .evidence_id = id,
          .event_index = *appended.value,
          .action = std::string{custodia::actions::kViolation},
          .metadata_hash = *metadata.value}};
}

operation_result<custody_receipt> evidence_service::log_custody_action(
    const evidence_id_t id,
    const std::string& action,
    const identity_t& handler,
    const std::optional<nlohmann::json>& details) {
  if (action.empty()) {
    return make_error<custody_receipt>(error_code_t::invalid_input,
                                       "action must not be empty");
  }
  if (action == custodia::actions::kViolation) {
    return make_error<custody_receipt>(
        error_code_t::invalid_input,
        "VIOLATION events are recorded by the ledger only");
  }
  if (handler.empty()) {
    return make_error<custody_receipt>(error_code_t::invalid_input,
                                       "handler identity must not be empty");
  }
  auto evidence = store_.get_evidence(id);
  if (!evidence.ok()) {
    return forward_error<custody_receipt>(evidence);
  }

  auto metadata = make_zero_hash();
  if (details) {
    auto digested = custodia::fingerprint::digest_structured(*details);
    if (!digested.ok()) {
      return forward_error<custody_receipt>(digested);
    }
    metadata = *digested.value;
  }

  auto guard = lock_evidence(id);
  if (!validator_.current_step(id)) {
    restore_policy_state(id);
  }
  auto decision = validator_.validate(
      id, action, handler, details.value_or(nlohmann::json::object()));
  if (!decision.accepted()) {
    return record_violation(id, handler, decision.code, decision.detail);
  }

  auto appended = store_.append_custody_event(
      id, custodia::actions::action_fingerprint(action), handler, metadata);
  if (!appended.ok()) {
    // Nothing was written; resync the step the validator already advanced.
    restore_policy_state(id);
    return forward_error<custody_receipt>(appended);
  }
  return make_ok(custody_receipt{.evidence_id = id,
                                 .event_index = *appended.value,
                                 .action = action,
                                 .metadata_hash = metadata});
}

operation_result<verification_outcome_t> evidence_service::verify(
    const evidence_id_t id,
    const custodia::verification::verification_input_t& input,
    const identity_t& verifier) {
  auto guard = lock_evidence(id);
  auto outcome = engine_.verify(id, input, verifier);
  if (outcome.ok() && outcome.value->passed) {
    validator_.observe(id, custodia::actions::kVerified, verifier, clock_());
  }
  return outcome;
}

operation_result<bool> evidence_service::register_verifier(
    const identity_t& verifier) {
  return aggregator_.register_verifier(verifier);
}

operation_result<uint64_t> evidence_service::attest(
    const evidence_id_t id,
    const identity_t& verifier,
    const bool verified) {
  auto guard = lock_evidence(id);
  auto attested = aggregator_.attest(id, verifier, verified);
  if (attested.code == error_code_t::not_registered_verifier &&
      !verifier.empty() && store_.get_evidence(id).ok()) {
    auto recorded = record_violation(id, verifier, attested.code,
                                     attested.detail);
    if (!recorded.value) {
      spdlog::error("Failed to record attestation violation on evidence {}: "
                    "{}",
                    id, recorded.detail);
    }
  }
  return attested;
}

operation_result<std::vector<custody_history_entry>>
evidence_service::custody_history(const evidence_id_t id) const {
  auto events = store_.custody_events(id);
  if (!events.ok()) {
    return forward_error<std::vector<custody_history_entry>>(events);
  }
  const auto& policy = validator_.policy();
  auto vocabulary = policy.required_order;
  vocabulary.insert(std::end(vocabulary), std::begin(policy.allowed_skips),
                    std::end(policy.allowed_skips));

  auto out = std::vector<custody_history_entry>{};
  out.reserve(events.value->size());
  for (auto& event : *events.value) {
    auto name = custodia::actions::action_name(event.action, vocabulary);
    out.push_back(custody_history_entry{.event = std::move(event),
                                        .action_name = std::move(name)});
  }
  return make_ok(std::move(out));
}

void evidence_service::restore_policy_state(const evidence_id_t id) {
  auto events = store_.custody_events(id);
  if (!events.ok()) {
    spdlog::error("Cannot restore policy state of evidence {}: {}", id,
                  events.detail);
    return;
  }
  validator_.restore(id, *events.value);
}

void evidence_service::restore_policy_state() {
  auto count = store_.get_evidence_count();
  for (evidence_id_t id = 1; id <= count; ++id) {
    auto guard = lock_evidence(id);
    restore_policy_state(id);
  }
  spdlog::info("Restored custody policy state for {} evidence item(s)", count);
}

std::unique_lock<std::mutex> evidence_service::lock_evidence(
    const evidence_id_t id) {
  auto* mutex = static_cast<std::mutex*>(nullptr);
  {
    auto lock = std::scoped_lock{evidence_locks_mutex_};
    auto& slot = evidence_locks_[id];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    mutex = slot.get();
  }
  return std::unique_lock{*mutex};
}

}  // namespace custodia::service

#include <spdlog/spdlog.h>
#include <custodia/common/critical.hpp>
#include <custodia/schema/key/ledger_keys.hpp>
#include <custodia/tamper/tamper_ledger.hpp>
#include <utility>

using namespace custodia::schema;

namespace custodia::tamper {

tamper_ledger::tamper_ledger(custodia::ledger::ledger_store::encoder_t& encoder,
                             custodia::ledger::ledger_store::storage_t& storage,
                             custodia::common::clock_fn_t clock)
    : encoder_{encoder}, storage_{storage}, clock_{std::move(clock)} {
  auto lock = std::scoped_lock{mutex_};
  count_ =
      storage_.get<uint64_t>(encoder_, key::make_tamper_sequence_key(encoder_))
          .value_or(0);
}

operation_result<tamper_event_record_t> tamper_ledger::record(
    const evidence_id_t evidence_id,
    const tamper_source_t source,
    const std::string& reason,
    const uint8_t risk_score) {
  if (reason.empty()) {
    return make_error<tamper_event_record_t>(error_code_t::invalid_input,
                                             "tamper reason must not be empty");
  }
  if (risk_score > 100) {
    return make_error<tamper_event_record_t>(
        error_code_t::invalid_input,
        "risk score " + std::to_string(risk_score) + " exceeds 100");
  }

  auto lock = std::scoped_lock{mutex_};
  auto event = tamper_event_record_t{.id = count_ + 1,
                                     .evidence_id = evidence_id,
                                     .detected_by = source,
                                     .reason = reason,
                                     .risk_score = risk_score,
                                     .recorded_at = clock_()};
  auto entries = std::vector<custodia::storage::key_value_entry_t>{
      {key::make_tamper_key(encoder_, event.id), encoder_.encode(event)},
      {key::make_tamper_sequence_key(encoder_), encoder_.encode(event.id)}};
  if (!storage_.commit(entries)) {
    return make_error<tamper_event_record_t>(error_code_t::commit_failed,
                                             "tamper event did not commit");
  }
  count_ = event.id;
  spdlog::warn("Tamper event {} on evidence {} from {} (risk {}): {}",
               event.id, evidence_id, to_string(source), risk_score, reason);
  return make_ok(std::move(event));
}

std::vector<tamper_event_record_t> tamper_ledger::events_for(
    const evidence_id_t evidence_id) const {
  auto out = all_events();
  std::erase_if(out, [&](const auto& event) {
    return event.evidence_id != evidence_id;
  });
  return out;
}

std::vector<tamper_event_record_t> tamper_ledger::all_events() const {
  auto count = uint64_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    count = count_;
  }
  auto out = std::vector<tamper_event_record_t>{};
  out.reserve(count);
  for (uint64_t id = 1; id <= count; ++id) {
    auto event = storage_.get<tamper_event_record_t>(
        encoder_, key::make_tamper_key(encoder_, id));
    if (!event) {
      custodia::common::critical("tamper ledger is missing event {}", id);
    }
    out.push_back(std::move(*event));
  }
  return out;
}

custodia::ledger::notification_listener_t tamper_ledger::listener() {
  return [this](const ledger_event_record_t& event) {
    if (event.type != ledger_event_type_t::tamper_detected) {
      return;
    }
    auto expected = event.fingerprint.value_or(make_zero_hash());
    auto submitted = event.submitted_fingerprint.value_or(make_zero_hash());
    auto recorded =
        record(event.evidence_id, tamper_source_t::verification,
               "Hash mismatch. Expected: " + to_fingerprint_string(expected) +
                   ", Submitted: " + to_fingerprint_string(submitted),
               kVerificationMismatchRisk);
    if (!recorded.ok()) {
      spdlog::error(
          "Failed to record tamper event for evidence {} (sequence {}): {} {}",
          event.evidence_id, event.sequence, to_string(recorded.code),
          recorded.detail);
    }
  };
}

}  // namespace custodia::tamper

#include <spdlog/spdlog.h>
#include <algorithm>
#include <custodia/actions/action_registry.hpp>
#include <custodia/blake3/hash.hpp>
#include <custodia/common/critical.hpp>
#include <custodia/ledger/ledger_store.hpp>
#include <custodia/schema/key/ledger_keys.hpp>
#include <iterator>
#include <utility>

using namespace custodia::schema;

namespace {

std::string evidence_not_found(const evidence_id_t id) {
  return "evidence " + std::to_string(id) + " not found";
}

}  // namespace

namespace custodia::ledger {

ledger_store::ledger_store(encoder_t& encoder,
                           storage_t& storage,
                           custodia::common::clock_fn_t clock)
    : encoder_{encoder}, storage_{storage}, clock_{std::move(clock)} {
  auto lock = std::scoped_lock{mutex_};
  evidence_count_ =
      storage_.get<uint64_t>(encoder_, key::make_evidence_sequence_key(encoder_))
          .value_or(0);
  if (auto committed = storage_.load_committed_state()) {
    head_ = *committed;
  } else {
    head_ = custodia::storage::committed_state{.sequence = 0,
                                               .log_root = make_zero_hash()};
  }
  spdlog::info("Evidence ledger ready: {} evidence item(s), log sequence {}",
               evidence_count_, head_.sequence);
}

template <typename T>
void ledger_store::stage(pending_commit& pending,
                         const bytes_t& key,
                         const T& value) {
  pending.entries.emplace_back(key, encoder_.encode(value));
}

void ledger_store::stage_event(pending_commit& pending,
                               ledger_event_record_t event,
                               const timestamp_milliseconds_t now) {
  event.sequence = head_.sequence + pending.events.size() + 1;
  event.recorded_at = now;
  pending.events.push_back(std::move(event));
}

bool ledger_store::commit_locked(pending_commit& pending) {
  auto root = head_.log_root;
  for (const auto& event : pending.events) {
    auto encoded = encoder_.encode(event);
    root = custodia::blake3::fold_log_root(
        root, bytes_view_t{encoded.data(), encoded.size()});
    pending.entries.emplace_back(key::make_event_key(encoder_, event.sequence),
                                 std::move(encoded));
  }
  auto next = custodia::storage::committed_state{
      .sequence = head_.sequence + pending.events.size(), .log_root = root};
  if (!storage_.commit(pending.entries, next)) {
    return false;
  }
  head_ = next;
  return true;
}

void ledger_store::notify(
    const std::vector<ledger_event_record_t>& events,
    const std::vector<notification_listener_t>& listeners) const {
  for (const auto& event : events) {
    for (const auto& listener : listeners) {
      try {
        listener(event);
      } catch (const std::exception& ex) {
        spdlog::error("Notification {} at sequence {} not delivered: {}",
                      to_string(event.type), event.sequence, ex.what());
      }
    }
  }
}

std::optional<evidence_record_t> ledger_store::load_evidence(
    const evidence_id_t id) const {
  auto evidence =
      storage_.get<evidence_record_t>(encoder_, key::make_evidence_key(encoder_, id));
  if (!evidence || evidence->status == evidence_status_t::unset) {
    return std::nullopt;
  }
  return evidence;
}

operation_result<evidence_id_t> ledger_store::register_evidence(
    const hash32_t& fingerprint,
    const std::string& case_id,
    const identity_t& collector) {
  if (is_zero_hash(fingerprint)) {
    return make_error<evidence_id_t>(error_code_t::invalid_fingerprint,
                                     "fingerprint must not be the zero value");
  }
  if (case_id.empty()) {
    return make_error<evidence_id_t>(error_code_t::invalid_case_id,
                                     "case id must not be empty");
  }
  if (collector.empty()) {
    return make_error<evidence_id_t>(error_code_t::invalid_input,
                                     "collector identity must not be empty");
  }

  auto id = evidence_id_t{};
  auto committed = std::vector<ledger_event_record_t>{};
  auto listeners = std::vector<notification_listener_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto fingerprint_key = key::make_fingerprint_key(encoder_, fingerprint);
    if (storage_.contains(fingerprint_key)) {
      spdlog::warn("Rejected registration of duplicate fingerprint {}",
                   to_fingerprint_string(fingerprint));
      return make_error<evidence_id_t>(
          error_code_t::duplicate_fingerprint,
          "fingerprint " + to_fingerprint_string(fingerprint) +
              " is already registered");
    }

    auto now = clock_();
    id = evidence_count_ + 1;
    auto evidence = evidence_record_t{.id = id,
                                      .fingerprint = fingerprint,
                                      .case_id = case_id,
                                      .collector = collector,
                                      .registered_at = now,
                                      .status = evidence_status_t::registered,
                                      .custody_event_count = 1};
    auto collected = custody_event_record_t{
        .evidence_id = id,
        .index = 0,
        .handler = collector,
        .action = custodia::actions::action_fingerprint(
            custodia::actions::kCollected),
        .timestamp = now,
        .metadata_hash = make_zero_hash()};

    auto pending = pending_commit{};
    stage(pending, key::make_evidence_key(encoder_, id), evidence);
    stage(pending, fingerprint_key, id);
    stage(pending, key::make_custody_event_key(encoder_, id, 0), collected);
    stage(pending, key::make_evidence_sequence_key(encoder_), id);
    stage_event(pending,
                ledger_event_record_t{.type =
                                          ledger_event_type_t::evidence_registered,
                                      .evidence_id = id,
                                      .actor = collector,
                                      .fingerprint = fingerprint,
                                      .detail = case_id},
                now);
    stage_event(pending,
                ledger_event_record_t{
                    .type = ledger_event_type_t::custody_event_logged,
                    .evidence_id = id,
                    .actor = collector,
                    .action = collected.action,
                    .event_index = collected.index,
                    .metadata_hash = collected.metadata_hash},
                now);
    if (!commit_locked(pending)) {
      return make_error<evidence_id_t>(error_code_t::commit_failed,
                                       "evidence registration did not commit");
    }
    evidence_count_ = id;
    committed = std::move(pending.events);
    listeners = listeners_;
  }

  spdlog::info("Registered evidence {} for case '{}' with fingerprint {}", id,
               case_id, to_fingerprint_string(fingerprint));
  notify(committed, listeners);
  return make_ok(id);
}

operation_result<uint64_t> ledger_store::append_custody_event(
    const evidence_id_t id,
    const hash32_t& action,
    const identity_t& handler,
    const std::optional<hash32_t>& metadata_hash) {
  if (is_zero_hash(action)) {
    return make_error<uint64_t>(error_code_t::invalid_input,
                                "action must not be the zero value");
  }
  if (handler.empty()) {
    return make_error<uint64_t>(error_code_t::invalid_input,
                                "handler identity must not be empty");
  }

  auto index = uint64_t{};
  auto committed = std::vector<ledger_event_record_t>{};
  auto listeners = std::vector<notification_listener_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto evidence = load_evidence(id);
    if (!evidence) {
      return make_error<uint64_t>(error_code_t::evidence_not_found,
                                  evidence_not_found(id));
    }

    auto now = clock_();
    index = evidence->custody_event_count;
    auto event = custody_event_record_t{
        .evidence_id = id,
        .index = index,
        .handler = handler,
        .action = action,
        .timestamp = now,
        .metadata_hash = metadata_hash.value_or(make_zero_hash())};
    evidence->custody_event_count += 1;

    auto pending = pending_commit{};
    stage(pending, key::make_evidence_key(encoder_, id), *evidence);
    stage(pending, key::make_custody_event_key(encoder_, id, index), event);
    stage_event(pending,
                ledger_event_record_t{
                    .type = ledger_event_type_t::custody_event_logged,
                    .evidence_id = id,
                    .actor = handler,
                    .action = action,
                    .event_index = index,
                    .metadata_hash = event.metadata_hash},
                now);
    if (!commit_locked(pending)) {
      return make_error<uint64_t>(error_code_t::commit_failed,
                                  "custody event did not commit");
    }
    committed = std::move(pending.events);
    listeners = listeners_;
  }

  spdlog::info("Logged custody event {} '{}' on evidence {} by '{}'", index,
               custodia::actions::action_name(action), id, handler);
  notify(committed, listeners);
  return make_ok(index);
}

operation_result<uint64_t> ledger_store::append_violation(
    const evidence_id_t id,
    const identity_t& handler,
    const error_code_t violation,
    const std::string& detail,
    const hash32_t& metadata_hash) {
  if (!is_policy_violation(violation)) {
    return make_error<uint64_t>(
        error_code_t::invalid_input,
        std::string{to_string(violation)} + " is not a policy violation");
  }
  if (handler.empty()) {
    return make_error<uint64_t>(error_code_t::invalid_input,
                                "handler identity must not be empty");
  }

  auto index = uint64_t{};
  auto committed = std::vector<ledger_event_record_t>{};
  auto listeners = std::vector<notification_listener_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto evidence = load_evidence(id);
    if (!evidence) {
      return make_error<uint64_t>(error_code_t::evidence_not_found,
                                  evidence_not_found(id));
    }

    auto now = clock_();
    index = evidence->custody_event_count;
    auto event = custody_event_record_t{
        .evidence_id = id,
        .index = index,
        .handler = handler,
        .action = custodia::actions::action_fingerprint(
            custodia::actions::kViolation),
        .timestamp = now,
        .metadata_hash = metadata_hash};
    evidence->custody_event_count += 1;

    auto pending = pending_commit{};
    stage(pending, key::make_evidence_key(encoder_, id), *evidence);
    stage(pending, key::make_custody_event_key(encoder_, id, index), event);
    stage_event(pending,
                ledger_event_record_t{
                    .type = ledger_event_type_t::custody_event_logged,
                    .evidence_id = id,
                    .actor = handler,
                    .action = event.action,
                    .event_index = index,
                    .metadata_hash = metadata_hash},
                now);
    stage_event(pending,
                ledger_event_record_t{
                    .type = ledger_event_type_t::policy_violation,
                    .evidence_id = id,
                    .actor = handler,
                    .event_index = index,
                    .metadata_hash = metadata_hash,
                    .detail = std::string{to_string(violation)} + ": " + detail},
                now);
    if (!commit_locked(pending)) {
      return make_error<uint64_t>(error_code_t::commit_failed,
                                  "violation record did not commit");
    }
    committed = std::move(pending.events);
    listeners = listeners_;
  }

  spdlog::warn("Recorded {} on evidence {} by '{}' at index {}: {}",
               to_string(violation), id, handler, index, detail);
  notify(committed, listeners);
  return make_ok(index);
}

operation_result<verification_outcome_t> ledger_store::record_verification(
    const evidence_id_t id,
    const hash32_t& submitted,
    const identity_t& verifier) {
  if (verifier.empty()) {
    return make_error<verification_outcome_t>(
        error_code_t::invalid_input, "verifier identity must not be empty");
  }

  auto outcome = verification_outcome_t{};
  auto committed = std::vector<ledger_event_record_t>{};
  auto listeners = std::vector<notification_listener_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto evidence = load_evidence(id);
    if (!evidence) {
      return make_error<verification_outcome_t>(
          error_code_t::evidence_not_found, evidence_not_found(id));
    }
    if (is_zero_hash(submitted)) {
      return make_error<verification_outcome_t>(
          error_code_t::invalid_fingerprint,
          "submitted fingerprint must not be the zero value");
    }

    auto now = clock_();
    auto pending = pending_commit{};
    outcome.evidence_id = id;
    outcome.expected_fingerprint = evidence->fingerprint;
    outcome.submitted_fingerprint = submitted;
    outcome.passed = evidence->fingerprint == submitted;

    if (outcome.passed) {
      auto index = evidence->custody_event_count;
      auto event = custody_event_record_t{
          .evidence_id = id,
          .index = index,
          .handler = verifier,
          .action = custodia::actions::action_fingerprint(
              custodia::actions::kVerified),
          .timestamp = now,
          .metadata_hash = submitted};
      evidence->status = evidence_status_t::verified;
      evidence->custody_event_count += 1;
      outcome.event_index = index;

      stage(pending, key::make_custody_event_key(encoder_, id, index), event);
      stage_event(pending,
                  ledger_event_record_t{
                      .type = ledger_event_type_t::custody_event_logged,
                      .evidence_id = id,
                      .actor = verifier,
                      .action = event.action,
                      .event_index = index,
                      .metadata_hash = submitted},
                  now);
      stage_event(pending,
                  ledger_event_record_t{
                      .type = ledger_event_type_t::verification_passed,
                      .evidence_id = id,
                      .actor = verifier,
                      .fingerprint = submitted},
                  now);
    } else {
      evidence->status = evidence_status_t::flagged;
      stage_event(pending,
                  ledger_event_record_t{
                      .type = ledger_event_type_t::tamper_detected,
                      .evidence_id = id,
                      .actor = verifier,
                      .fingerprint = evidence->fingerprint,
                      .submitted_fingerprint = submitted},
                  now);
    }
    stage(pending, key::make_evidence_key(encoder_, id), *evidence);

    if (!commit_locked(pending)) {
      return make_error<verification_outcome_t>(
          error_code_t::commit_failed, "verification outcome did not commit");
    }
    outcome.status = evidence->status;
    outcome.sequence = pending.events.back().sequence;
    committed = std::move(pending.events);
    listeners = listeners_;
  }

  if (outcome.passed) {
    spdlog::info("Verification of evidence {} by '{}' passed", id, verifier);
  } else {
    spdlog::warn(
        "Tamper detected on evidence {} by '{}': expected {}, submitted {}", id,
        verifier, to_fingerprint_string(outcome.expected_fingerprint),
        to_fingerprint_string(outcome.submitted_fingerprint));
  }
  notify(committed, listeners);
  return make_ok(std::move(outcome));
}

operation_result<uint64_t> ledger_store::append_attestation(
    const evidence_id_t id,
    const identity_t& verifier,
    const bool verified) {
  if (verifier.empty()) {
    return make_error<uint64_t>(error_code_t::invalid_input,
                                "verifier identity must not be empty");
  }

  auto index = uint64_t{};
  auto committed = std::vector<ledger_event_record_t>{};
  auto listeners = std::vector<notification_listener_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (!load_evidence(id)) {
      return make_error<uint64_t>(error_code_t::evidence_not_found,
                                  evidence_not_found(id));
    }
    auto attester_key = key::make_attester_key(encoder_, id, verifier);
    if (storage_.contains(attester_key)) {
      spdlog::warn("Rejected repeat attestation by '{}' on evidence {}",
                   verifier, id);
      return make_error<uint64_t>(error_code_t::duplicate_attestation,
                                  "verifier '" + verifier +
                                      "' already attested evidence " +
                                      std::to_string(id));
    }

    auto now = clock_();
    auto count_key = key::make_attestation_count_key(encoder_, id);
    index = storage_.get<uint64_t>(encoder_, count_key).value_or(0);
    auto attestation = attestation_record_t{.evidence_id = id,
                                            .index = index,
                                            .verifier = verifier,
                                            .verified = verified,
                                            .timestamp = now};

    auto pending = pending_commit{};
    stage(pending, key::make_attestation_key(encoder_, id, index), attestation);
    stage(pending, attester_key, index);
    stage(pending, count_key, index + 1);
    stage_event(pending,
                ledger_event_record_t{
                    .type = ledger_event_type_t::verification_attested,
                    .evidence_id = id,
                    .actor = verifier,
                    .event_index = index,
                    .verified = verified},
                now);
    if (!commit_locked(pending)) {
      return make_error<uint64_t>(error_code_t::commit_failed,
                                  "attestation did not commit");
    }
    committed = std::move(pending.events);
    listeners = listeners_;
  }

  spdlog::info("Attestation {} on evidence {} by '{}': {}", index, id,
               verifier, verified ? "verified" : "rejected");
  notify(committed, listeners);
  return make_ok(index);
}

operation_result<evidence_record_t> ledger_store::get_evidence(
    const evidence_id_t id) const {
  auto evidence = load_evidence(id);
  if (!evidence) {
    return make_error<evidence_record_t>(error_code_t::evidence_not_found,
                                         evidence_not_found(id));
  }
  return make_ok(std::move(*evidence));
}

operation_result<custody_event_record_t> ledger_store::get_custody_event(
    const evidence_id_t id,
    const uint64_t index) const {
  auto evidence = load_evidence(id);
  if (!evidence) {
    return make_error<custody_event_record_t>(error_code_t::evidence_not_found,
                                              evidence_not_found(id));
  }
  if (index >= evidence->custody_event_count) {
    return make_error<custody_event_record_t>(
        error_code_t::index_out_of_bounds,
        "custody event " + std::to_string(index) + " out of bounds for evidence " +
            std::to_string(id) + " (" +
            std::to_string(evidence->custody_event_count) + " events)");
  }
  auto event = storage_.get<custody_event_record_t>(
      encoder_, key::make_custody_event_key(encoder_, id, index));
  if (!event) {
    custodia::common::critical(
        "custody log of evidence {} is missing event {}", id, index);
  }
  return make_ok(std::move(*event));
}

operation_result<uint64_t> ledger_store::get_custody_event_count(
    const evidence_id_t id) const {
  auto evidence = load_evidence(id);
  if (!evidence) {
    return make_error<uint64_t>(error_code_t::evidence_not_found,
                                evidence_not_found(id));
  }
  return make_ok(evidence->custody_event_count);
}

operation_result<std::vector<custody_event_record_t>>
ledger_store::custody_events(const evidence_id_t id) const {
  auto evidence = load_evidence(id);
  if (!evidence) {
    return make_error<std::vector<custody_event_record_t>>(
        error_code_t::evidence_not_found, evidence_not_found(id));
  }
  auto out = std::vector<custody_event_record_t>{};
  out.reserve(evidence->custody_event_count);
  for (uint64_t index = 0; index < evidence->custody_event_count; ++index) {
    auto event = storage_.get<custody_event_record_t>(
        encoder_, key::make_custody_event_key(encoder_, id, index));
    if (!event) {
      custodia::common::critical(
          "custody log of evidence {} is missing event {}", id, index);
    }
    out.push_back(std::move(*event));
  }
  return make_ok(std::move(out));
}

operation_result<bool> ledger_store::is_fingerprint_registered(
    const hash32_t& fingerprint) const {
  if (is_zero_hash(fingerprint)) {
    return make_error<bool>(error_code_t::invalid_fingerprint,
                            "fingerprint must not be zero");
  }
  return make_ok(
      storage_.contains(key::make_fingerprint_key(encoder_, fingerprint)));
}

uint64_t ledger_store::get_evidence_count() const {
  auto lock = std::scoped_lock{mutex_};
  return evidence_count_;
}

operation_result<uint64_t> ledger_store::get_attestation_count(
    const evidence_id_t id) const {
  if (!load_evidence(id)) {
    return make_error<uint64_t>(error_code_t::evidence_not_found,
                                evidence_not_found(id));
  }
  return make_ok(
      storage_
          .get<uint64_t>(encoder_, key::make_attestation_count_key(encoder_, id))
          .value_or(0));
}

operation_result<attestation_record_t> ledger_store::get_attestation(
    const evidence_id_t id,
    const uint64_t index) const {
  auto count = get_attestation_count(id);
  if (!count.ok()) {
    return forward_error<attestation_record_t>(count);
  }
  if (index >= *count.value) {
    return make_error<attestation_record_t>(
        error_code_t::index_out_of_bounds,
        "attestation " + std::to_string(index) + " out of bounds for evidence " +
            std::to_string(id) + " (" + std::to_string(*count.value) +
            " attestations)");
  }
  auto attestation = storage_.get<attestation_record_t>(
      encoder_, key::make_attestation_key(encoder_, id, index));
  if (!attestation) {
    custodia::common::critical(
        "attestations of evidence {} are missing entry {}", id, index);
  }
  return make_ok(std::move(*attestation));
}

std::vector<ledger_event_record_t> ledger_store::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto last = committed_state().sequence;
  auto out = std::vector<ledger_event_record_t>{};
  for (auto sequence = std::max<uint64_t>(from_sequence, 1);
       sequence <= std::min(to_sequence, last); ++sequence) {
    auto event = storage_.get<ledger_event_record_t>(
        encoder_, key::make_event_key(encoder_, sequence));
    if (!event) {
      custodia::common::critical("notification log is missing sequence {}",
                                 sequence);
    }
    out.push_back(std::move(*event));
  }
  return out;
}

custodia::storage::committed_state ledger_store::committed_state() const {
  auto lock = std::scoped_lock{mutex_};
  return head_;
}

replay_result_t ledger_store::verify_event_log() const {
  auto head = committed_state();
  auto result = replay_result_t{};
  auto root = make_zero_hash();

  for (uint64_t sequence = 1; sequence <= head.sequence; ++sequence) {
    auto event = storage_.get<ledger_event_record_t>(
        encoder_, key::make_event_key(encoder_, sequence));
    if (!event) {
      result.error = "missing event at sequence " + std::to_string(sequence);
      result.log_root = root;
      return result;
    }
    if (event->sequence != sequence) {
      result.error = "event stored at sequence " + std::to_string(sequence) +
                     " claims sequence " + std::to_string(event->sequence);
      result.log_root = root;
      return result;
    }
    auto encoded = encoder_.encode(*event);
    root = custodia::blake3::fold_log_root(
        root, bytes_view_t{encoded.data(), encoded.size()});
    result.event_count += 1;
    result.last_sequence = sequence;
  }

  result.log_root = root;
  auto stored = storage_.list_by_prefix(
      key::make_prefix_key(encoder_, key::kEventPrefix));
  if (stored.size() != head.sequence) {
    result.error = "log holds " + std::to_string(stored.size()) +
                   " events but the committed head is at sequence " +
                   std::to_string(head.sequence);
    spdlog::error("Notification log verification failed: {}", result.error);
    return result;
  }
  result.ok = root == head.log_root;
  if (!result.ok) {
    result.error = "log root mismatch: committed " +
                   to_fingerprint_string(head.log_root) + ", recomputed " +
                   to_fingerprint_string(root);
    spdlog::error("Notification log verification failed: {}", result.error);
  }
  return result;
}

void ledger_store::add_listener(notification_listener_t listener) {
  auto lock = std::scoped_lock{mutex_};
  listeners_.push_back(std::move(listener));
}

}  // namespace custodia::ledger

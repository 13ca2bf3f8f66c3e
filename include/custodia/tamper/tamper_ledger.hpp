#pragma once

#include <custodia/common/clock.hpp>
#include <custodia/ledger/ledger_store.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/tamper_event_record.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace custodia::tamper {

/// Risk assigned to a fingerprint mismatch found by verification.
inline constexpr uint8_t kVerificationMismatchRisk = 100;

/// Append-only list of tamper signals, from verification mismatches and
/// external risk scorers.
class tamper_ledger final {
 public:
  tamper_ledger(custodia::ledger::ledger_store::encoder_t& encoder,
                custodia::ledger::ledger_store::storage_t& storage,
                custodia::common::clock_fn_t clock =
                    custodia::common::system_clock_milliseconds);

  tamper_ledger(const tamper_ledger&) = delete;
  tamper_ledger& operator=(const tamper_ledger&) = delete;

  /// Fails with InvalidInput on an empty reason or a score above 100.
  custodia::schema::operation_result<custodia::schema::tamper_event_record_t>
  record(custodia::schema::evidence_id_t evidence_id,
         custodia::schema::tamper_source_t source,
         const std::string& reason,
         uint8_t risk_score);

  std::vector<custodia::schema::tamper_event_record_t> events_for(
      custodia::schema::evidence_id_t evidence_id) const;

  std::vector<custodia::schema::tamper_event_record_t> all_events() const;

  /// Listener recording every TamperDetected notification. Failures are
  /// logged; the verification that triggered them stays committed.
  custodia::ledger::notification_listener_t listener();

 private:
  mutable std::mutex mutex_;
  custodia::ledger::ledger_store::encoder_t& encoder_;
  custodia::ledger::ledger_store::storage_t& storage_;
  custodia::common::clock_fn_t clock_;
  uint64_t count_{};
};

}  // namespace custodia::tamper

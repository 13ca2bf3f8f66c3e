#pragma once

#include <custodia/common/clock.hpp>
#include <custodia/policy/custody_policy.hpp>
#include <custodia/schema/custody_event_record.hpp>
#include <custodia/schema/error_code.hpp>
#include <custodia/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace custodia::policy {

/// Handler currently holding an evidence item.
struct checkout final {
  custodia::schema::identity_t handler;
  custodia::schema::timestamp_milliseconds_t since{};
};

struct policy_decision final {
  custodia::schema::error_code_t code{custodia::schema::error_code_t::ok};
  std::string detail;

  bool accepted() const { return code == custodia::schema::error_code_t::ok; }
};

/// Gate evaluated before a custody event is appended.
///
/// Tracks the last accepted step and the active checkout per evidence id.
/// This runtime state is a cache over the custody log and can be rebuilt
/// with restore(). Decisions for one evidence id are serialized; different
/// ids never contend beyond the map lookup.
class custody_policy_validator final {
 public:
  explicit custody_policy_validator(
      custody_policy policy = default_custody_policy(),
      custodia::common::clock_fn_t clock =
          custodia::common::system_clock_milliseconds);

  custody_policy_validator(const custody_policy_validator&) = delete;
  custody_policy_validator& operator=(const custody_policy_validator&) =
      delete;

  /// Decide whether `action` may follow the current step. Accepted actions
  /// update the runtime state; rejected ones leave it untouched.
  policy_decision validate(custodia::schema::evidence_id_t id,
                           std::string_view action,
                           const custodia::schema::identity_t& handler,
                           const nlohmann::json& details = nlohmann::json{});

  /// Record an action that bypassed validation (a passing verification).
  void observe(custodia::schema::evidence_id_t id,
               std::string_view action,
               const custodia::schema::identity_t& handler,
               custodia::schema::timestamp_milliseconds_t at);

  void release_checkout(custodia::schema::evidence_id_t id);

  /// Rebuild runtime state for `id` from its custody log. VIOLATION entries
  /// are skipped; names outside the canonical and policy vocabulary replay
  /// as UNKNOWN.
  void restore(custodia::schema::evidence_id_t id,
               const std::vector<custodia::schema::custody_event_record_t>&
                   events);

  std::optional<std::string> current_step(
      custodia::schema::evidence_id_t id) const;
  std::optional<checkout> active_checkout(
      custodia::schema::evidence_id_t id) const;

  const custody_policy& policy() const { return policy_; }

 private:
  struct entry final {
    std::mutex mutex;
    std::optional<std::string> current_step;
    std::optional<checkout> active;
  };

  std::shared_ptr<entry> entry_for(custodia::schema::evidence_id_t id) const;

  /// Order rule; ok when `action` may follow `current_step`.
  policy_decision validate_order(std::string_view current_step,
                                 std::string_view action) const;

  void apply(entry& state,
             std::string_view action,
             const custodia::schema::identity_t& handler,
             custodia::schema::timestamp_milliseconds_t at) const;

  custody_policy policy_;
  custodia::common::clock_fn_t clock_;
  mutable std::mutex entries_mutex_;
  mutable std::unordered_map<custodia::schema::evidence_id_t,
                             std::shared_ptr<entry>>
      entries_;
};

}  // namespace custodia::policy

#include <spdlog/spdlog.h>
#include <algorithm>
#include <custodia/actions/action_registry.hpp>
#include <custodia/policy/custody_policy_validator.hpp>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <utility>

using namespace custodia::schema;

namespace {

constexpr auto kMillisecondsPerHour = 1000.0 * 60.0 * 60.0;

std::ptrdiff_t index_of(const std::vector<std::string>& order,
                        std::string_view name) {
  auto it = std::find(std::begin(order), std::end(order), name);
  if (it == std::end(order)) {
    return -1;
  }
  return std::distance(std::begin(order), it);
}

bool contains(const std::vector<std::string>& names, std::string_view name) {
  return std::find(std::begin(names), std::end(names), name) !=
         std::end(names);
}

bool opens_checkout(std::string_view action) {
  return action == custodia::actions::kAccessed ||
         action == custodia::actions::kTransferred;
}

}  // namespace

namespace custodia::policy {

custody_policy_validator::custody_policy_validator(
    custody_policy policy,
    custodia::common::clock_fn_t clock)
    : policy_{std::move(policy)}, clock_{std::move(clock)} {}

std::shared_ptr<custody_policy_validator::entry>
custody_policy_validator::entry_for(const evidence_id_t id) const {
  auto lock = std::scoped_lock{entries_mutex_};
  auto& slot = entries_[id];
  if (!slot) {
    slot = std::make_shared<entry>();
  }
  return slot;
}

policy_decision custody_policy_validator::validate_order(
    std::string_view current_step,
    std::string_view action) const {
  if (action == current_step) {
    return {};
  }
  const auto& order = policy_.required_order;
  auto next_index = index_of(order, action);
  if (next_index == -1) {
    return {};
  }
  // A current step outside the lifecycle (a custom action) sits at -1, so the
  // whole prefix before `action` counts as skipped.
  auto current_index = index_of(order, current_step);

  if (next_index > current_index + 1) {
    auto invalid = std::vector<std::string>{};
    for (auto i = current_index + 1; i < next_index; ++i) {
      if (!contains(policy_.allowed_skips, order[i])) {
        invalid.push_back(order[i]);
      }
    }
    if (!invalid.empty()) {
      auto detail = std::string{"Cannot skip required steps: "};
      for (std::size_t i = 0; i < invalid.size(); ++i) {
        if (i > 0) {
          detail += ", ";
        }
        detail += invalid[i];
      }
      return {.code = error_code_t::invalid_custody_order,
              .detail = std::move(detail)};
    }
  }

  if (next_index < current_index) {
    return {.code = error_code_t::invalid_custody_order,
            .detail = "Cannot move backward in custody chain"};
  }
  return {};
}

void custody_policy_validator::apply(entry& state,
                                     std::string_view action,
                                     const identity_t& handler,
                                     const timestamp_milliseconds_t at) const {
  state.current_step = std::string{action};
  if (opens_checkout(action)) {
    state.active = checkout{.handler = handler, .since = at};
  }
}

policy_decision custody_policy_validator::validate(
    const evidence_id_t id,
    std::string_view action,
    const identity_t& handler,
    const nlohmann::json& details) {
  auto state = entry_for(id);
  auto lock = std::scoped_lock{state->mutex};
  auto now = clock_();

  auto decision = policy_decision{};
  if (state->current_step) {
    decision = validate_order(*state->current_step, action);

    if (decision.accepted() && policy_.no_parallel_access &&
        action != custodia::actions::kCollected && state->active &&
        state->active->handler != handler) {
      decision = {.code = error_code_t::parallel_access_violation,
                  .detail = "Evidence currently held by " +
                            state->active->handler};
    }

    if (decision.accepted() && state->active) {
      auto held_ms = now > state->active->since ? now - state->active->since
                                                : duration_milliseconds_t{0};
      auto hours_held = static_cast<double>(held_ms) / kMillisecondsPerHour;
      if (hours_held > policy_.max_access_duration_hours) {
        auto detail = std::ostringstream{};
        detail << "Max duration " << policy_.max_access_duration_hours
               << "h exceeded (held " << std::fixed << std::setprecision(1)
               << hours_held << "h)";
        decision = {.code = error_code_t::access_duration_exceeded,
                    .detail = detail.str()};
      }
    }
  }

  if (!decision.accepted()) {
    spdlog::warn("Policy rejected {} on evidence {} by '{}': {} ({}) {}",
                 action, id, handler, to_string(decision.code),
                 decision.detail, details.is_null() ? "{}" : details.dump());
    return decision;
  }

  apply(*state, action, handler, now);
  spdlog::debug("Policy accepted {} on evidence {} by '{}'", action, id,
                handler);
  return decision;
}

void custody_policy_validator::observe(const evidence_id_t id,
                                       std::string_view action,
                                       const identity_t& handler,
                                       const timestamp_milliseconds_t at) {
  auto state = entry_for(id);
  auto lock = std::scoped_lock{state->mutex};
  apply(*state, action, handler, at);
}

void custody_policy_validator::release_checkout(const evidence_id_t id) {
  auto state = entry_for(id);
  auto lock = std::scoped_lock{state->mutex};
  state->active.reset();
}

void custody_policy_validator::restore(
    const evidence_id_t id,
    const std::vector<custody_event_record_t>& events) {
  auto vocabulary = policy_.required_order;
  vocabulary.insert(std::end(vocabulary), std::begin(policy_.allowed_skips),
                    std::end(policy_.allowed_skips));

  auto state = entry_for(id);
  auto lock = std::scoped_lock{state->mutex};
  state->current_step.reset();
  state->active.reset();
  for (const auto& event : events) {
    auto name = custodia::actions::action_name(event.action, vocabulary);
    if (name == custodia::actions::kViolation) {
      continue;
    }
    apply(*state, name, event.handler, event.timestamp);
  }
  spdlog::debug("Restored policy state of evidence {} from {} event(s)", id,
                events.size());
}

std::optional<std::string> custody_policy_validator::current_step(
    const evidence_id_t id) const {
  auto state = entry_for(id);
  auto lock = std::scoped_lock{state->mutex};
  return state->current_step;
}

std::optional<checkout> custody_policy_validator::active_checkout(
    const evidence_id_t id) const {
  auto state = entry_for(id);
  auto lock = std::scoped_lock{state->mutex};
  return state->active;
}

}  // namespace custodia::policy

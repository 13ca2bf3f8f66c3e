#include <gtest/gtest.h>
#include <custodia/actions/action_registry.hpp>
#include <custodia/policy/custody_policy_validator.hpp>
#include <custodia/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using custodia::schema::error_code_t;
using custodia::policy::custody_policy_validator;

constexpr auto kEvidence = custodia::schema::evidence_id_t{1};

custodia::schema::custody_event_record_t make_event(
    const uint64_t index,
    const std::string_view action,
    const std::string& handler,
    const custodia::schema::timestamp_milliseconds_t at) {
  return custodia::schema::custody_event_record_t{
      .evidence_id = kEvidence,
      .index = index,
      .handler = handler,
      .action = custodia::actions::action_fingerprint(action),
      .timestamp = at,
      .metadata_hash = custodia::schema::make_zero_hash()};
}

}  // namespace

TEST(custody_policy_validator, first_action_is_accepted_unconditionally) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};

  EXPECT_FALSE(validator.current_step(kEvidence).has_value());
  EXPECT_TRUE(validator.validate(kEvidence, "ANALYZED", "analyst-1").accepted());
  EXPECT_EQ(validator.current_step(kEvidence), std::optional<std::string>{"ANALYZED"});
}

TEST(custody_policy_validator, skipping_a_required_step_is_rejected) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());

  auto decision = validator.validate(kEvidence, "ANALYZED", "analyst-1",
                                     {{"lab", "north"}});
  EXPECT_EQ(decision.code, error_code_t::invalid_custody_order);
  EXPECT_EQ(decision.detail, "Cannot skip required steps: SEALED");
  EXPECT_EQ(validator.current_step(kEvidence),
            std::optional<std::string>{"COLLECTED"});

  auto jump = validator.validate(kEvidence, "VERIFIED", "analyst-1");
  EXPECT_EQ(jump.detail, "Cannot skip required steps: SEALED, ANALYZED");
}

TEST(custody_policy_validator, full_lifecycle_then_backward_move) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};

  for (auto step : {"COLLECTED", "SEALED", "SEALED", "ANALYZED", "VERIFIED"}) {
    EXPECT_TRUE(validator.validate(kEvidence, step, "officer-1").accepted())
        << step;
  }
  auto backward = validator.validate(kEvidence, "SEALED", "officer-1");
  EXPECT_EQ(backward.code, error_code_t::invalid_custody_order);
  EXPECT_EQ(backward.detail, "Cannot move backward in custody chain");
  EXPECT_EQ(validator.current_step(kEvidence),
            std::optional<std::string>{"VERIFIED"});
}

TEST(custody_policy_validator, allowed_skips_may_be_passed_over) {
  auto clock = custodia::testing::manual_clock{};
  auto policy = custodia::policy::default_custody_policy();
  policy.allowed_skips = {"SEALED"};
  auto validator = custody_policy_validator{policy, clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());

  auto jump = validator.validate(kEvidence, "VERIFIED", "lab-1");
  EXPECT_EQ(jump.detail, "Cannot skip required steps: ANALYZED");
  EXPECT_TRUE(validator.validate(kEvidence, "ANALYZED", "lab-1").accepted());
}

TEST(custody_policy_validator, custom_step_counts_the_whole_prefix_as_skipped) {
  auto clock = custodia::testing::manual_clock{};
  auto policy = custodia::policy::default_custody_policy();
  policy.no_parallel_access = false;
  auto validator = custody_policy_validator{policy, clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());

  EXPECT_TRUE(validator.validate(kEvidence, "PHOTOGRAPHED", "officer-1").accepted());
  auto sealed = validator.validate(kEvidence, "SEALED", "officer-1");
  EXPECT_EQ(sealed.code, error_code_t::invalid_custody_order);
  EXPECT_EQ(sealed.detail, "Cannot skip required steps: COLLECTED");
  EXPECT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());
}

TEST(custody_policy_validator, second_handler_is_blocked_while_checked_out) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());
  ASSERT_TRUE(validator.validate(kEvidence, "ACCESSED", "analyst-1").accepted());

  auto checkout = validator.active_checkout(kEvidence);
  ASSERT_TRUE(checkout.has_value());
  EXPECT_EQ(checkout->handler, "analyst-1");
  EXPECT_EQ(checkout->since, clock.now());

  auto blocked = validator.validate(kEvidence, "TRANSFERRED", "analyst-2");
  EXPECT_EQ(blocked.code, error_code_t::parallel_access_violation);
  EXPECT_EQ(blocked.detail, "Evidence currently held by analyst-1");
  EXPECT_TRUE(validator.validate(kEvidence, "COLLECTED", "analyst-2").accepted());
  EXPECT_TRUE(validator.validate(kEvidence, "SEALED", "analyst-1").accepted());

  validator.release_checkout(kEvidence);
  EXPECT_FALSE(validator.active_checkout(kEvidence).has_value());
  EXPECT_TRUE(validator.validate(kEvidence, "TRANSFERRED", "analyst-2").accepted());
  EXPECT_EQ(validator.active_checkout(kEvidence)->handler, "analyst-2");
}

TEST(custody_policy_validator, parallel_access_can_be_disabled) {
  auto clock = custodia::testing::manual_clock{};
  auto policy = custodia::policy::default_custody_policy();
  policy.no_parallel_access = false;
  auto validator = custody_policy_validator{policy, clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "ACCESSED", "analyst-1").accepted());
  EXPECT_TRUE(validator.validate(kEvidence, "ACCESSED", "analyst-2").accepted());
}

TEST(custody_policy_validator, holding_past_the_limit_is_rejected) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());
  ASSERT_TRUE(validator.validate(kEvidence, "ACCESSED", "analyst-1").accepted());

  clock.advance_hours(47.5);
  EXPECT_TRUE(validator.validate(kEvidence, "ACCESSED", "analyst-1").accepted());

  clock.advance_hours(50.0);
  auto late = validator.validate(kEvidence, "ACCESSED", "analyst-1");
  EXPECT_EQ(late.code, error_code_t::access_duration_exceeded);
  EXPECT_EQ(late.detail, "Max duration 48h exceeded (held 50.0h)");
}

TEST(custody_policy_validator, observe_applies_without_checks) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "officer-1").accepted());

  validator.observe(kEvidence, "VERIFIED", "lab-1", clock.now());
  EXPECT_EQ(validator.current_step(kEvidence),
            std::optional<std::string>{"VERIFIED"});
  EXPECT_FALSE(validator.active_checkout(kEvidence).has_value());
}

TEST(custody_policy_validator, restore_replays_the_custody_log) {
  auto clock = custodia::testing::manual_clock{};
  auto validator = custody_policy_validator{
      custodia::policy::default_custody_policy(), clock.function()};
  ASSERT_TRUE(validator.validate(kEvidence, "COLLECTED", "stale").accepted());

  auto start = clock.now();
  validator.restore(kEvidence, {make_event(0, "COLLECTED", "officer-1", start),
                                make_event(1, "SEALED", "officer-1", start + 10),
                                make_event(2, "ACCESSED", "analyst-1", start + 20),
                                make_event(3, "VIOLATION", "analyst-2", start + 30)});

  EXPECT_EQ(validator.current_step(kEvidence),
            std::optional<std::string>{"ACCESSED"});
  auto checkout = validator.active_checkout(kEvidence);
  ASSERT_TRUE(checkout.has_value());
  EXPECT_EQ(checkout->handler, "analyst-1");
  EXPECT_EQ(checkout->since, start + 20);

  validator.restore(kEvidence, {make_event(0, "COLLECTED", "officer-1", start),
                                make_event(1, "BAGGED", "officer-1", start)});
  EXPECT_EQ(validator.current_step(kEvidence),
            std::optional<std::string>{"UNKNOWN"});
  EXPECT_FALSE(validator.active_checkout(kEvidence).has_value());
}

#include <gtest/gtest.h>
#include <custodia/testing/ledger_fixture.hpp>

#include <string>

namespace {

using custodia::schema::error_code_t;
using custodia::schema::tamper_source_t;

}  // namespace

TEST(tamper_ledger, record_validates_reason_and_risk) {
  auto fixture = custodia::testing::ledger_fixture{"custodia_tamper_record"};
  auto& tamper = fixture.tamper();

  EXPECT_EQ(tamper.record(1, tamper_source_t::risk_scoring, "", 10).code,
            error_code_t::invalid_input);
  EXPECT_EQ(tamper.record(1, tamper_source_t::risk_scoring, "burst", 101).code,
            error_code_t::invalid_input);
  EXPECT_TRUE(tamper.all_events().empty());

  auto recorded =
      tamper.record(1, tamper_source_t::risk_scoring, "access burst", 100);
  ASSERT_TRUE(recorded.ok());
  EXPECT_EQ(recorded.value->id, 1u);
  EXPECT_EQ(recorded.value->risk_score, 100);
  EXPECT_EQ(recorded.value->recorded_at, fixture.clock().now());
}

TEST(tamper_ledger, hash_mismatch_is_recorded_from_notifications) {
  auto fixture = custodia::testing::ledger_fixture{"custodia_tamper_mismatch"};
  auto expected = custodia::schema::make_filled_hash(0xAA);
  auto submitted = custodia::schema::make_filled_hash(0xBB);
  auto id = fixture.service().register_evidence(expected, "CR-2024-TEST",
                                                "officer-1");
  ASSERT_TRUE(id.ok());

  ASSERT_TRUE(fixture.store().record_verification(*id.value, expected, "lab-1").ok());
  EXPECT_TRUE(fixture.tamper().all_events().empty());

  ASSERT_TRUE(fixture.store().record_verification(*id.value, submitted, "lab-1").ok());
  auto events = fixture.tamper().events_for(*id.value);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].detected_by, tamper_source_t::verification);
  EXPECT_EQ(events[0].risk_score, custodia::tamper::kVerificationMismatchRisk);
  EXPECT_EQ(events[0].reason,
            "Hash mismatch. Expected: " +
                custodia::schema::to_fingerprint_string(expected) +
                ", Submitted: " +
                custodia::schema::to_fingerprint_string(submitted));
}

TEST(tamper_ledger, events_are_filtered_per_evidence_and_survive_reopen) {
  auto fixture = custodia::testing::ledger_fixture{"custodia_tamper_filter"};
  auto& tamper = fixture.tamper();
  ASSERT_TRUE(tamper.record(1, tamper_source_t::risk_scoring, "a", 10).ok());
  ASSERT_TRUE(tamper.record(2, tamper_source_t::risk_scoring, "b", 20).ok());
  ASSERT_TRUE(tamper.record(1, tamper_source_t::unknown, "c", 30).ok());

  auto first = tamper.events_for(1);
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].reason, "a");
  EXPECT_EQ(first[1].reason, "c");
  EXPECT_TRUE(tamper.events_for(3).empty());

  auto reopened = custodia::tamper::tamper_ledger{
      fixture.encoder(), fixture.storage(), fixture.clock().function()};
  EXPECT_EQ(reopened.all_events().size(), 3u);
  auto next = reopened.record(2, tamper_source_t::risk_scoring, "d", 5);
  ASSERT_TRUE(next.ok());
  EXPECT_EQ(next.value->id, 4u);
}

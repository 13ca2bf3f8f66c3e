#include <gtest/gtest.h>
#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/schema/error_code.hpp>
#include <custodia/schema/evidence_status.hpp>
#include <custodia/schema/key/ledger_keys.hpp>
#include <custodia/testing/common.hpp>

namespace {

using encoder_t = custodia::schema::encoding::scale_encoder_t;

}  // namespace

TEST(encoding_types, error_codes_render_machine_readable_kinds) {
  using custodia::schema::error_code_t;
  EXPECT_EQ(custodia::schema::to_string(error_code_t::invalid_custody_order),
            "InvalidCustodyOrder");
  EXPECT_EQ(custodia::schema::to_string(error_code_t::duplicate_fingerprint),
            "DuplicateFingerprint");
  EXPECT_EQ(custodia::schema::to_string(error_code_t::commit_failed),
            "CommitFailed");
  EXPECT_EQ(custodia::schema::to_string(static_cast<error_code_t>(999)),
            "Unknown");
  EXPECT_EQ(custodia::schema::try_from_string<error_code_t>(
                "ParallelAccessViolation"),
            error_code_t::parallel_access_violation);
  EXPECT_FALSE(
      custodia::schema::try_from_string<error_code_t>("parallel").has_value());
}

TEST(encoding_types, only_business_rules_are_policy_violations) {
  using custodia::schema::error_code_t;
  EXPECT_TRUE(custodia::schema::is_policy_violation(
      error_code_t::invalid_custody_order));
  EXPECT_TRUE(custodia::schema::is_policy_violation(
      error_code_t::not_registered_verifier));
  EXPECT_FALSE(custodia::schema::is_policy_violation(
      error_code_t::duplicate_attestation));
  EXPECT_FALSE(custodia::schema::is_policy_violation(error_code_t::ok));
}

TEST(encoding_types, evidence_status_names_match_lifecycle) {
  using custodia::schema::evidence_status_t;
  EXPECT_EQ(custodia::schema::to_string(evidence_status_t::flagged), "FLAGGED");
  EXPECT_EQ(
      custodia::schema::try_from_string<evidence_status_t>("VERIFIED"),
      evidence_status_t::verified);
}

TEST(encoding_types, evidence_record_survives_scale_encoding) {
  auto encoder = encoder_t{};
  auto record = custodia::schema::evidence_record_t{
      .id = 7,
      .fingerprint = custodia::testing::make_hash(3),
      .case_id = "CR-2024-TEST",
      .collector = "officer-1",
      .registered_at = 1234,
      .status = custodia::schema::evidence_status_t::flagged,
      .custody_event_count = 4};
  auto encoded = encoder.encode(record);
  auto decoded = encoder.try_decode<custodia::schema::evidence_record_t>(
      custodia::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1u);
  EXPECT_EQ(decoded->id, 7u);
  EXPECT_EQ(decoded->fingerprint, record.fingerprint);
  EXPECT_EQ(decoded->case_id, record.case_id);
  EXPECT_EQ(decoded->status, custodia::schema::evidence_status_t::flagged);
  EXPECT_EQ(decoded->custody_event_count, 4u);
}

TEST(encoding_types, ledger_event_optional_fields_survive_scale_encoding) {
  auto encoder = encoder_t{};
  auto event = custodia::schema::ledger_event_record_t{
      .sequence = 9,
      .type = custodia::schema::ledger_event_type_t::tamper_detected,
      .evidence_id = 2,
      .actor = "verifier-1",
      .fingerprint = custodia::schema::make_filled_hash(0xAA),
      .submitted_fingerprint = custodia::schema::make_filled_hash(0xBB),
      .recorded_at = 55};
  auto decoded = encoder.try_decode<custodia::schema::ledger_event_record_t>(
      custodia::schema::make_bytes_view(encoder.encode(event)));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->type, event.type);
  EXPECT_EQ(decoded->submitted_fingerprint, event.submitted_fingerprint);
  EXPECT_FALSE(decoded->action.has_value());
  EXPECT_FALSE(decoded->verified.has_value());
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(custodia::schema::custody_event_record_t{
      .evidence_id = 1, .handler = "officer-1"});
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<custodia::schema::custody_event_record_t>(
                       custodia::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, keys_are_distinct_across_keyspaces) {
  auto encoder = encoder_t{};
  auto evidence = custodia::schema::key::make_evidence_key(encoder, 1);
  auto count = custodia::schema::key::make_attestation_count_key(encoder, 1);
  auto attester =
      custodia::schema::key::make_attester_key(encoder, 1, std::string{"COUNT"});
  EXPECT_NE(evidence, count);
  EXPECT_NE(count, attester);
  EXPECT_NE(custodia::schema::key::make_custody_event_key(encoder, 1, 2),
            custodia::schema::key::make_custody_event_key(encoder, 2, 1));
}

#include <gtest/gtest.h>
#include <custodia/actions/action_registry.hpp>
#include <custodia/fingerprint/fingerprint.hpp>

TEST(action_registry, fingerprint_is_stable_digest_of_name) {
  EXPECT_EQ(custodia::actions::action_fingerprint("ACCESSED"),
            custodia::actions::action_fingerprint("ACCESSED"));
  EXPECT_EQ(custodia::actions::action_fingerprint("ACCESSED"),
            custodia::fingerprint::digest_string("ACCESSED"));
  EXPECT_NE(custodia::actions::action_fingerprint("ACCESSED"),
            custodia::actions::action_fingerprint("accessed"));
}

TEST(action_registry, canonical_actions_resolve_back_to_names) {
  for (const auto name : custodia::actions::kCanonicalActions) {
    EXPECT_EQ(custodia::actions::action_name(
                  custodia::actions::action_fingerprint(name)),
              name);
  }
}

TEST(action_registry, custom_actions_resolve_to_unknown) {
  EXPECT_EQ(custodia::actions::action_name(
                custodia::actions::action_fingerprint("SEALED")),
            "UNKNOWN");
  EXPECT_EQ(custodia::actions::action_name(custodia::schema::make_zero_hash()),
            "UNKNOWN");
}

TEST(action_registry, extra_vocabulary_resolves_custom_names) {
  auto vocabulary = std::vector<std::string>{"SEALED", "PHOTOGRAPHED"};
  EXPECT_EQ(custodia::actions::action_name(
                custodia::actions::action_fingerprint("SEALED"), vocabulary),
            "SEALED");
  EXPECT_EQ(custodia::actions::action_name(
                custodia::actions::action_fingerprint("COLLECTED"), vocabulary),
            "COLLECTED");
  EXPECT_EQ(custodia::actions::action_name(
                custodia::actions::action_fingerprint("BAGGED"), vocabulary),
            "UNKNOWN");
}

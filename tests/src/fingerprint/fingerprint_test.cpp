#include <gtest/gtest.h>
#include <custodia/fingerprint/fingerprint.hpp>

#include <string>

TEST(fingerprint, digest_is_sha256_of_bytes) {
  auto bytes = custodia::schema::make_bytes(std::string{"abc"});
  EXPECT_EQ(custodia::schema::to_fingerprint_string(
                custodia::fingerprint::digest(
                    custodia::schema::make_bytes_view(bytes))),
            "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(custodia::fingerprint::digest_string("abc"),
            custodia::fingerprint::digest(custodia::schema::make_bytes_view(bytes)));
}

TEST(fingerprint, canonical_form_sorts_keys_and_drops_whitespace) {
  auto value = nlohmann::json::parse(R"({ "b": 2, "a": {"z": true, "y": [1, 2.5]} })");
  auto canonical = custodia::fingerprint::canonicalize(value);
  ASSERT_TRUE(canonical.ok());
  EXPECT_EQ(*canonical.value, R"({"a":{"y":[1,2.5],"z":true},"b":2})");
}

TEST(fingerprint, structured_digest_ignores_insertion_order) {
  auto first = nlohmann::json::object();
  first["violationType"] = "InvalidCustodyOrder";
  first["timestamp"] = 1700000000000u;
  auto second = nlohmann::json::object();
  second["timestamp"] = 1700000000000u;
  second["violationType"] = "InvalidCustodyOrder";

  auto a = custodia::fingerprint::digest_structured(first);
  auto b = custodia::fingerprint::digest_structured(second);
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  EXPECT_EQ(*a.value, *b.value);
  EXPECT_EQ(*a.value,
            custodia::fingerprint::digest_string(
                R"({"timestamp":1700000000000,"violationType":"InvalidCustodyOrder"})"));
}

TEST(fingerprint, non_ascii_text_is_escaped_in_canonical_form) {
  auto canonical =
      custodia::fingerprint::canonicalize(nlohmann::json{{"note", "caf\xC3\xA9"}});
  ASSERT_TRUE(canonical.ok());
  EXPECT_EQ(*canonical.value, R"({"note":"caf\u00e9"})");
}

TEST(fingerprint, null_and_invalid_utf8_are_invalid_input) {
  auto null_result = custodia::fingerprint::digest_structured(nlohmann::json{});
  EXPECT_EQ(null_result.code, custodia::schema::error_code_t::invalid_input);
  EXPECT_FALSE(null_result.value.has_value());

  auto bad_utf8 = custodia::fingerprint::digest_structured(
      nlohmann::json{{"note", std::string{"\xFF\xFE"}}});
  EXPECT_EQ(bad_utf8.code, custodia::schema::error_code_t::invalid_input);
}

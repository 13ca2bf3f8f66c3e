#include <custodia/crypto/sha256.hpp>
#include <custodia/fingerprint/fingerprint.hpp>

namespace custodia::fingerprint {

custodia::schema::hash32_t digest(const custodia::schema::bytes_view_t& bytes) {
  return custodia::crypto::sha256(bytes);
}

custodia::schema::hash32_t digest_string(std::string_view value) {
  return custodia::crypto::sha256(custodia::schema::make_bytes_view(value));
}

custodia::schema::operation_result<std::string> canonicalize(
    const nlohmann::json& value) {
  if (value.is_null() || value.is_discarded()) {
    return custodia::schema::make_error<std::string>(
        custodia::schema::error_code_t::invalid_input,
        "structured metadata must not be null");
  }
  try {
    // nlohmann::json objects are std::map backed, so keys dump sorted.
    return custodia::schema::make_ok(value.dump(-1, ' ', true));
  } catch (const nlohmann::json::type_error& ex) {
    return custodia::schema::make_error<std::string>(
        custodia::schema::error_code_t::invalid_input, ex.what());
  }
}

custodia::schema::operation_result<custodia::schema::hash32_t>
digest_structured(const nlohmann::json& value) {
  auto canonical = canonicalize(value);
  if (!canonical.ok()) {
    return custodia::schema::forward_error<custodia::schema::hash32_t>(
        canonical);
  }
  return custodia::schema::make_ok(digest_string(*canonical.value));
}

}  // namespace custodia::fingerprint

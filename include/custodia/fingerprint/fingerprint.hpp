#pragma once

#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace custodia::fingerprint {

/// SHA-256 of the raw evidence bytes.
custodia::schema::hash32_t digest(const custodia::schema::bytes_view_t& bytes);

/// SHA-256 of the UTF-8 bytes of `value`.
custodia::schema::hash32_t digest_string(std::string_view value);

/// Canonical text of structured metadata: object keys sorted, no
/// insignificant whitespace, non-ASCII escaped, numbers in shortest
/// round-trip form. Fails with InvalidInput on null/discarded values or
/// strings that are not valid UTF-8.
custodia::schema::operation_result<std::string> canonicalize(
    const nlohmann::json& value);

/// SHA-256 of canonicalize(value).
custodia::schema::operation_result<custodia::schema::hash32_t>
digest_structured(const nlohmann::json& value);

}  // namespace custodia::fingerprint

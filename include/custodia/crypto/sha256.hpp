#pragma once

#include <custodia/schema/primitives.hpp>

namespace custodia::crypto {

/// SHA-256 over the given bytes via OpenSSL EVP.
custodia::schema::hash32_t sha256(const custodia::schema::bytes_view_t& bytes);

}  // namespace custodia::crypto

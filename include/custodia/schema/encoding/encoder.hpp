#pragma once
#include <custodia/schema/primitives.hpp>
#include <optional>
#include <span>

namespace custodia::schema::encoding {

// Build-time selection of the wire library: the ledger is written against
// encoder<Tag> and the tag is fixed where the store is instantiated.
template <typename Library>
struct encoder {
  template <typename T>
  custodia::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, custodia::schema::bytes_t& out);

  template <typename T>
  T decode(const custodia::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const custodia::schema::bytes_view_t& bytes);
};

}  // namespace custodia::schema::encoding

#pragma once
#include <custodia/common/critical.hpp>
#include <custodia/schema/attestation_record.hpp>
#include <custodia/schema/custody_event_record.hpp>
#include <custodia/schema/encoding/encoder.hpp>
#include <custodia/schema/encoding/scale/evidence_status.hpp>
#include <custodia/schema/encoding/scale/ledger_event_type.hpp>
#include <custodia/schema/encoding/scale/tamper_source.hpp>
#include <custodia/schema/evidence_record.hpp>
#include <custodia/schema/ledger_event_record.hpp>
#include <custodia/schema/tamper_event_record.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Ledger records are plain aggregates; scale-codec decomposes them field by
// field in declaration order, so field order is part of the persisted format.
namespace custodia::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  custodia::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, custodia::schema::bytes_t& out);

  template <typename T>
  T decode(const custodia::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const custodia::schema::bytes_view_t& bytes);
};

template <typename T>
custodia::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    custodia::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        custodia::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const custodia::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    custodia::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const custodia::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace custodia::schema::encoding

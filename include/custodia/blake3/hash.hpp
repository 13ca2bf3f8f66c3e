#pragma once
#include <custodia/schema/primitives.hpp>
#include <blake3.h>
#include <cstdint>
#include <span>
#include <string_view>

namespace custodia::blake3 {

custodia::schema::hash32_t hash(const std::string_view& str);
custodia::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Incremental hasher; one instance per digest.
class hasher final {
 public:
  hasher();

  hasher& update(const std::span<const uint8_t>& bytes);
  hasher& update(const custodia::schema::hash32_t& bytes);
  custodia::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

/// Folds one committed log entry into the running log root:
/// blake3(previous_root || entry).
custodia::schema::hash32_t fold_log_root(
    const custodia::schema::hash32_t& previous_root,
    const custodia::schema::bytes_view_t& entry);

}  // namespace custodia::blake3

#include <custodia/blake3/hash.hpp>

namespace custodia::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const custodia::schema::hash32_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

custodia::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == 32);
  auto output = custodia::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

custodia::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(custodia::schema::make_bytes_view(str)).finalize();
}

custodia::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

custodia::schema::hash32_t fold_log_root(
    const custodia::schema::hash32_t& previous_root,
    const custodia::schema::bytes_view_t& entry) {
  return hasher{}.update(previous_root).update(entry).finalize();
}

}  // namespace custodia::blake3

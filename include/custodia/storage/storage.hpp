#pragma once
#include <custodia/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace custodia::storage {

using key_value_entry_t =
    std::pair<custodia::schema::bytes_t, custodia::schema::bytes_t>;

/// Head of the notification log persisted alongside every ledger batch.
struct committed_state final {
  uint64_t sequence{};
  custodia::schema::hash32_t log_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const custodia::schema::bytes_view_t& key) const;

  /// True when a value is stored at key.
  bool contains(const custodia::schema::bytes_view_t& key) const;

  /// Load the most recent committed log head (sequence + log_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const custodia::schema::bytes_view_t& prefix) const;

  /// Atomically write all entries, plus the log head when provided.
  ///
  /// Returns false when the write did not commit; nothing is applied then.
  bool commit(const std::vector<key_value_entry_t>& entries,
              const std::optional<committed_state>& state = std::nullopt) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace custodia::storage

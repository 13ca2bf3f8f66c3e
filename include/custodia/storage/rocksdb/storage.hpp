#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <custodia/common/critical.hpp>
#include <custodia/schema/encoding/scale/encoder.hpp>
#include <custodia/storage/storage.hpp>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace custodia::storage {

namespace detail {

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED"};

inline custodia::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const custodia::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const custodia::schema::bytes_view_t& key) const;

  bool contains(const custodia::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const custodia::schema::bytes_view_t& prefix) const;
  bool commit(const std::vector<key_value_entry_t>& entries,
              const std::optional<committed_state>& state = std::nullopt) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const custodia::schema::bytes_view_t& key) const {
  if (!database) {
    custodia::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      custodia::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(custodia::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

inline bool storage<rocksdb_storage_tag>::contains(
    const custodia::schema::bytes_view_t& key) const {
  if (!database) {
    custodia::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to query RocksDB: {}", status.ToString());
    custodia::common::critical("Failed to query RocksDB");
  }
  return true;
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    custodia::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    custodia::common::critical("failed to load committed state");
  }

  auto encoder = custodia::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, custodia::schema::hash32_t>>(
          custodia::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    custodia::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .log_root = std::get<1>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const custodia::schema::bytes_view_t& prefix) const {
  if (!database) {
    custodia::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

inline bool storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const std::optional<committed_state>& state) const {
  if (!database) {
    custodia::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      spdlog::error("Failed staging key in write batch: {}",
                    put_status.ToString());
      return false;
    }
  }

  if (state) {
    auto encoder = custodia::schema::encoding::scale_encoder_t{};
    auto encoded = encoder.encode(std::tuple{state->sequence, state->log_root});
    auto state_status =
        batch.Put(std::string{detail::kCommittedStateKey},
                  detail::to_slice(custodia::schema::bytes_view_t{
                      encoded.data(), encoded.size()}));
    if (!state_status.ok()) {
      spdlog::error("Failed staging committed state: {}",
                    state_status.ToString());
      return false;
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    return false;
  }
  return true;
}

}  // namespace custodia::storage

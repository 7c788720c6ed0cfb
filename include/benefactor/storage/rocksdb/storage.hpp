#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <benefactor/common/critical.hpp>
#include <benefactor/schema/encoding/scale/encoder.hpp>
#include <benefactor/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace benefactor::storage {

namespace detail {

using encoder_t = benefactor::schema::encoding::encoder<
    benefactor::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline benefactor::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const benefactor::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const benefactor::schema::bytes_view_t& key) const;

  std::optional<benefactor::schema::bytes_t> get_raw(
      const benefactor::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const benefactor::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const benefactor::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      benefactor::schema::bytes_view_t{raw->data(), raw->size()})};
}

inline std::optional<benefactor::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const benefactor::schema::bytes_view_t& key) const {
  if (!database) {
    benefactor::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    benefactor::common::critical("Failed to get value from RocksDB");
  }
  return benefactor::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(benefactor::schema::make_bytes_view(
      std::string_view{detail::kCommittedStateKey}));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, benefactor::schema::hash32_t>>(
          benefactor::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    benefactor::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    benefactor::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      benefactor::common::critical("failed staging key in write batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded_state = encoder.encode(std::tuple{state.sequence, state.state_root});
  auto state_status = batch.Put(
      ROCKSDB_NAMESPACE::Slice{detail::kCommittedStateKey.data(),
                               detail::kCommittedStateKey.size()},
      detail::to_slice(encoded_state));
  if (!state_status.ok()) {
    benefactor::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    benefactor::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const benefactor::schema::bytes_view_t& prefix) const {
  if (!database) {
    benefactor::common::critical("RocksDB database is not initialized");
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
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    benefactor::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace benefactor::storage

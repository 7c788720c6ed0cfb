#pragma once

#include <benefactor/schema/encoding/scale/encoder.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace benefactor::execution {

using encoder_t = benefactor::schema::encoding::encoder<
    benefactor::schema::encoding::scale_encoder_tag>;
using storage_t =
    benefactor::storage::storage<benefactor::storage::rocksdb_storage_tag>;

/// Per-transaction write staging over committed storage.
///
/// Reads see staged writes first. Nothing reaches RocksDB until the engine
/// commits `entries()` in one write batch; dropping the overlay discards every
/// staged write.
class state_overlay final {
 public:
  state_overlay(encoder_t& encoder, const storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  state_overlay(const state_overlay&) = delete;
  state_overlay& operator=(const state_overlay&) = delete;

  template <typename T>
  std::optional<T> get(const benefactor::schema::bytes_t& key) const {
    if (auto staged = staged_.find(key); staged != std::end(staged_)) {
      return encoder_.decode<T>(benefactor::schema::bytes_view_t{
          staged->second.data(), staged->second.size()});
    }
    return storage_.get<encoder_t, T>(
        encoder_,
        benefactor::schema::bytes_view_t{key.data(), key.size()});
  }

  template <typename T>
  void put(const benefactor::schema::bytes_t& key, const T& value) {
    staged_[key] = encoder_.encode(value);
  }

  bool contains(const benefactor::schema::bytes_t& key) const {
    return staged_.contains(key) ||
           storage_
               .get_raw(benefactor::schema::bytes_view_t{key.data(),
                                                         key.size()})
               .has_value();
  }

  /// Committed and staged rows under prefix, in key order.
  std::vector<benefactor::storage::key_value_entry_t> list_by_prefix(
      const benefactor::schema::bytes_t& prefix) const {
    auto merged =
        std::map<benefactor::schema::bytes_t, benefactor::schema::bytes_t>{};
    for (auto& [key, value] : storage_.list_by_prefix(
             benefactor::schema::bytes_view_t{prefix.data(), prefix.size()})) {
      merged.insert_or_assign(std::move(key), std::move(value));
    }
    for (auto it = staged_.lower_bound(prefix); it != std::end(staged_);
         ++it) {
      if (it->first.size() < prefix.size() ||
          !std::equal(std::begin(prefix), std::end(prefix),
                      std::begin(it->first))) {
        break;
      }
      merged.insert_or_assign(it->first, it->second);
    }
    return {std::make_move_iterator(std::begin(merged)),
            std::make_move_iterator(std::end(merged))};
  }

  std::vector<benefactor::storage::key_value_entry_t> entries() const {
    return {std::begin(staged_), std::end(staged_)};
  }

  bool empty() const { return staged_.empty(); }

  encoder_t& encoder() const { return encoder_; }

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
  std::map<benefactor::schema::bytes_t, benefactor::schema::bytes_t> staged_;
};

}  // namespace benefactor::execution

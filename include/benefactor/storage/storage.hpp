#pragma once
#include <benefactor/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace benefactor::storage {

using key_value_entry_t =
    std::pair<benefactor::schema::bytes_t, benefactor::schema::bytes_t>;

/// Ledger head persisted together with every applied transaction.
struct committed_state final {
  uint64_t sequence{};
  benefactor::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const benefactor::schema::bytes_view_t& key) const;

  /// Return the raw value at key, or std::nullopt when missing.
  std::optional<benefactor::schema::bytes_t> get_raw(
      const benefactor::schema::bytes_view_t& key) const;

  /// Load the ledger head (last applied sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically write entries together with the new ledger head.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const benefactor::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace benefactor::storage

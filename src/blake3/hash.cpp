#include <blake3.h>
#include <benefactor/blake3/hash.hpp>

namespace benefactor::blake3 {

benefactor::schema::hash32_t fold_state_root(
    const benefactor::schema::hash32_t& previous_root,
    const uint64_t sequence,
    const benefactor::schema::bytes_view_t& tx_bytes) {
  auto ordered = benefactor::schema::make_ordered_id(sequence);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous_root.data(), previous_root.size());
  blake3_hasher_update(&hasher, ordered.data(), ordered.size());
  blake3_hasher_update(&hasher, tx_bytes.data(), tx_bytes.size());
  auto root = benefactor::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, root.data(), root.size());
  return root;
}

}  // namespace benefactor::blake3

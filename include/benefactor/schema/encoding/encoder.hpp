#pragma once
#include <benefactor/schema/primitives.hpp>
#include <optional>
#include <span>

namespace benefactor::schema::encoding {

/// Codec seam for persisted records, keys and transaction bytes.
///
/// The codec is a build time choice: `Library` is a tag type and each codec
/// provides a full specialization. Only SCALE is provided.
template <typename Library>
struct encoder {
  template <typename T>
  benefactor::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, benefactor::schema::bytes_t& out);

  /// Decode or terminate; use for bytes this process wrote itself.
  template <typename T>
  T decode(const benefactor::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes (submitted transactions, query keys).
  template <typename T>
  std::optional<T> try_decode(const benefactor::schema::bytes_view_t& bytes);
};

}  // namespace benefactor::schema::encoding

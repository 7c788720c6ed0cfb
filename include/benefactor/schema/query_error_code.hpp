#pragma once

#include <cstdint>

// Schema type: query error code.
// Donation workflow: read-path failures. Only must-exist routes report
// not_found; list and sentinel routes answer with empty values.
namespace benefactor::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  credential_missing = 4,
};

}  // namespace benefactor::schema

#pragma once

#include <cstdint>

namespace cairn::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  permission_denied = 10,
  accumulator_missing = 11,
  payload_too_large = 12,
  unsupported_write_access = 13,
};

enum class query_error_code : uint32_t {
  invalid_query_data = 1,
  unknown_path = 2,
  accumulator_missing = 3,
  leaf_missing = 4,
  invalid_height = 5,
};

}  // namespace cairn::schema

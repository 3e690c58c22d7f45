#pragma once
#include <cairn/schema/primitives.hpp>
#include <cairn/schema/transaction.hpp>
#include <tuple>

namespace cairn::schema::encoding {

/// Bytes covered by a transaction signature: every field except the
/// signature itself, in declaration order.
template <typename Encoder>
cairn::schema::bytes_t signing_bytes(Encoder& encoder,
                                     const cairn::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace cairn::schema::encoding

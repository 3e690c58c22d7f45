#pragma once

#include <cairn/schema/primitives.hpp>

namespace cairn::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message`. Named signers carry no key material and
/// never verify.
bool verify_signature(const cairn::schema::bytes_view_t& message,
                      const cairn::schema::signer_id_t& signer,
                      const cairn::schema::signature_t& signature);

}  // namespace cairn::crypto

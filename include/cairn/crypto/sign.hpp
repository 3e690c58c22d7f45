#pragma once

#include <cairn/schema/primitives.hpp>
#include <optional>

namespace cairn::crypto {

/// Public key for a raw 32-byte ed25519 seed.
std::optional<cairn::schema::ed25519_signer_id> ed25519_public_key(
    const cairn::schema::ed25519_private_key_t& private_key);

std::optional<cairn::schema::ed25519_signature_t> sign_ed25519(
    const cairn::schema::bytes_view_t& message,
    const cairn::schema::ed25519_private_key_t& private_key);

/// Compressed public key for a secp256k1 secret scalar. Nothing when the
/// scalar is zero or not below the group order.
std::optional<cairn::schema::secp256k1_signer_id> secp256k1_public_key(
    const cairn::schema::secp256k1_private_key_t& private_key);

/// ECDSA over SHA-256 of `message`, laid out as [v || r || s]. The recovery
/// byte is left at 0; signers are identified by their public key.
std::optional<cairn::schema::secp256k1_signature_t> sign_secp256k1(
    const cairn::schema::bytes_view_t& message,
    const cairn::schema::secp256k1_private_key_t& private_key);

}  // namespace cairn::crypto

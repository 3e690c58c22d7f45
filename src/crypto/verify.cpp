#include <cairn/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace cairn::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* digest,
                   const cairn::schema::bytes_view_t& message,
                   const uint8_t* signature,
                   const size_t signature_size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

bool verify_ed25519(const cairn::schema::bytes_view_t& message,
                    const cairn::schema::ed25519_signer_id& signer,
                    const cairn::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), nullptr, message, signature.data(),
                       signature.size());
}

// 65-byte secp256k1 signatures carry a recovery id either in front
// ([v || r || s]) or at the end ([r || s || v]). v is 0..3 or 27 and above.
std::optional<std::array<uint8_t, 64>> compact_secp_signature(
    const cairn::schema::secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  auto out = std::array<uint8_t, 64>{};
  if (is_recovery_id(signature.front())) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (is_recovery_id(signature.back())) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> der_signature(
    const std::array<uint8_t, 64>& compact) {
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!sig || !r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // Ownership of r and s moved into sig.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

evp_pkey_ptr secp256k1_public_key(
    const cairn::schema::secp256k1_signer_id& signer) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }
  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.data()) !=
      1) {
    return none;
  }
  return evp_pkey_ptr{raw, EVP_PKEY_free};
}

bool verify_secp256k1(const cairn::schema::bytes_view_t& message,
                      const cairn::schema::secp256k1_signer_id& signer,
                      const cairn::schema::secp256k1_signature_t& signature) {
  auto compact = compact_secp_signature(signature);
  if (!compact) {
    return false;
  }
  auto der = der_signature(*compact);
  if (!der) {
    return false;
  }
  auto pkey = secp256k1_public_key(signer);
  if (!pkey) {
    return false;
  }
  return digest_verify(pkey.get(), EVP_sha256(), message, der->data(),
                       der->size());
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const cairn::schema::bytes_view_t& message,
                      const cairn::schema::signer_id_t& signer,
                      const cairn::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const cairn::schema::ed25519_signer_id& key) {
            const auto* sig =
                std::get_if<cairn::schema::ed25519_signature_t>(&signature);
            return sig != nullptr && verify_ed25519(message, key, *sig);
          },
          [&](const cairn::schema::secp256k1_signer_id& key) {
            const auto* sig =
                std::get_if<cairn::schema::secp256k1_signature_t>(&signature);
            return sig != nullptr && verify_secp256k1(message, key, *sig);
          },
          [](const cairn::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace cairn::crypto

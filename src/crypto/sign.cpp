#include <cairn/crypto/sign.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <memory>

namespace cairn::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

evp_pkey_ptr ed25519_private(
    const cairn::schema::ed25519_private_key_t& private_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
}

bignum_ptr secp256k1_scalar(
    const EC_GROUP* group,
    const cairn::schema::secp256k1_private_key_t& private_key) {
  auto scalar = bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_free};
  if (!scalar || BN_is_zero(scalar.get()) ||
      BN_cmp(scalar.get(), EC_GROUP_get0_order(group)) >= 0) {
    return bignum_ptr{nullptr, BN_free};
  }
  return scalar;
}

evp_pkey_ptr secp256k1_private(
    const cairn::schema::secp256k1_private_key_t& private_key,
    const cairn::schema::secp256k1_signer_id& public_key) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!group) {
    return none;
  }
  auto scalar = secp256k1_scalar(group.get(), private_key);
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!scalar || !builder) {
    return none;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1",
                                      0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             scalar.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.public_key.data(),
                                       public_key.public_key.size()) != 1) {
    return none;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_KEYPAIR, params.get()) !=
      1) {
    return none;
  }
  return evp_pkey_ptr{raw, EVP_PKEY_free};
}

}  // namespace

std::optional<cairn::schema::ed25519_signer_id> ed25519_public_key(
    const cairn::schema::ed25519_private_key_t& private_key) {
  auto pkey = ed25519_private(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto signer = cairn::schema::ed25519_signer_id{};
  auto size = signer.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), signer.public_key.data(),
                                  &size) != 1 ||
      size != signer.public_key.size()) {
    return std::nullopt;
  }
  return signer;
}

std::optional<cairn::schema::ed25519_signature_t> sign_ed25519(
    const cairn::schema::bytes_view_t& message,
    const cairn::schema::ed25519_private_key_t& private_key) {
  auto pkey = ed25519_private(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = cairn::schema::ed25519_signature_t{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

std::optional<cairn::schema::secp256k1_signer_id> secp256k1_public_key(
    const cairn::schema::secp256k1_private_key_t& private_key) {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!group) {
    return std::nullopt;
  }
  auto scalar = secp256k1_scalar(group.get(), private_key);
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!scalar || !point ||
      EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr, nullptr,
                   nullptr) != 1) {
    return std::nullopt;
  }
  auto signer = cairn::schema::secp256k1_signer_id{};
  if (EC_POINT_point2oct(group.get(), point.get(),
                         POINT_CONVERSION_COMPRESSED, signer.public_key.data(),
                         signer.public_key.size(),
                         nullptr) != signer.public_key.size()) {
    return std::nullopt;
  }
  return signer;
}

std::optional<cairn::schema::secp256k1_signature_t> sign_secp256k1(
    const cairn::schema::bytes_view_t& message,
    const cairn::schema::secp256k1_private_key_t& private_key) {
  auto public_key = secp256k1_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  auto pkey = secp256k1_private(private_key, *public_key);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!pkey || !ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         pkey.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = cairn::schema::bytes_t(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = der.data();
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  const BIGNUM* r{nullptr};
  const BIGNUM* s{nullptr};
  ECDSA_SIG_get0(sig.get(), &r, &s);

  auto signature = cairn::schema::secp256k1_signature_t{};
  if (BN_bn2binpad(r, signature.data() + 1, 32) != 32 ||
      BN_bn2binpad(s, signature.data() + 33, 32) != 32) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace cairn::crypto

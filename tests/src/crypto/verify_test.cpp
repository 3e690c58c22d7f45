#include <cairn/crypto/sign.hpp>
#include <cairn/crypto/verify.hpp>
#include <cairn/testing/common.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

// RFC 8032 section 7.1, test 1.
constexpr auto kRfcSecret =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr auto kRfcPublic =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
constexpr auto kRfcSignature =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590"
    "a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

template <size_t N>
std::array<uint8_t, N> from_hex_array(const std::string_view hex) {
  auto bytes = cairn::schema::from_hex(hex);
  auto out = std::array<uint8_t, N>{};
  std::copy_n(bytes.begin(), std::min(bytes.size(), N), out.begin());
  return out;
}

struct secp_fixture_t final {
  cairn::schema::secp256k1_signer_id signer;
  cairn::schema::secp256k1_signature_t signature;
  std::vector<uint8_t> message;
};

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

std::optional<secp_fixture_t> make_secp_fixture() {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{EVP_PKEY_new(), EVP_PKEY_free};
  if (!pkey || EC_KEY_generate_key(ec_key) != 1 ||
      EVP_PKEY_assign_EC_KEY(pkey.get(), ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto fixture = secp_fixture_t{};
  auto* pub_ptr = fixture.signer.public_key.data();
  if (i2o_ECPublicKey(ec_key, &pub_ptr) !=
      static_cast<int>(fixture.signer.public_key.size())) {
    return std::nullopt;
  }

  fixture.message = std::vector<uint8_t>{'p', 'u', 's', 'h'};
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto der_size = size_t{};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         pkey.get()) != 1 ||
      EVP_DigestSign(ctx.get(), nullptr, &der_size, fixture.message.data(),
                     fixture.message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, fixture.message.data(),
                     fixture.message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig.get(), &r, &s);
  fixture.signature[0] = 0;
  if (BN_bn2binpad(r, fixture.signature.data() + 1, 32) != 32 ||
      BN_bn2binpad(s, fixture.signature.data() + 33, 32) != 32) {
    return std::nullopt;
  }
  return fixture;
}

}  // namespace

TEST(crypto_verify, derives_rfc8032_public_key) {
  if (!cairn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto public_key = cairn::crypto::ed25519_public_key(
      from_hex_array<32>(kRfcSecret));
  ASSERT_TRUE(public_key.has_value());
  EXPECT_EQ(public_key->public_key, from_hex_array<32>(kRfcPublic));
}

TEST(crypto_verify, signs_rfc8032_vector) {
  if (!cairn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signature = cairn::crypto::sign_ed25519(
      cairn::schema::bytes_view_t{}, from_hex_array<32>(kRfcSecret));
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(*signature, from_hex_array<64>(kRfcSignature));
}

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!cairn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto secret = from_hex_array<32>(kRfcSecret);
  auto signer = cairn::crypto::ed25519_public_key(secret);
  ASSERT_TRUE(signer.has_value());

  auto message = cairn::testing::make_payload("append me");
  auto signature =
      cairn::crypto::sign_ed25519(cairn::testing::as_view(message), secret);
  ASSERT_TRUE(signature.has_value());

  EXPECT_TRUE(cairn::crypto::verify_signature(
      cairn::testing::as_view(message), cairn::schema::signer_id_t{*signer},
      cairn::schema::signature_t{*signature}));

  message[0] ^= 0x01;
  EXPECT_FALSE(cairn::crypto::verify_signature(
      cairn::testing::as_view(message), cairn::schema::signer_id_t{*signer},
      cairn::schema::signature_t{*signature}));
}

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!cairn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  auto message = cairn::schema::bytes_view_t{fixture->message.data(),
                                             fixture->message.size()};
  auto signer = cairn::schema::signer_id_t{fixture->signer};

  EXPECT_TRUE(cairn::crypto::verify_signature(
      message, signer, cairn::schema::signature_t{fixture->signature}));

  fixture->message[0] ^= 0x01;
  EXPECT_FALSE(cairn::crypto::verify_signature(
      cairn::schema::bytes_view_t{fixture->message.data(),
                                  fixture->message.size()},
      signer, cairn::schema::signature_t{fixture->signature}));
}

TEST(crypto_verify, signs_secp256k1_with_scalar_key) {
  if (!cairn::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  // Secret scalar 1 has the generator point as its public key.
  auto secret = cairn::schema::secp256k1_private_key_t{};
  secret.back() = 0x01;
  auto signer = cairn::crypto::secp256k1_public_key(secret);
  ASSERT_TRUE(signer.has_value());
  EXPECT_EQ(signer->public_key,
            from_hex_array<33>("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce"
                               "28d959f2815b16f81798"));

  auto message = cairn::testing::make_payload("cairn secp256k1");
  auto signature =
      cairn::crypto::sign_secp256k1(cairn::testing::as_view(message), secret);
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(signature->front(), 0);
  EXPECT_TRUE(cairn::crypto::verify_signature(
      cairn::testing::as_view(message), cairn::schema::signer_id_t{*signer},
      cairn::schema::signature_t{*signature}));

  message.back() ^= 0x01;
  EXPECT_FALSE(cairn::crypto::verify_signature(
      cairn::testing::as_view(message), cairn::schema::signer_id_t{*signer},
      cairn::schema::signature_t{*signature}));
}

TEST(crypto_verify, rejects_out_of_range_secp256k1_keys) {
  auto zero = cairn::schema::secp256k1_private_key_t{};
  EXPECT_FALSE(cairn::crypto::secp256k1_public_key(zero).has_value());
  auto above_order = cairn::schema::secp256k1_private_key_t{};
  above_order.fill(0xFF);
  EXPECT_FALSE(cairn::crypto::secp256k1_public_key(above_order).has_value());
  EXPECT_FALSE(cairn::crypto::sign_secp256k1({}, zero).has_value());
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = cairn::testing::make_ed25519_signer(1);
  EXPECT_FALSE(cairn::crypto::verify_signature(
      cairn::schema::bytes_view_t{}, cairn::schema::signer_id_t{ed_signer},
      cairn::schema::signature_t{cairn::schema::secp256k1_signature_t{}}));
}

TEST(crypto_verify, rejects_named_signer_signatures) {
  auto message = cairn::testing::make_payload("abc");
  EXPECT_FALSE(cairn::crypto::verify_signature(
      cairn::testing::as_view(message), cairn::testing::make_named_signer(0x42),
      cairn::schema::signature_t{cairn::schema::ed25519_signature_t{}}));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

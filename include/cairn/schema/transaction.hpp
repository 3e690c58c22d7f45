#pragma once
#include <cairn/schema/create_accumulator.hpp>
#include <cairn/schema/primitives.hpp>
#include <cairn/schema/push.hpp>
#include <variant>

namespace cairn::schema {

using transaction_payload_t = std::variant<create_accumulator_t, push_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace cairn::schema

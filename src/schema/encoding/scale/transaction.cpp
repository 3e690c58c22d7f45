#include <cairn/schema/encoding/scale/create_accumulator.hpp>
#include <cairn/schema/encoding/scale/push.hpp>
#include <cairn/schema/encoding/scale/transaction.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace cairn::schema::encoding::scale

#include <cairn/schema/encoding/scale/accumulator_state.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(accumulator_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.write_access, encoder);
  encode(o.owner, encoder);
  encode(o.created_height, encoder);
}

void decode(accumulator_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.write_access, decoder);
  decode(o.owner, decoder);
  decode(o.created_height, decoder);
}

}  // namespace cairn::schema::encoding::scale

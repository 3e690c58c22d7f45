#include <cairn/schema/encoding/scale/push.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(push<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.payload, encoder);
}

void decode(push<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.payload, decoder);
}

}  // namespace cairn::schema::encoding::scale

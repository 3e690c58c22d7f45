#include <cairn/schema/encoding/scale/push_result.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(push_result<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.index, encoder);
  encode(o.root, encoder);
}

void decode(push_result<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.index, decoder);
  decode(o.root, decoder);
}

}  // namespace cairn::schema::encoding::scale

#include <cairn/schema/encoding/scale/leaf_record.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(leaf_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.payload, encoder);
  encode(o.commitment, encoder);
}

void decode(leaf_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.payload, decoder);
  decode(o.commitment, decoder);
}

}  // namespace cairn::schema::encoding::scale

#include <cairn/schema/encoding/scale/checkpoint.hpp>
#include <cairn/schema/encoding/scale/peak.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(checkpoint<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.height, encoder);
  encode(o.leaf_count, encoder);
  encode(o.peaks, encoder);
}

void decode(checkpoint<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.height, decoder);
  decode(o.leaf_count, decoder);
  decode(o.peaks, decoder);
}

}  // namespace cairn::schema::encoding::scale

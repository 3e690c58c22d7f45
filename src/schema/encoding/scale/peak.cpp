#include <cairn/schema/encoding/scale/peak.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(peak_t&& o, ::scale::Encoder& encoder) {
  encode(o.height, encoder);
  encode(o.hash, encoder);
}

void decode(peak_t&& o, ::scale::Decoder& decoder) {
  decode(o.height, decoder);
  decode(o.hash, decoder);
}

}  // namespace cairn::schema::encoding::scale

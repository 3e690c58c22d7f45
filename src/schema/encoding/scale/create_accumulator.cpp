#include <cairn/schema/encoding/scale/create_accumulator.hpp>

using namespace cairn::schema;

namespace cairn::schema::encoding::scale {

void encode(create_accumulator<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.write_access, encoder);
}

void decode(create_accumulator<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.write_access, decoder);
}

}  // namespace cairn::schema::encoding::scale

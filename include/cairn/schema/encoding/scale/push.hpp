#pragma once
#include <cairn/schema/push.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(push<1>&& o, ::scale::Encoder& encoder);
void decode(push<1>&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

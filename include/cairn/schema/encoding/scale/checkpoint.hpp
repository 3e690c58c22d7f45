#pragma once
#include <cairn/schema/checkpoint.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(checkpoint<1>&& o, ::scale::Encoder& encoder);
void decode(checkpoint<1>&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

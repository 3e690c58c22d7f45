#pragma once
#include <cairn/schema/create_accumulator.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(create_accumulator<1>&& o, ::scale::Encoder& encoder);
void decode(create_accumulator<1>&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

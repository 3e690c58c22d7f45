#pragma once
#include <cairn/schema/accumulator_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(accumulator_state<1>&& o, ::scale::Encoder& encoder);
void decode(accumulator_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

#pragma once
#include <cairn/schema/peak.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(peak_t&& o, ::scale::Encoder& encoder);
void decode(peak_t&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

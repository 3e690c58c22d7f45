#pragma once
#include <cairn/schema/push_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(push_result<1>&& o, ::scale::Encoder& encoder);
void decode(push_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

#pragma once
#include <cairn/schema/leaf_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace cairn::schema::encoding::scale {

void encode(leaf_record<1>&& o, ::scale::Encoder& encoder);
void decode(leaf_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace cairn::schema::encoding::scale

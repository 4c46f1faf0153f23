#pragma once

#include <keyward/schema/session_key_usage.hpp>
#include <scale/scale.hpp>

namespace keyward::schema::encoding::scale {

void encode(const keyward::schema::session_key_usage<1>& o, ::scale::Encoder& encoder);
void decode(keyward::schema::session_key_usage<1>& o, ::scale::Decoder& decoder);

}  // namespace keyward::schema::encoding::scale

#pragma once
#include <syndicate/schema/scheme_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace syndicate::schema {

void encode(const scheme_state<1>& o, ::scale::Encoder& encoder);
void decode(scheme_state<1>& o, ::scale::Decoder& decoder);

}  // namespace syndicate::schema

#pragma once
#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Amounts travel as fixed 32-byte little-endian words and statuses as their
// underlying byte, so the persisted layout does not depend on how the codec
// treats boost::multiprecision or enums.
namespace syndicate::schema::encoding::scale {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

void encode_status(const scheme_status_t& o, ::scale::Encoder& encoder);
void decode_status(scheme_status_t& o, ::scale::Decoder& decoder);

}  // namespace syndicate::schema::encoding::scale

#pragma once
#include <syndicate/schema/ledger_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace syndicate::schema {

void encode(const ledger_record<1>& o, ::scale::Encoder& encoder);
void decode(ledger_record<1>& o, ::scale::Decoder& decoder);

}  // namespace syndicate::schema

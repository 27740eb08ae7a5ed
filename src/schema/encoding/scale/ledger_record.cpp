#include <syndicate/schema/encoding/scale/ledger_record.hpp>
#include <syndicate/schema/encoding/scale/primitives.hpp>

using namespace syndicate::schema::encoding::scale;

namespace syndicate::schema {

void encode(const ledger_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.total_supply, encoder);
  encode(o.participants, encoder);
}

void decode(ledger_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode_amount(o.total_supply, decoder);
  decode(o.participants, decoder);
}

}  // namespace syndicate::schema

#include <syndicate/schema/encoding/scale/primitives.hpp>
#include <syndicate/schema/encoding/scale/scheme_state.hpp>

using namespace syndicate::schema::encoding::scale;

namespace syndicate::schema {

void encode(const scheme_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_status(o.status, encoder);
  encode(o.custody, encoder);
  encode(o.underlying_asset, encoder);
  encode(o.offer_closing_time, encoder);
  encode(o.order_expiration, encoder);
  encode(o.maturity, encoder);
  encode_amount(o.purchase_price, encoder);
  encode_amount(o.sold_price, encoder);
}

void decode(scheme_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode_status(o.status, decoder);
  decode(o.custody, decoder);
  decode(o.underlying_asset, decoder);
  decode(o.offer_closing_time, decoder);
  decode(o.order_expiration, decoder);
  decode(o.maturity, decoder);
  decode_amount(o.purchase_price, decoder);
  decode_amount(o.sold_price, decoder);
}

}  // namespace syndicate::schema

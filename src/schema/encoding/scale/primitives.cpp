#include <syndicate/schema/encoding/scale/primitives.hpp>

#include <stdexcept>

using namespace syndicate::schema;

namespace syndicate::schema::encoding::scale {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  encode(to_amount_bytes(o), encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  auto raw = amount_bytes_t{};
  decode(raw, decoder);
  o = from_amount_bytes(raw);
}

void encode_status(const scheme_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode_status(scheme_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(scheme_status_t::closed)) {
    throw std::out_of_range{"unknown scheme status"};
  }
  o = static_cast<scheme_status_t>(raw);
}

}  // namespace syndicate::schema::encoding::scale

#include <syndicate/schema/encoding/scale/primitives.hpp>
#include <syndicate/schema/encoding/scale/scheme_event.hpp>

#include <stdexcept>

using namespace syndicate::schema::encoding::scale;

namespace syndicate::schema {

void encode(const state_changed_t& o, ::scale::Encoder& encoder) {
  encode_status(o.from, encoder);
  encode_status(o.to, encoder);
}

void decode(state_changed_t& o, ::scale::Decoder& decoder) {
  decode_status(o.from, decoder);
  decode_status(o.to, decoder);
}

void encode(const transfer_event_t& o, ::scale::Encoder& encoder) {
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode_amount(o.amount, encoder);
}

void decode(transfer_event_t& o, ::scale::Decoder& decoder) {
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode_amount(o.amount, decoder);
}

void encode(const approval_event_t& o, ::scale::Encoder& encoder) {
  encode(o.owner, encoder);
  encode(o.spender, encoder);
  encode_amount(o.amount, encoder);
}

void decode(approval_event_t& o, ::scale::Decoder& decoder) {
  decode(o.owner, decoder);
  decode(o.spender, decoder);
  decode_amount(o.amount, decoder);
}

void encode(const scheme_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.timestamp, encoder);
  encode(static_cast<uint8_t>(o.payload.index()), encoder);
  std::visit([&](const auto& payload) { encode(payload, encoder); },
             o.payload);
}

void decode(scheme_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.timestamp, decoder);
  auto index = uint8_t{};
  decode(index, decoder);
  switch (index) {
    case 0: {
      auto payload = state_changed_t{};
      decode(payload, decoder);
      o.payload = payload;
      break;
    }
    case 1: {
      auto payload = transfer_event_t{};
      decode(payload, decoder);
      o.payload = payload;
      break;
    }
    case 2: {
      auto payload = approval_event_t{};
      decode(payload, decoder);
      o.payload = payload;
      break;
    }
    default:
      throw std::out_of_range{"unknown scheme event payload"};
  }
}

}  // namespace syndicate::schema

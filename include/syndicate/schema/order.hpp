#pragma once
#include <syndicate/schema/primitives.hpp>

// Schema type: order.
// What the scheme asks the market to buy or sell: the whole underlying position
// for the given notional.
namespace syndicate::schema {

template <uint16_t Version>
struct order;

template <>
struct order<1> final {
  uint16_t version{1};
  bytes_t underlying_asset;
  amount_t notional{};
};

using order_t = order<1>;

}  // namespace syndicate::schema

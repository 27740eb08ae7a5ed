#pragma once
#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_parameters.hpp>
#include <syndicate/schema/scheme_status.hpp>

namespace syndicate::schema {

template <uint16_t Version>
struct scheme_state;

template <>
struct scheme_state<1> final {
  uint16_t version{1};
  scheme_status_t status{scheme_status_t::offering};
  identity_t custody;
  bytes_t underlying_asset;
  timestamp_seconds_t offer_closing_time{};
  timestamp_seconds_t order_expiration{};
  timestamp_seconds_t maturity{};
  amount_t purchase_price{};
  amount_t sold_price{};
};

using scheme_state_t = scheme_state<1>;

inline scheme_state_t make_scheme_state(const scheme_parameters_t& parameters) {
  return scheme_state_t{.status = scheme_status_t::offering,
                        .custody = parameters.custody,
                        .underlying_asset = parameters.underlying_asset,
                        .offer_closing_time = parameters.offer_closing_time,
                        .order_expiration = parameters.order_expiration,
                        .maturity = parameters.maturity};
}

}  // namespace syndicate::schema

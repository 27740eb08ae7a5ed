#include <syndicate/execution/guards.hpp>
#include <syndicate/schema/scheme_parameters.hpp>

using namespace syndicate::schema;

namespace syndicate::execution::guards {

guard_result_t require_status(const scheme_state_t& state,
                              const scheme_status_t expected) {
  if (state.status != expected) {
    return guard_failure{scheme_error_code::invalid_status,
                         "operation not allowed in current scheme status"};
  }
  return std::nullopt;
}

guard_result_t contribution_open(const scheme_state_t& state,
                                 const timestamp_seconds_t now) {
  if (auto failure = require_status(state, scheme_status_t::offering)) {
    return failure;
  }
  if (now >= state.offer_closing_time) {
    return guard_failure{scheme_error_code::offer_closed,
                         "offer period has closed"};
  }
  return std::nullopt;
}

guard_result_t buy_order_allowed(const scheme_state_t& state,
                                 const timestamp_seconds_t now) {
  if (auto failure = require_status(state, scheme_status_t::offering)) {
    return failure;
  }
  if (now < state.offer_closing_time) {
    return guard_failure{scheme_error_code::offer_open,
                         "offer period is still open"};
  }
  if (now >= state.order_expiration) {
    return guard_failure{scheme_error_code::order_expired,
                         "order window has expired"};
  }
  if (now >= state.maturity) {
    return guard_failure{scheme_error_code::matured, "scheme has matured"};
  }
  return std::nullopt;
}

guard_result_t publish_allowed(const scheme_state_t& state,
                               const timestamp_seconds_t now) {
  if (auto failure = require_status(state, scheme_status_t::ordering)) {
    return failure;
  }
  if (now >= state.order_expiration) {
    return guard_failure{scheme_error_code::order_expired,
                         "order window has expired"};
  }
  if (now >= state.maturity) {
    return guard_failure{scheme_error_code::matured, "scheme has matured"};
  }
  return std::nullopt;
}

guard_result_t sell_allowed(const scheme_state_t& state,
                            const timestamp_seconds_t now) {
  if (auto failure = require_status(state, scheme_status_t::asset_holding)) {
    return failure;
  }
  if (now < state.maturity) {
    return guard_failure{scheme_error_code::not_matured,
                         "scheme has not matured"};
  }
  return std::nullopt;
}

guard_result_t sell_update_allowed(const scheme_state_t& state) {
  return require_status(state, scheme_status_t::asset_selling);
}

guard_result_t share_trading_open(const scheme_state_t& state,
                                  const timestamp_seconds_t now) {
  if (auto failure = require_status(state, scheme_status_t::asset_holding)) {
    return failure;
  }
  if (now >= state.maturity) {
    return guard_failure{scheme_error_code::matured,
                         "shares are frozen after maturity"};
  }
  return std::nullopt;
}

bool is_redeemable(const scheme_state_t& state, const timestamp_seconds_t now) {
  switch (state.status) {
    case scheme_status_t::asset_sold:
      return true;
    case scheme_status_t::ordering:
      return state.order_expiration < now;
    case scheme_status_t::offering:
      return state.offer_closing_time < now;
    case scheme_status_t::asset_holding:
    case scheme_status_t::asset_selling:
    case scheme_status_t::closed:
      return false;
  }
  return false;
}

guard_result_t redeem_allowed(const scheme_state_t& state,
                              const timestamp_seconds_t now) {
  if (state.status == scheme_status_t::closed) {
    return guard_failure{scheme_error_code::invalid_status,
                         "scheme is already closed"};
  }
  if (!is_redeemable(state, now)) {
    return guard_failure{scheme_error_code::not_redeemable,
                         "scheme is not redeemable yet"};
  }
  return std::nullopt;
}

std::optional<std::string_view> schedule_violation(
    const timestamp_seconds_t offer_closing_time,
    const timestamp_seconds_t order_expiration,
    const timestamp_seconds_t maturity) {
  if (order_expiration < offer_closing_time ||
      order_expiration - offer_closing_time > kMaxOrderWindow) {
    return "order expiration must fall within 90 days after the offer closes";
  }
  if (maturity < offer_closing_time ||
      maturity - offer_closing_time > kMaxMaturityWindow) {
    return "maturity must fall within 180 days after the offer closes";
  }
  return std::nullopt;
}

}  // namespace syndicate::execution::guards

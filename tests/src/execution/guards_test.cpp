#include <gtest/gtest.h>
#include <syndicate/execution/guards.hpp>

namespace {

using syndicate::schema::scheme_error_code;
using syndicate::schema::scheme_status_t;
namespace guards = syndicate::execution::guards;

constexpr auto kClose = syndicate::schema::timestamp_seconds_t{1000};
constexpr auto kExpiration = kClose + 10 * syndicate::schema::kSecondsPerDay;
constexpr auto kMaturity = kClose + 60 * syndicate::schema::kSecondsPerDay;

syndicate::schema::scheme_state_t make_state(const scheme_status_t status) {
  auto state = syndicate::schema::scheme_state_t{};
  state.status = status;
  state.offer_closing_time = kClose;
  state.order_expiration = kExpiration;
  state.maturity = kMaturity;
  return state;
}

std::optional<scheme_error_code> code_of(const guards::guard_result_t& r) {
  if (!r) {
    return std::nullopt;
  }
  return r->code;
}

}  // namespace

TEST(guards, contribution_window_closes_at_offer_closing_time) {
  auto state = make_state(scheme_status_t::offering);
  EXPECT_FALSE(guards::contribution_open(state, kClose - 1).has_value());
  EXPECT_EQ(code_of(guards::contribution_open(state, kClose)),
            scheme_error_code::offer_closed);
  EXPECT_EQ(code_of(guards::contribution_open(
                make_state(scheme_status_t::ordering), kClose - 1)),
            scheme_error_code::invalid_status);
}

TEST(guards, buy_order_window) {
  auto state = make_state(scheme_status_t::offering);
  EXPECT_EQ(code_of(guards::buy_order_allowed(state, kClose - 1)),
            scheme_error_code::offer_open);
  EXPECT_FALSE(guards::buy_order_allowed(state, kClose).has_value());
  EXPECT_EQ(code_of(guards::buy_order_allowed(state, kExpiration)),
            scheme_error_code::order_expired);
}

TEST(guards, publish_requires_unexpired_order) {
  auto state = make_state(scheme_status_t::ordering);
  EXPECT_FALSE(guards::publish_allowed(state, kExpiration - 1).has_value());
  EXPECT_EQ(code_of(guards::publish_allowed(state, kExpiration)),
            scheme_error_code::order_expired);
  EXPECT_EQ(code_of(guards::publish_allowed(
                make_state(scheme_status_t::offering), kClose)),
            scheme_error_code::invalid_status);
}

TEST(guards, sell_requires_maturity) {
  auto state = make_state(scheme_status_t::asset_holding);
  EXPECT_EQ(code_of(guards::sell_allowed(state, kMaturity - 1)),
            scheme_error_code::not_matured);
  EXPECT_FALSE(guards::sell_allowed(state, kMaturity).has_value());
  EXPECT_FALSE(guards::sell_update_allowed(
                   make_state(scheme_status_t::asset_selling))
                   .has_value());
  EXPECT_EQ(code_of(guards::sell_update_allowed(state)),
            scheme_error_code::invalid_status);
}

TEST(guards, share_trading_freezes_at_maturity) {
  auto state = make_state(scheme_status_t::asset_holding);
  EXPECT_FALSE(guards::share_trading_open(state, kMaturity - 1).has_value());
  EXPECT_EQ(code_of(guards::share_trading_open(state, kMaturity)),
            scheme_error_code::matured);
  EXPECT_EQ(code_of(guards::share_trading_open(
                make_state(scheme_status_t::offering), kClose - 1)),
            scheme_error_code::invalid_status);
}

TEST(guards, redeemability_by_status) {
  EXPECT_FALSE(guards::is_redeemable(make_state(scheme_status_t::offering),
                                     kClose));
  EXPECT_TRUE(guards::is_redeemable(make_state(scheme_status_t::offering),
                                    kClose + 1));
  EXPECT_FALSE(guards::is_redeemable(make_state(scheme_status_t::ordering),
                                     kExpiration));
  EXPECT_TRUE(guards::is_redeemable(make_state(scheme_status_t::ordering),
                                    kExpiration + 1));
  EXPECT_FALSE(guards::is_redeemable(
      make_state(scheme_status_t::asset_holding), kMaturity + 1));
  EXPECT_FALSE(guards::is_redeemable(
      make_state(scheme_status_t::asset_selling), kMaturity + 1));
  EXPECT_TRUE(guards::is_redeemable(make_state(scheme_status_t::asset_sold),
                                    0));
  EXPECT_FALSE(guards::is_redeemable(make_state(scheme_status_t::closed),
                                     kMaturity + 1));
}

TEST(guards, redeem_after_close_is_invalid_status) {
  EXPECT_EQ(code_of(guards::redeem_allowed(make_state(scheme_status_t::closed),
                                           kMaturity)),
            scheme_error_code::invalid_status);
  EXPECT_EQ(code_of(guards::redeem_allowed(
                make_state(scheme_status_t::asset_holding), kMaturity)),
            scheme_error_code::not_redeemable);
}

TEST(guards, schedule_rules) {
  EXPECT_FALSE(
      guards::schedule_violation(kClose, kExpiration, kMaturity).has_value());
  EXPECT_FALSE(guards::schedule_violation(
                   kClose, kClose + syndicate::schema::kMaxOrderWindow,
                   kClose + syndicate::schema::kMaxMaturityWindow)
                   .has_value());
  EXPECT_TRUE(guards::schedule_violation(
                  kClose, kClose + syndicate::schema::kMaxOrderWindow + 1,
                  kMaturity)
                  .has_value());
  EXPECT_TRUE(guards::schedule_violation(
                  kClose, kExpiration,
                  kClose + syndicate::schema::kMaxMaturityWindow + 1)
                  .has_value());
  EXPECT_TRUE(
      guards::schedule_violation(kClose, kClose - 1, kMaturity).has_value());
  EXPECT_TRUE(
      guards::schedule_violation(kClose, kExpiration, kClose - 1).has_value());
}

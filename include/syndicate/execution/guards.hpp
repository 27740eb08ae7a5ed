#pragma once

#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_error_code.hpp>
#include <syndicate/schema/scheme_state.hpp>

#include <optional>
#include <string_view>

// Preconditions of every scheme operation, evaluated against the state and the
// time sampled at call time. A guard returns std::nullopt when the operation
// may proceed.
namespace syndicate::execution::guards {

struct guard_failure final {
  syndicate::schema::scheme_error_code code{};
  std::string_view reason;
};

using guard_result_t = std::optional<guard_failure>;

guard_result_t require_status(const syndicate::schema::scheme_state_t& state,
                              syndicate::schema::scheme_status_t expected);

/// deposit and withdraw.
guard_result_t contribution_open(const syndicate::schema::scheme_state_t& state,
                                 syndicate::schema::timestamp_seconds_t now);

guard_result_t buy_order_allowed(const syndicate::schema::scheme_state_t& state,
                                 syndicate::schema::timestamp_seconds_t now);

guard_result_t publish_allowed(const syndicate::schema::scheme_state_t& state,
                               syndicate::schema::timestamp_seconds_t now);

guard_result_t sell_allowed(const syndicate::schema::scheme_state_t& state,
                            syndicate::schema::timestamp_seconds_t now);

guard_result_t sell_update_allowed(
    const syndicate::schema::scheme_state_t& state);

/// transfer, transfer_from and approve on shares.
guard_result_t share_trading_open(
    const syndicate::schema::scheme_state_t& state,
    syndicate::schema::timestamp_seconds_t now);

bool is_redeemable(const syndicate::schema::scheme_state_t& state,
                   syndicate::schema::timestamp_seconds_t now);

guard_result_t redeem_allowed(const syndicate::schema::scheme_state_t& state,
                              syndicate::schema::timestamp_seconds_t now);

/// Construction-time ordering of the three scheme timestamps; returns the
/// violated rule, if any.
std::optional<std::string_view> schedule_violation(
    syndicate::schema::timestamp_seconds_t offer_closing_time,
    syndicate::schema::timestamp_seconds_t order_expiration,
    syndicate::schema::timestamp_seconds_t maturity);

}  // namespace syndicate::execution::guards

#pragma once

#include <syndicate/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace syndicate::schema {

enum class scheme_error_code : uint32_t {
  // Precondition violations.
  invalid_status = 1,
  offer_closed = 2,
  offer_open = 3,
  order_expired = 4,
  matured = 6,
  not_matured = 7,
  not_redeemable = 8,
  reentrant_call = 9,
  // Arithmetic violations.
  zero_amount = 20,
  insufficient_balance = 21,
  insufficient_allowance = 22,
  invalid_recipient = 23,
  self_transfer = 24,
  amount_overflow = 25,
  custody_shortfall = 26,
  // External call failures.
  settlement_transfer_failed = 40,
  // Business rejections.
  order_not_filled = 60,
};

enum class error_category_t : uint8_t {
  none = 0,
  precondition = 1,
  arithmetic = 2,
  external = 3,
  business = 4
};

inline constexpr error_category_t error_category_of(
    const scheme_error_code code) {
  const auto value = static_cast<uint32_t>(code);
  if (value == 0) {
    return error_category_t::none;
  }
  if (value < 20) {
    return error_category_t::precondition;
  }
  if (value < 40) {
    return error_category_t::arithmetic;
  }
  if (value < 60) {
    return error_category_t::external;
  }
  return error_category_t::business;
}

inline constexpr auto kSchemeErrorNames = enum_names_t<scheme_error_code, 17>{
    std::pair{std::string_view{"invalid_status"},
              scheme_error_code::invalid_status},
    std::pair{std::string_view{"offer_closed"},
              scheme_error_code::offer_closed},
    std::pair{std::string_view{"offer_open"}, scheme_error_code::offer_open},
    std::pair{std::string_view{"order_expired"},
              scheme_error_code::order_expired},
    std::pair{std::string_view{"matured"}, scheme_error_code::matured},
    std::pair{std::string_view{"not_matured"},
              scheme_error_code::not_matured},
    std::pair{std::string_view{"not_redeemable"},
              scheme_error_code::not_redeemable},
    std::pair{std::string_view{"reentrant_call"},
              scheme_error_code::reentrant_call},
    std::pair{std::string_view{"zero_amount"},
              scheme_error_code::zero_amount},
    std::pair{std::string_view{"insufficient_balance"},
              scheme_error_code::insufficient_balance},
    std::pair{std::string_view{"insufficient_allowance"},
              scheme_error_code::insufficient_allowance},
    std::pair{std::string_view{"invalid_recipient"},
              scheme_error_code::invalid_recipient},
    std::pair{std::string_view{"self_transfer"},
              scheme_error_code::self_transfer},
    std::pair{std::string_view{"amount_overflow"},
              scheme_error_code::amount_overflow},
    std::pair{std::string_view{"custody_shortfall"},
              scheme_error_code::custody_shortfall},
    std::pair{std::string_view{"settlement_transfer_failed"},
              scheme_error_code::settlement_transfer_failed},
    std::pair{std::string_view{"order_not_filled"},
              scheme_error_code::order_not_filled}};

inline constexpr std::string_view to_string(const scheme_error_code code) {
  return enum_name(code, kSchemeErrorNames);
}

}  // namespace syndicate::schema

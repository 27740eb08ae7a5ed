#pragma once

#include <syndicate/schema/scheme_error_code.hpp>
#include <syndicate/schema/scheme_event.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace syndicate::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<scheme_event_t> events;

  bool ok() const { return code == 0; }

  std::optional<scheme_error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<scheme_error_code>(code);
  }

  /// A rejection the caller may retry later once the market fills.
  bool is_business_rejection() const {
    return code != 0 && error_category_of(static_cast<scheme_error_code>(
                            code)) == error_category_t::business;
  }
};

using operation_result_t = operation_result<1>;

}  // namespace syndicate::schema

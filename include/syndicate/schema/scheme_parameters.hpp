#pragma once
#include <syndicate/schema/primitives.hpp>

// Schema type: scheme parameters.
// Construction inputs of a scheme; immutable once the scheme exists.
namespace syndicate::schema {

inline constexpr duration_seconds_t kMaxOrderWindow = 90 * kSecondsPerDay;
inline constexpr duration_seconds_t kMaxMaturityWindow = 180 * kSecondsPerDay;

template <uint16_t Version>
struct scheme_parameters;

template <>
struct scheme_parameters<1> final {
  uint16_t version{1};
  identity_t custody;
  bytes_t underlying_asset;
  timestamp_seconds_t offer_closing_time{};
  timestamp_seconds_t order_expiration{};
  timestamp_seconds_t maturity{};
};

using scheme_parameters_t = scheme_parameters<1>;

}  // namespace syndicate::schema

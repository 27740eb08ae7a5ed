#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace syndicate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using identity_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using wide_amount_t = boost::multiprecision::uint512_t;
using amount_bytes_t = std::array<uint8_t, 32>;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

inline constexpr duration_seconds_t kSecondsPerDay = 86400;

bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const std::string_view& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// The all-zero identity; never a valid holder or recipient.
inline identity_t null_identity() {
  return identity_t{};
}

inline bool is_null(const identity_t& identity) {
  return identity == identity_t{};
}

/// Sentinel allowance value that is never decremented.
inline amount_t unlimited_amount() {
  return std::numeric_limits<amount_t>::max();
}

/// Fixed-width little-endian form used for persistence.
amount_bytes_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const amount_bytes_t& bytes);

std::string to_string(const amount_t& amount);

}  // namespace syndicate::schema

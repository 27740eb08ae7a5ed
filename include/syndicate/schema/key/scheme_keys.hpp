#pragma once

#include <syndicate/schema/key/builder.hpp>
#include <syndicate/schema/primitives.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: scheme keys.
// Canonical key prefixes for scheme state, ledger rows and the event log.
namespace syndicate::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kSchemeKey{"SYS|STATE|SCHEME"};
inline constexpr std::string_view kLedgerKey{"SYS|STATE|LEDGER"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kAllowanceKeyPrefix{"SYS|STATE|ALLOWANCE|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline bytes_t make_balance_key(const identity_t& owner) {
  auto b = builder{};
  b.write(kBalanceKeyPrefix);
  b.write(std::span{owner.data(), owner.size()});
  return b.data;
}

inline bytes_t make_allowance_key(const identity_t& owner,
                                  const identity_t& spender) {
  auto b = builder{};
  b.write(kAllowanceKeyPrefix);
  b.write(std::span{owner.data(), owner.size()});
  b.write(std::span{spender.data(), spender.size()});
  return b.data;
}

inline bytes_t make_event_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kEventPrefix);
  b.write_ordered(sequence);
  return b.data;
}

/// Recover the identity suffix of a balance row key.
inline std::optional<identity_t> parse_balance_key(const bytes_view_t& key) {
  if (key.size() != kBalanceKeyPrefix.size() + sizeof(identity_t)) {
    return std::nullopt;
  }
  auto owner = identity_t{};
  std::copy_n(key.data() + kBalanceKeyPrefix.size(), owner.size(),
              owner.begin());
  return owner;
}

/// Recover (owner, spender) from an allowance row key.
inline std::optional<std::pair<identity_t, identity_t>> parse_allowance_key(
    const bytes_view_t& key) {
  if (key.size() != kAllowanceKeyPrefix.size() + 2 * sizeof(identity_t)) {
    return std::nullopt;
  }
  auto owner = identity_t{};
  auto spender = identity_t{};
  const auto* cursor = key.data() + kAllowanceKeyPrefix.size();
  std::copy_n(cursor, owner.size(), owner.begin());
  std::copy_n(cursor + owner.size(), spender.size(), spender.begin());
  return std::pair{owner, spender};
}

}  // namespace syndicate::schema::key

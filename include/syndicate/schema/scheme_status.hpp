#pragma once

#include <syndicate/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: scheme status.
// Lifecycle of a pooled scheme. Values only ever increase, with the single
// shortcut from offering or ordering straight to closed.
namespace syndicate::schema {

enum class scheme_status_t : uint8_t {
  offering = 0,
  ordering = 1,
  asset_holding = 2,
  asset_selling = 3,
  asset_sold = 4,
  closed = 5
};

inline constexpr auto kSchemeStatusNames = enum_names_t<scheme_status_t, 6>{
    std::pair{std::string_view{"offering"}, scheme_status_t::offering},
    std::pair{std::string_view{"ordering"}, scheme_status_t::ordering},
    std::pair{std::string_view{"asset_holding"},
              scheme_status_t::asset_holding},
    std::pair{std::string_view{"asset_selling"},
              scheme_status_t::asset_selling},
    std::pair{std::string_view{"asset_sold"}, scheme_status_t::asset_sold},
    std::pair{std::string_view{"closed"}, scheme_status_t::closed}};

inline constexpr std::string_view to_string(const scheme_status_t value) {
  return enum_name(value, kSchemeStatusNames);
}

inline constexpr std::optional<scheme_status_t> try_scheme_status_from_string(
    const std::string_view value) {
  return enum_from_name(value, kSchemeStatusNames);
}

/// True when `to` is a permitted successor of `from`.
inline constexpr bool is_permitted_transition(const scheme_status_t from,
                                              const scheme_status_t to) {
  switch (from) {
    case scheme_status_t::offering:
      return to == scheme_status_t::ordering || to == scheme_status_t::closed;
    case scheme_status_t::ordering:
      return to == scheme_status_t::asset_holding ||
             to == scheme_status_t::closed;
    case scheme_status_t::asset_holding:
      return to == scheme_status_t::asset_selling;
    case scheme_status_t::asset_selling:
      return to == scheme_status_t::asset_sold;
    case scheme_status_t::asset_sold:
      return to == scheme_status_t::closed;
    case scheme_status_t::closed:
      return false;
  }
  return false;
}

}  // namespace syndicate::schema

#pragma once

#include <syndicate/schema/primitives.hpp>
#include <syndicate/schema/scheme_status.hpp>
#include <cstdint>
#include <string>

namespace syndicate::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"syndicate-scheme"};
  std::string version{"0.1.0"};
  uint64_t committed_sequence{};
  hash32_t state_root;
  scheme_status_t status{scheme_status_t::offering};
};

using app_info_t = app_info<1>;

}  // namespace syndicate::schema

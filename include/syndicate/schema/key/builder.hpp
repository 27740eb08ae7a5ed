#pragma once
#include <syndicate/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace syndicate::schema::key {

struct builder final {
  syndicate::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Big-endian so that lexicographic key order matches numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_ordered(T value) {
    const auto big = boost::endian::native_to_big(value);
    const auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace syndicate::schema::key

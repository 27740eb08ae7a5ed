#pragma once
#include <syndicate/schema/primitives.hpp>
#include <optional>
#include <span>

namespace syndicate::schema::encoding {

// Encoding backend is a build time choice; the tag selects the library.
template <typename Library>
struct encoder {
  template <typename T>
  syndicate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, syndicate::schema::bytes_t& out);

  template <typename T>
  T decode(const syndicate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const syndicate::schema::bytes_view_t& bytes);
};

}  // namespace syndicate::schema::encoding

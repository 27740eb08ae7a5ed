#pragma once
#include <syndicate/common/critical.hpp>
#include <syndicate/schema/encoding/encoder.hpp>
#include <syndicate/schema/encoding/scale/ledger_record.hpp>
#include <syndicate/schema/encoding/scale/primitives.hpp>
#include <syndicate/schema/encoding/scale/scheme_event.hpp>
#include <syndicate/schema/encoding/scale/scheme_state.hpp>
#include <exception>
#include <iterator>
#include <optional>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

namespace syndicate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  syndicate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, syndicate::schema::bytes_t& out);

  template <typename T>
  T decode(const syndicate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const syndicate::schema::bytes_view_t& bytes);
};

template <typename T>
syndicate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    syndicate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        syndicate::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const syndicate::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    syndicate::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const syndicate::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  } catch (const std::exception& ex) {
    spdlog::warn("Rejected malformed SCALE payload: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace syndicate::schema::encoding

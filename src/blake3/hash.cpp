#include <blake3.h>
#include <boost/endian/conversion.hpp>
#include <syndicate/blake3/hash.hpp>

namespace syndicate::blake3 {

syndicate::schema::hash32_t fold(const syndicate::schema::hash32_t& previous,
                                 const uint64_t sequence,
                                 const std::span<const uint8_t>& material) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  const auto ordered = boost::endian::native_to_little(sequence);
  blake3_hasher_update(&hasher, &ordered, sizeof(ordered));
  blake3_hasher_update(&hasher, material.data(), material.size());
  auto output = syndicate::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace syndicate::blake3

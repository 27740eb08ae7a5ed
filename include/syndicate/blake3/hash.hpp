#pragma once
#include <syndicate/schema/primitives.hpp>
#include <cstdint>
#include <span>

namespace syndicate::blake3 {

/// Chain a new state root from the previous one and the committed rows.
syndicate::schema::hash32_t fold(const syndicate::schema::hash32_t& previous,
                                 uint64_t sequence,
                                 const std::span<const uint8_t>& material);

}  // namespace syndicate::blake3

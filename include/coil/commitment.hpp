#pragma once

#include <coil/geometry.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace coil {

using Digest = std::array<std::uint8_t, 32>;

/*
 * Fixed-order state serialization fed to the commitment hash:
 *
 *   "coil/v1"                        7 ASCII bytes
 *   segment count                    uint32, big-endian
 *   x, y of each segment, head first int32 pairs, big-endian
 *   width, height                    int32, big-endian
 */
std::vector<std::uint8_t> serialize_state(std::span<Position const> snake, Grid grid);

// SHA-256 of serialize_state()
Digest commit(std::span<Position const> snake, Grid grid);

std::string to_hex(std::span<std::uint8_t const> bytes);

// Expects exactly 64 hex digits of either case; throws std::invalid_argument otherwise.
Digest digest_from_hex(std::string_view hex);

} // namespace coil

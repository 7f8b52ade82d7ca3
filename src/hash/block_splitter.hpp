#pragma once

#include <HashCoreExports.h>

#include <cstdint>
#include <span>
#include <vector>

#include "sha256_types.hpp"

namespace sha256 {

/**
 * split - Slices a padded message into consecutive 64-byte blocks.
 *
 * The blocks cover the input left to right with no gaps or overlaps and are
 * returned in message order.
 *
 * @param padded output of pad(); its size must be a positive multiple of 64.
 * Any other size is a wiring bug and aborts via CHECK.
 */
HashCore_API std::vector<Block> split(std::span<const std::uint8_t> padded);

}  // namespace sha256

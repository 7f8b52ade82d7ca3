#pragma once

#include <HashCoreExports.h>

#include <bit>
#include <cstdint>
#include <span>

#include "sha256_types.hpp"

namespace sha256 {

// 32-bit rotate right and logical shift right.
constexpr Word rotr(const Word x, const int n) { return std::rotr(x, n); }
constexpr Word shr(const Word x, const int n) { return x >> n; }

// FIPS 180-4 4.1.2 (4.6) and (4.7)
constexpr Word smallSigma0(const Word x) {
    return rotr(x, 7) ^ rotr(x, 18) ^ shr(x, 3);
}
constexpr Word smallSigma1(const Word x) {
    return rotr(x, 17) ^ rotr(x, 19) ^ shr(x, 10);
}

/**
 * expand - Builds the 64-word message schedule of one block.
 *
 * W[0..15] are the block's big-endian words, and for t >= 16
 * W[t] = smallSigma1(W[t-2]) + W[t-7] + smallSigma0(W[t-15]) + W[t-16],
 * all mod 2^32.
 */
HashCore_API Schedule expand(const Block& block);

// Same as above for a raw byte range; aborts unless it is exactly 64 bytes.
HashCore_API Schedule expand(std::span<const std::uint8_t> block);

}  // namespace sha256

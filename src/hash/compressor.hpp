#pragma once

#include <HashCoreExports.h>

#include <span>

#include "schedule.hpp"
#include "sha256_types.hpp"

namespace sha256 {

// FIPS 180-4 4.1.2 (4.2) - (4.5)
constexpr Word ch(const Word x, const Word y, const Word z) {
    return (x & y) ^ (~x & z);
}
constexpr Word maj(const Word x, const Word y, const Word z) {
    return (x & y) ^ (x & z) ^ (y & z);
}
constexpr Word bigSigma0(const Word x) {
    return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22);
}
constexpr Word bigSigma1(const Word x) {
    return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25);
}

/**
 * compress - Runs the 64 compression rounds for one block.
 *
 * @param state hash state before this block
 * @param schedule the block's message schedule, see expand()
 * @return state + (a..h after round 63), word by word mod 2^32
 */
HashCore_API State compress(const State& state, const Schedule& schedule);

/**
 * fold - Threads the hash state through blocks in order.
 *
 * Each block is expanded and compressed into the state produced by the
 * previous one. Block order matters.
 *
 * @param blocks blocks in message order
 * @param initial state before the first block
 * @return state after the last block, or initial if blocks is empty
 */
HashCore_API State fold(std::span<const Block> blocks, State initial);

}  // namespace sha256

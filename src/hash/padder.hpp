#pragma once

#include <HashCoreExports.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sha256 {

/**
 * paddedLength - Size in bytes of the padded form of a message.
 *
 * @param length message length in bytes
 * @return the smallest multiple of 64 that is at least length + 9
 */
HashCore_API std::size_t paddedLength(std::size_t length);

/**
 * pad - Applies the FIPS 180-4 5.1.1 padding to a message.
 *
 * Appends a single 1 bit (0x80), zero bytes up to 56 mod 64, and the message
 * bit length as a 64-bit big-endian integer. The length field is
 * (8 * size) mod 2^64, the wraparound FIPS leaves for messages longer than
 * 2^64 - 1 bits.
 *
 * @param message input bytes, never modified
 * @return padded copy whose size is a positive multiple of 64
 */
HashCore_API std::vector<std::uint8_t> pad(std::span<const std::uint8_t> message);

}  // namespace sha256

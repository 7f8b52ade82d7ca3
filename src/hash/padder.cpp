#include "padder.hpp"

#include <algorithm>

#include "sha256_types.hpp"

namespace sha256 {

namespace {
constexpr std::uint8_t kMarkerByte = 0x80;
}  // namespace

std::size_t paddedLength(const std::size_t length) {
    const std::size_t minimum = length + 1 + kLengthFieldSize;
    return (minimum + kBlockSize - 1) / kBlockSize * kBlockSize;
}

std::vector<std::uint8_t> pad(std::span<const std::uint8_t> message) {
    std::vector<std::uint8_t> padded(paddedLength(message.size()), 0);
    std::ranges::copy(message, padded.begin());
    padded[message.size()] = kMarkerByte;

    // Unsigned multiplication wraps, giving the bit length mod 2^64.
    const std::uint64_t bitLength =
        static_cast<std::uint64_t>(message.size()) * 8U;
    const std::size_t lengthOffset = padded.size() - kLengthFieldSize;
    for (std::size_t i = 0; i < kLengthFieldSize; ++i) {
        padded[lengthOffset + i] =
            static_cast<std::uint8_t>(bitLength >> (8 * (kLengthFieldSize - 1 - i)));
    }
    return padded;
}

}  // namespace sha256

#include "block_splitter.hpp"

#include <LogCompat.hpp>
#include <algorithm>

namespace sha256 {

std::vector<Block> split(std::span<const std::uint8_t> padded) {
    CHECK_GT(padded.size(), 0U) << "Empty padded message";
    CHECK_EQ(padded.size() % kBlockSize, 0U)
        << "Padded message is not block aligned";

    std::vector<Block> blocks(padded.size() / kBlockSize);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        std::ranges::copy(padded.subspan(i * kBlockSize, kBlockSize),
                          blocks[i].begin());
    }
    return blocks;
}

}  // namespace sha256

#include "schedule.hpp"

#include <LogCompat.hpp>
#include <algorithm>

namespace sha256 {

namespace {

constexpr std::size_t kBlockWords = kBlockSize / sizeof(Word);

Word loadBigEndian(const std::uint8_t* p) {
    return (static_cast<Word>(p[0]) << 24) | (static_cast<Word>(p[1]) << 16) |
           (static_cast<Word>(p[2]) << 8) | static_cast<Word>(p[3]);
}

}  // namespace

Schedule expand(const Block& block) {
    Schedule w{};
    for (std::size_t t = 0; t < kBlockWords; ++t) {
        w[t] = loadBigEndian(block.data() + t * sizeof(Word));
    }
    for (std::size_t t = kBlockWords; t < kScheduleLength; ++t) {
        w[t] = smallSigma1(w[t - 2]) + w[t - 7] + smallSigma0(w[t - 15]) +
               w[t - 16];
    }
    return w;
}

Schedule expand(std::span<const std::uint8_t> block) {
    CHECK_EQ(block.size(), kBlockSize) << "Schedule input is not one block";
    Block copy{};
    std::ranges::copy(block, copy.begin());
    return expand(copy);
}

}  // namespace sha256

#include "sha256.hpp"

#include <fmt/format.h>

#include <LogCompat.hpp>
#include <iterator>
#include <vector>

#include "block_splitter.hpp"
#include "compressor.hpp"
#include "padder.hpp"

namespace {

std::span<const uint8_t> asBytes(std::string_view message) {
    return {reinterpret_cast<const uint8_t*>(message.data()), message.size()};
}

}  // namespace

sha256::State SHA256::computeState(std::span<const uint8_t> message) {
    const std::vector<uint8_t> padded = sha256::pad(message);
    const std::vector<sha256::Block> blocks = sha256::split(padded);
    DLOG(INFO) << "SHA256: " << message.size() << " bytes, " << blocks.size()
               << " blocks";
    return sha256::fold(blocks, sha256::kInitialState);
}

SHA256::result_type SHA256::compute(const uint8_t* data, std::size_t length) {
    if (length == 0) {
        return compute(std::span<const uint8_t>{});
    }
    CHECK(data != nullptr) << "Null data with length " << length;
    return compute(std::span<const uint8_t>(data, length));
}

SHA256::result_type SHA256::compute(std::span<const uint8_t> message) {
    return toBytes(computeState(message));
}

SHA256::result_type SHA256::compute(std::string_view message) {
    return compute(asBytes(message));
}

std::string SHA256::computeHex(std::span<const uint8_t> message) {
    return toHex(computeState(message));
}

std::string SHA256::computeHex(std::string_view message) {
    return computeHex(asBytes(message));
}

SHA256::result_type SHA256::toBytes(const sha256::State& state) {
    result_type digest{};
    for (std::size_t i = 0; i < state.size(); ++i) {
        digest[i * 4] = static_cast<uint8_t>(state[i] >> 24);
        digest[i * 4 + 1] = static_cast<uint8_t>(state[i] >> 16);
        digest[i * 4 + 2] = static_cast<uint8_t>(state[i] >> 8);
        digest[i * 4 + 3] = static_cast<uint8_t>(state[i]);
    }
    return digest;
}

std::string SHA256::toHex(const sha256::State& state) {
    std::string hex;
    hex.reserve(sha256::kDigestHexLength);
    for (const auto word : state) {
        fmt::format_to(std::back_inserter(hex), "{:08x}", word);
    }
    return hex;
}

std::string SHA256::toHex(const result_type& digest) {
    std::string hex;
    hex.reserve(sha256::kDigestHexLength);
    for (const auto byte : digest) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", byte);
    }
    return hex;
}

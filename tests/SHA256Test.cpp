#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <hash/sha256.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct KnownAnswer {
    std::string message;
    std::string_view digest;
};

std::vector<uint8_t> bytesOf(std::string_view text) {
    return {text.begin(), text.end()};
}

}  // namespace

class SHA256KnownAnswerTest : public testing::TestWithParam<KnownAnswer> {};

TEST_P(SHA256KnownAnswerTest, MatchesReference) {
    const auto& [message, digest] = GetParam();
    EXPECT_EQ(SHA256::computeHex(message), digest)
        << "message length " << message.size();
}

INSTANTIATE_TEST_SUITE_P(
    FipsVectors, SHA256KnownAnswerTest,
    testing::Values(
        KnownAnswer{"",
                    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b"
                    "7852b855"},
        KnownAnswer{"abc",
                    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61"
                    "f20015ad"},
        KnownAnswer{"abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
                    "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd4"
                    "19db06c1"},
        KnownAnswer{"abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
                    "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu",
                    "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac4503"
                    "7afee9d1"},
        KnownAnswer{"The quick brown fox jumps over the lazy dog",
                    "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf"
                    "37c9e592"},
        KnownAnswer{std::string(1, '\0'),
                    "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a306"
                    "17afa01d"}));

// Lengths around the point where the marker and length field stop fitting in
// the final data block.
INSTANTIATE_TEST_SUITE_P(
    PaddingBoundaries, SHA256KnownAnswerTest,
    testing::Values(
        KnownAnswer{std::string(55, 'a'),
                    "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e91"
                    "0f734318"},
        KnownAnswer{std::string(56, 'a'),
                    "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef797068"
                    "6ec6738a"},
        KnownAnswer{std::string(63, 'a'),
                    "7d3e74a05d7db15bce4ad9ec0658ea98e3f06eeecf16b4c6fff2da45"
                    "7ddc2f34"},
        KnownAnswer{std::string(64, 'a'),
                    "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df"
                    "154668eb"},
        KnownAnswer{std::string(119, 'a'),
                    "31eba51c313a5c08226adf18d4a359cfdfd8d2e816b13f4af952f7ea"
                    "6584dcfb"},
        KnownAnswer{std::string(120, 'a'),
                    "2f3d335432c70b580af0e8e1b3674a7c020d683aa5f73aaaedfdc55a"
                    "f904c21c"}));

TEST(SHA256Test, OneMillionA) {
    const std::string message(1000000, 'a');
    EXPECT_EQ(SHA256::computeHex(message),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256Test, PointerOverloadMatchesSpan) {
    const auto message = bytesOf("abc");
    EXPECT_EQ(SHA256::compute(message.data(), message.size()),
              SHA256::compute(message));
    EXPECT_EQ(SHA256::compute(nullptr, 0), SHA256::compute(std::string_view()));
}

TEST(SHA256Test, DigestBytesAreBigEndianState) {
    const auto digest = SHA256::compute(std::string_view("abc"));
    EXPECT_THAT(std::vector<uint8_t>(digest.begin(), digest.begin() + 4),
                testing::ElementsAre(0xba, 0x78, 0x16, 0xbf));
    EXPECT_THAT(std::vector<uint8_t>(digest.end() - 4, digest.end()),
                testing::ElementsAre(0xf2, 0x00, 0x15, 0xad));
}

TEST(SHA256Test, HexAndBytesAgree) {
    for (const std::string_view text : {"", "a", "abc", "message digest"}) {
        const auto message = bytesOf(text);
        const auto state = SHA256::computeState(message);
        EXPECT_EQ(SHA256::toBytes(state), SHA256::compute(message));
        EXPECT_EQ(SHA256::toHex(state), SHA256::toHex(SHA256::compute(message)));
        EXPECT_EQ(SHA256::toHex(state), SHA256::computeHex(message));
    }
}

TEST(SHA256Test, HexIsLowercaseAndFixedWidth) {
    const sha256::State small = {0, 1, 0xa, 0xff, 0x1000, 0xabcdef, 0x7fffffff,
                                 0xffffffff};
    EXPECT_EQ(SHA256::toHex(small),
              "00000000000000010000000a000000ff0000100000abcdef7fffffffffffffff");
}

TEST(SHA256Test, OutputSizeIsConstant) {
    for (const std::size_t length : {0, 1, 55, 56, 64, 65, 1000, 4096}) {
        const std::vector<uint8_t> message(length, 0x5a);
        EXPECT_EQ(SHA256::compute(message).size(), sha256::kDigestSize);
        const auto hex = SHA256::computeHex(message);
        EXPECT_EQ(hex.size(), sha256::kDigestHexLength);
        EXPECT_THAT(hex, testing::MatchesRegex("[0-9a-f]+"));
    }
}

TEST(SHA256Test, Deterministic) {
    const auto message = bytesOf("determinism");
    EXPECT_EQ(SHA256::compute(message), SHA256::compute(message));
}

TEST(SHA256Test, SingleBitFlipChangesDigest) {
    const std::vector<std::vector<uint8_t>> messages = {
        bytesOf("abc"),
        std::vector<uint8_t>(55, 0),
        std::vector<uint8_t>(64, 0xff),
        bytesOf("The quick brown fox jumps over the lazy dog"),
    };
    for (const auto& message : messages) {
        const auto reference = SHA256::compute(message);
        for (std::size_t byte = 0; byte < message.size(); ++byte) {
            for (int bit = 0; bit < 8; ++bit) {
                auto flipped = message;
                flipped[byte] ^= static_cast<uint8_t>(1U << bit);
                ASSERT_NE(SHA256::compute(flipped), reference)
                    << "byte " << byte << " bit " << bit;
            }
        }
    }
}

TEST(SHA256Test, KnownNearMisses) {
    EXPECT_EQ(SHA256::computeHex("The quick brown fox jumps over the lazy dog."),
              "ef537f25c895bfa782526529a9b63d97aa631564d5d789c2b765448c8635fb6c");
    EXPECT_EQ(SHA256::computeHex("abd"),
              "a52d159f262b2c6ddb724a61840befc36eb30c88877a4030b65cbe86298449c9");
}

TEST(SHA256Test, ReorderedBlocksGiveDifferentMessageDigest) {
    std::string forward(64, '\x01');
    forward += std::string(64, '\x02');
    std::string backward(64, '\x02');
    backward += std::string(64, '\x01');
    EXPECT_EQ(SHA256::computeHex(forward),
              "c7cb1b830887ee9f6eed38b47264115651a7b0767e3179ed842682a8b8657f49");
    EXPECT_EQ(SHA256::computeHex(backward),
              "889a7190982a0f0ffee4237d9878daa33236af8a3c5bf45058593355dbcef12c");
}

#pragma once

#include <HashCoreExports.h>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "sha256_types.hpp"

class HashCore_API SHA256 {
   public:
    using result_type = sha256::Digest;

    /**
     * compute - Hashes a message in one shot.
     *
     * Runs pad -> split -> fold(expand, compress) from the FIPS initial
     * state. Every byte sequence, including the empty one, is valid input.
     *
     * @param data start of the message, may be null if length is 0
     * @param length message length in bytes
     * @return the 32-byte digest, state words written big-endian in order
     */
    static result_type compute(const uint8_t* data, std::size_t length);
    static result_type compute(std::span<const uint8_t> message);
    static result_type compute(std::string_view message);

    // Lowercase 64 character hex form of compute().
    static std::string computeHex(std::span<const uint8_t> message);
    static std::string computeHex(std::string_view message);

    // Final hash state, before serialization.
    static sha256::State computeState(std::span<const uint8_t> message);

    static result_type toBytes(const sha256::State& state);
    static std::string toHex(const sha256::State& state);
    static std::string toHex(const result_type& digest);
};

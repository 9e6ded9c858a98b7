#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace cr::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data);
std::array<uint8_t, 64> SHA512_Hash(std::span<const uint8_t> data);

enum class DigestCheck { kMatch, kMismatch, kUnsupported };

// Recomputes the multihash function named by hash_code over data and compares
// it with the expected digest.
DigestCheck VerifyMultihash(uint64_t hash_code, std::span<const uint8_t> expected,
                            std::span<const uint8_t> data);

} // namespace cr::crypto

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pfv {

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes);
std::string secureRandomHex(std::size_t numBytes);

struct SeedCommitment {
    std::string serverSeed;
    std::string serverSeedHash;
};

// 32 bytes of entropy, 64 hex characters.
std::string generateServerSeed();
std::string generateClientSeed();

constexpr std::size_t kMaxSeedBatch = 10'000;

// Fresh server seed plus the hash an operator publishes before play.
SeedCommitment commitServerSeed();

// `count` independent commitments; throws std::invalid_argument unless
// 1 <= count <= kMaxSeedBatch.
std::vector<SeedCommitment> commitServerSeeds(std::uint64_t count);

} // namespace pfv

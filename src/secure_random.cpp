#include "secure_random.hpp"

#include "digest.hpp"
#include "secure_memory.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace pfv {

namespace {

constexpr std::size_t kServerSeedBytes = 32;
constexpr std::size_t kClientSeedBytes = 8;

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

std::vector<std::uint8_t> secureRandomBytes(std::size_t numBytes) {
    std::vector<std::uint8_t> buffer(numBytes);
    if (numBytes == 0) {
        return buffer;
    }

    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    randombytes_buf(buffer.data(), buffer.size());
    return buffer;
}

std::string secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    secureZero(bytes.data(), bytes.size());
    return oss.str();
}

std::string generateServerSeed() {
    return secureRandomHex(kServerSeedBytes);
}

std::string generateClientSeed() {
    return secureRandomHex(kClientSeedBytes);
}

SeedCommitment commitServerSeed() {
    SeedCommitment commitment;
    commitment.serverSeed = generateServerSeed();
    commitment.serverSeedHash = sha256Hex(commitment.serverSeed);
    return commitment;
}

std::vector<SeedCommitment> commitServerSeeds(std::uint64_t count) {
    if (count < 1 || count > kMaxSeedBatch) {
        throw std::invalid_argument("seed count must be between 1 and " + std::to_string(kMaxSeedBatch));
    }

    std::vector<SeedCommitment> commitments;
    commitments.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        commitments.push_back(commitServerSeed());
    }
    return commitments;
}

} // namespace pfv

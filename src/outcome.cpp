#include "outcome.hpp"

#include "digest.hpp"
#include "secure_memory.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pfv {

namespace {

constexpr double kToleranceCents = 0.01;

std::uint64_t parseHexPrefix(const std::string& digest, std::size_t length) {
    return std::stoull(digest.substr(0, length), nullptr, 16);
}

std::string digestRound(const std::string& serverSeed,
                        const std::string& clientSeed,
                        std::uint64_t nonce) {
    ScopedSecret hashInput(buildHashInput(serverSeed, clientSeed, nonce));
    return sha256Hex(hashInput.get());
}

} // namespace

const char* gameTypeName(GameType game) {
    switch (game) {
    case GameType::Dice:
        return "dice";
    case GameType::Crash:
        return "crash";
    }
    return "unknown";
}

GameType parseGameType(const std::string& name) {
    if (name == "dice") {
        return GameType::Dice;
    }
    if (name == "crash") {
        return GameType::Crash;
    }
    throw std::invalid_argument("Invalid game type. Must be \"dice\" or \"crash\"");
}

std::string buildHashInput(const std::string& serverSeed,
                           const std::string& clientSeed,
                           std::uint64_t nonce) {
    std::ostringstream oss;
    oss << serverSeed << ':' << clientSeed << ':' << nonce;
    return oss.str();
}

double roundToCents(double value) {
    return std::floor(value * 100.0 + 0.5) / 100.0;
}

VerificationResult deriveDice(const std::string& serverSeed,
                              const std::string& clientSeed,
                              std::uint64_t nonce) {
    std::string digest = digestRound(serverSeed, clientSeed, nonce);

    std::uint64_t x = parseHexPrefix(digest, kDiceHexPrefix);
    double raw = static_cast<double>(x % 10'000) / 100.0;

    return VerificationResult{ roundToCents(raw), std::move(digest), sha256Hex(serverSeed) };
}

VerificationResult deriveCrash(const std::string& serverSeed,
                               const std::string& clientSeed,
                               std::uint64_t nonce,
                               std::uint32_t maxMultiplier) {
    std::string digest = digestRound(serverSeed, clientSeed, nonce);

    std::uint64_t x = parseHexPrefix(digest, kCrashHexPrefix);
    double r = static_cast<double>(x) / static_cast<double>(kTwoTo52);
    // Without the clamp an all-ones prefix gives r == 1 and divides by zero.
    r = std::min(r, 1.0 - kCrashClampEpsilon);

    double multiplier = std::floor((1.0 / (1.0 - r)) * 100.0) / 100.0;
    multiplier = std::min(multiplier, static_cast<double>(maxMultiplier));

    return VerificationResult{ roundToCents(multiplier), std::move(digest), sha256Hex(serverSeed) };
}

GameVerification verifyGame(GameType game,
                            const std::string& serverSeed,
                            const std::string& claimedServerSeedHash,
                            const std::string& clientSeed,
                            std::uint64_t nonce,
                            std::uint32_t maxMultiplier) {
    bool hashVerified = false;
    bool hashMismatch = false;
    if (!claimedServerSeedHash.empty()) {
        hashVerified = verifySeedHash(serverSeed, claimedServerSeedHash);
        hashMismatch = !hashVerified;
    }

    switch (game) {
    case GameType::Dice:
        return GameVerification{ deriveDice(serverSeed, clientSeed, nonce), hashVerified, hashMismatch };
    case GameType::Crash:
        return GameVerification{
            deriveCrash(serverSeed, clientSeed, nonce, maxMultiplier), hashVerified, hashMismatch
        };
    }
    throw std::invalid_argument("Unknown game type");
}

bool compareResults(double computed, double expected, bool strict) {
    const double delta = std::abs(computed - expected);
    if (strict) {
        return delta < std::numeric_limits<double>::epsilon() * 10.0;
    }
    return delta < kToleranceCents;
}

} // namespace pfv

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pfv {

enum class GameType {
    Dice,
    Crash
};

constexpr std::uint32_t kDefaultMaxMultiplier = 10'000;

// Dice reads 32 bits of the digest, crash reads 52.
constexpr std::size_t kDiceHexPrefix = 8;
constexpr std::size_t kCrashHexPrefix = 13;
constexpr std::uint64_t kTwoTo52 = 1ULL << 52;
constexpr double kCrashClampEpsilon = 1e-12;

const char* gameTypeName(GameType game);
GameType parseGameType(const std::string& name);

struct VerificationResult {
    double computedResult;
    std::string computationHex;
    std::string serverSeedHash;
};

struct GameVerification {
    VerificationResult result;
    bool hashVerified;
    bool hashMismatch;
};

// "server_seed:client_seed:nonce", the exact preimage game servers hash.
std::string buildHashInput(const std::string& serverSeed,
                           const std::string& clientSeed,
                           std::uint64_t nonce);

// Round half up to two decimals, as the game servers do.
double roundToCents(double value);

VerificationResult deriveDice(const std::string& serverSeed,
                              const std::string& clientSeed,
                              std::uint64_t nonce);

VerificationResult deriveCrash(const std::string& serverSeed,
                               const std::string& clientSeed,
                               std::uint64_t nonce,
                               std::uint32_t maxMultiplier = kDefaultMaxMultiplier);

// Recomputes the outcome and, when `claimedServerSeedHash` is non-empty,
// checks it against the revealed seed. An empty claim leaves both flags false.
GameVerification verifyGame(GameType game,
                            const std::string& serverSeed,
                            const std::string& claimedServerSeedHash,
                            const std::string& clientSeed,
                            std::uint64_t nonce,
                            std::uint32_t maxMultiplier = kDefaultMaxMultiplier);

// Strict: equal up to 10 ulp at 1.0. Tolerant: closer than one cent.
bool compareResults(double computed, double expected, bool strict = false);

} // namespace pfv

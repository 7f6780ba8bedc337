#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "config.hpp"
#include "outcome.hpp"

namespace pfv {

constexpr std::size_t kMaxSeedLength = 1000;
// Largest nonce that survives a round trip through a double.
constexpr std::uint64_t kMaxNonce = (1ULL << 53) - 1;

enum class Verdict {
    Pass,
    Fail
};

const char* verdictName(Verdict verdict);

struct VerifyRequest {
    GameType game = GameType::Dice;
    std::string serverSeed;
    std::optional<std::string> serverSeedHash;
    std::string clientSeed;
    std::uint64_t nonce = 0;
    std::optional<double> expectedResult;
    bool expectStrict = false;
};

struct UsedInput {
    std::string clientSeed;
    std::uint64_t nonce;
    std::string serverSeedHash;
};

struct VerifyDetails {
    UsedInput usedInput;
    std::string computationHex;
    std::string notes;
};

struct VerifyReport {
    bool ok;
    GameType game;
    double computedResult;
    Verdict verdict;
    VerifyDetails details;
    bool hashVerified;
    bool hashMismatch;
};

// Returns a human-readable reason when the request must be rejected.
std::optional<std::string> validateRequest(const VerifyRequest& request);

// Same seed and nonce rules as validateRequest, applied to a replayed range.
std::optional<std::string> validateAuditRange(const std::string& serverSeed,
                                              const std::string& clientSeed,
                                              std::uint64_t firstNonce,
                                              std::uint64_t lastNonce);

// Hash mismatch and expected-result mismatch each force FAIL.
Verdict decideVerdict(bool hashMismatch, const std::optional<bool>& expectedMatches);

// Caller validates first; see validateRequest.
VerifyReport buildReport(const VerifyRequest& request, const VerifierConfig& cfg);

std::string reportToJson(const VerifyReport& report);
std::string errorToJson(const std::string& message);

} // namespace pfv

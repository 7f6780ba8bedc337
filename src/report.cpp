#include "report.hpp"

#include "secure_memory.hpp"
#include "text_format.hpp"

#include <cmath>
#include <sstream>
#include <vector>

namespace pfv {

namespace {

// Counts code points so multi-byte UTF-8 characters count once.
std::size_t characterCount(const std::string& value) {
    std::size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool hasHashClaim(const VerifyRequest& request) {
    return request.serverSeedHash.has_value() && !request.serverSeedHash->empty();
}

std::string joinNotes(const std::vector<std::string>& notes) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < notes.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << notes[i];
    }
    return oss.str();
}

} // namespace

const char* verdictName(Verdict verdict) {
    return verdict == Verdict::Pass ? "PASS" : "FAIL";
}

std::optional<std::string> validateRequest(const VerifyRequest& request) {
    if (request.serverSeed.empty()) {
        return std::string("server_seed is required and must be a string");
    }
    if (characterCount(request.serverSeed) > kMaxSeedLength) {
        return std::string("server_seed is too long (max 1000 characters)");
    }
    if (request.clientSeed.empty()) {
        return std::string("client_seed is required and must be a string");
    }
    if (characterCount(request.clientSeed) > kMaxSeedLength) {
        return std::string("client_seed is too long (max 1000 characters)");
    }
    if (request.nonce < 1 || request.nonce > kMaxNonce) {
        return std::string("nonce must be a positive integer");
    }
    if (request.expectedResult) {
        double expected = *request.expectedResult;
        if (!std::isfinite(expected) || expected < 0.0) {
            return std::string("expected_result must be a non-negative number");
        }
    }
    return std::nullopt;
}

std::optional<std::string> validateAuditRange(const std::string& serverSeed,
                                              const std::string& clientSeed,
                                              std::uint64_t firstNonce,
                                              std::uint64_t lastNonce) {
    VerifyRequest request;
    request.serverSeed = serverSeed;
    request.clientSeed = clientSeed;
    for (std::uint64_t nonce : { firstNonce, lastNonce }) {
        request.nonce = nonce;
        if (auto error = validateRequest(request)) {
            wipe(request.serverSeed);
            return error;
        }
    }
    wipe(request.serverSeed);
    if (lastNonce < firstNonce) {
        return std::string("last_nonce must not be smaller than first_nonce");
    }
    return std::nullopt;
}

Verdict decideVerdict(bool hashMismatch, const std::optional<bool>& expectedMatches) {
    if (hashMismatch) {
        return Verdict::Fail;
    }
    if (expectedMatches && !*expectedMatches) {
        return Verdict::Fail;
    }
    return Verdict::Pass;
}

VerifyReport buildReport(const VerifyRequest& request, const VerifierConfig& cfg) {
    const std::string claimedHash = hasHashClaim(request) ? *request.serverSeedHash : std::string();
    GameVerification verification = verifyGame(request.game,
                                                request.serverSeed,
                                                claimedHash,
                                                request.clientSeed,
                                                request.nonce,
                                                cfg.maxMultiplier);
    const VerificationResult& result = verification.result;

    std::vector<std::string> notes;
    if (!claimedHash.empty()) {
        if (verification.hashMismatch) {
            notes.emplace_back("Server seed hash verification FAILED - hash mismatch");
        } else {
            notes.emplace_back("Server seed hash verified successfully");
        }
    } else {
        notes.emplace_back("No server seed hash provided for verification");
    }

    std::optional<bool> expectedMatches;
    if (request.expectedResult) {
        const double expected = *request.expectedResult;
        expectedMatches = compareResults(result.computedResult, expected, request.expectStrict);
        if (*expectedMatches) {
            notes.push_back("Computed result matches expected result (" + formatNumber(expected) + ")");
        } else {
            notes.push_back("Computed result (" + formatNumber(result.computedResult) +
                            ") does not match expected result (" + formatNumber(expected) + ")");
        }
    } else {
        notes.emplace_back("No expected result provided - computation only");
    }

    return VerifyReport{
        true,
        request.game,
        result.computedResult,
        decideVerdict(verification.hashMismatch, expectedMatches),
        VerifyDetails{
            UsedInput{ request.clientSeed, request.nonce, result.serverSeedHash },
            result.computationHex,
            joinNotes(notes),
        },
        verification.hashVerified,
        verification.hashMismatch,
    };
}

std::string reportToJson(const VerifyReport& report) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"ok\": " << (report.ok ? "true" : "false") << ",\n";
    json << "  \"game\": " << jsonString(gameTypeName(report.game)) << ",\n";
    json << "  \"computed_result\": " << formatNumber(report.computedResult) << ",\n";
    json << "  \"verdict\": " << jsonString(verdictName(report.verdict)) << ",\n";
    json << "  \"details\": {\n";
    json << "    \"used_input\": {\n";
    json << "      \"client_seed\": " << jsonString(report.details.usedInput.clientSeed) << ",\n";
    json << "      \"nonce\": " << report.details.usedInput.nonce << ",\n";
    json << "      \"server_seed_hash\": " << jsonString(report.details.usedInput.serverSeedHash) << "\n";
    json << "    },\n";
    json << "    \"computation_hex\": " << jsonString(report.details.computationHex) << ",\n";
    json << "    \"notes\": " << jsonString(report.details.notes) << "\n";
    json << "  }\n";
    json << "}\n";
    return json.str();
}

std::string errorToJson(const std::string& message) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"ok\": false,\n";
    json << "  \"error\": " << jsonString(message) << "\n";
    json << "}\n";
    return json.str();
}

} // namespace pfv

#include "config.hpp"
#include "digest.hpp"
#include "outcome.hpp"
#include "report.hpp"
#include "text_format.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: audit_range <dice|crash> <server_seed> <client_seed> <first_nonce> <last_nonce>\n";
        std::cerr << "Environment: " << pfv::kMaxMultiplierEnv << " sets the crash multiplier cap.\n";
        return 1;
    }

    pfv::GameType game = pfv::GameType::Dice;
    pfv::VerifierConfig cfg;
    std::uint64_t firstNonce = 0;
    std::uint64_t lastNonce = 0;
    try {
        game = pfv::parseGameType(argv[1]);
        cfg = pfv::loadConfigFromEnv();
        firstNonce = pfv::parseUnsigned(argv[4], "first_nonce");
        lastNonce = pfv::parseUnsigned(argv[5], "last_nonce");
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    const std::string serverSeed = argv[2];
    const std::string clientSeed = argv[3];
    if (auto error = pfv::validateAuditRange(serverSeed, clientSeed, firstNonce, lastNonce)) {
        std::cerr << *error << '\n';
        return 1;
    }

    std::cout << "Server seed hash: " << pfv::sha256Hex(serverSeed) << '\n';
    std::cout << "Client seed: " << clientSeed << '\n';
    for (std::uint64_t nonce = firstNonce;; ++nonce) {
        pfv::VerificationResult result = game == pfv::GameType::Dice
                                             ? pfv::deriveDice(serverSeed, clientSeed, nonce)
                                             : pfv::deriveCrash(serverSeed, clientSeed, nonce, cfg.maxMultiplier);
        std::cout << "  nonce " << nonce << ": " << pfv::formatNumber(result.computedResult) << "  "
                  << result.computationHex << '\n';
        if (nonce == lastNonce) {
            break;
        }
    }

    return 0;
}

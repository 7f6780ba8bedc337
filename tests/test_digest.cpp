#include "digest.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "digest_test failure: " << msg << std::endl;
    std::exit(1);
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

} // namespace

int main() {
    using namespace pfv;

    if (sha256Hex("") != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
        fail("empty-string digest mismatch");
    }
    if (sha256Hex("test") != "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08") {
        fail("\"test\" digest mismatch");
    }
    const std::string seedHash = sha256Hex("seed123");
    if (seedHash != "363c4b5df77dfec7bba98f7b8c62c6dbbf66764e834c8e21a209fe699b6bec91") {
        fail("\"seed123\" digest mismatch");
    }
    if (seedHash.size() != kSha256HexLength) {
        fail("digest is not 64 hex characters");
    }

    if (!verifySeedHash("seed123", seedHash)) {
        fail("seed did not verify against its own hash");
    }
    if (!verifySeedHash("seed123", toUpper(seedHash))) {
        fail("upper-case claim rejected");
    }
    if (verifySeedHash("seed123", "wrong")) {
        fail("short bogus claim accepted");
    }
    if (verifySeedHash("test-seed-for-hash", "wrong-hash-value")) {
        fail("bogus claim accepted");
    }
    if (verifySeedHash("seed124", seedHash)) {
        fail("hash of a different seed accepted");
    }
    if (verifySeedHash("seed123", "")) {
        fail("empty claim accepted");
    }

    const std::string audit = auditDigest("seed123");
    if (audit != "363c4b5df77d" || audit.size() != kAuditDigestLength) {
        fail("audit digest is not the 12-character hash prefix");
    }

    std::string serverSeed = generateServerSeed();
    if (serverSeed.size() != 64 ||
        serverSeed.find_first_not_of("0123456789abcdef") != std::string::npos) {
        fail("generated server seed is not 64 lowercase hex characters");
    }
    if (generateClientSeed().size() != 16) {
        fail("generated client seed is not 16 hex characters");
    }
    if (generateServerSeed() == serverSeed) {
        fail("two generated server seeds collided");
    }

    SeedCommitment commitment = commitServerSeed();
    if (!verifySeedHash(commitment.serverSeed, commitment.serverSeedHash)) {
        fail("commitment hash does not verify against its seed");
    }

    auto batch = commitServerSeeds(3);
    if (batch.size() != 3 || batch[0].serverSeed == batch[1].serverSeed) {
        fail("batch of three commitments");
    }
    for (std::uint64_t badCount : { std::uint64_t{ 0 }, std::uint64_t{ kMaxSeedBatch + 1 },
                                    std::uint64_t{ 2'147'483'648ULL } }) {
        bool rejected = false;
        try {
            commitServerSeeds(badCount);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        if (!rejected) {
            fail("seed batch size " + std::to_string(badCount) + " accepted");
        }
    }

    std::cout << "digest_test passed" << std::endl;
    return 0;
}

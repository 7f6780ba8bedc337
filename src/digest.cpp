#include "digest.hpp"

#include "picosha2.h"
#include "secure_memory.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <sodium.h>

namespace pfv {

namespace {

std::string toLowerAscii(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

std::string sha256Hex(const std::string& input) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(input.begin(), input.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

bool verifySeedHash(const std::string& seed, const std::string& claimedHashHex) {
    const std::string computed = sha256Hex(seed);
    if (claimedHashHex.size() != kSha256HexLength) {
        return false;
    }

    std::string claimed = toLowerAscii(claimedHashHex);
    const bool match = sodium_memcmp(claimed.data(), computed.data(), computed.size()) == 0;
    wipe(claimed);
    return match;
}

std::string auditDigest(const std::string& seed) {
    return sha256Hex(seed).substr(0, kAuditDigestLength);
}

} // namespace pfv

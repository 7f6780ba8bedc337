#pragma once

#include <cstddef>
#include <string>

namespace pfv {

constexpr std::size_t kSha256HexLength = 64;
constexpr std::size_t kAuditDigestLength = 12;

// Lowercase hex SHA-256 of the raw bytes of `input`.
std::string sha256Hex(const std::string& input);

// True iff sha256Hex(seed) equals `claimedHashHex`, ignoring hex case.
bool verifySeedHash(const std::string& seed, const std::string& claimedHashHex);

// Short identifier for a seed that is safe to print in diagnostics.
std::string auditDigest(const std::string& seed);

} // namespace pfv

#include "config.hpp"

#include "text_format.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace pfv {

std::uint32_t parseMaxMultiplier(const std::string& text) {
    const std::uint64_t parsed = parseUnsigned(text, "max multiplier");
    if (parsed < 1) {
        throw std::invalid_argument("max multiplier must be at least 1");
    }
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("max multiplier is out of range: " + trim(text));
    }
    return static_cast<std::uint32_t>(parsed);
}

VerifierConfig loadConfigFromEnv() {
    VerifierConfig cfg;
    const char* maxMultEnv = std::getenv(kMaxMultiplierEnv);
    if (maxMultEnv == nullptr || trim(maxMultEnv).empty()) {
        return cfg;
    }
    cfg.maxMultiplier = parseMaxMultiplier(maxMultEnv);
    return cfg;
}

} // namespace pfv

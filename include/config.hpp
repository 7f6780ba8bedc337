#pragma once

#include <cstdint>
#include <string>

#include "outcome.hpp"

namespace pfv {

constexpr const char* kMaxMultiplierEnv = "PFV_MAX_MULT";

struct VerifierConfig {
    std::uint32_t maxMultiplier = kDefaultMaxMultiplier;
};

// Parses a positive multiplier cap; throws std::invalid_argument otherwise.
std::uint32_t parseMaxMultiplier(const std::string& text);

// Reads PFV_MAX_MULT. Unset or blank keeps the default.
VerifierConfig loadConfigFromEnv();

} // namespace pfv

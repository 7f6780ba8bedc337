#pragma once

#include <cstdint>
#include <string>

#include "outcome.hpp"

namespace pfv {

// Every intermediate value of a derivation, rebuilt from the round digest so
// a player can follow the arithmetic by hand.
struct DerivationTrace {
    GameType game = GameType::Dice;
    std::string computationHex;
    std::string hexPrefix;
    std::uint64_t prefixValue = 0;

    // Dice
    std::uint64_t modulo = 0;
    double rawValue = 0.0;

    // Crash
    double uniform = 0.0;
    double clampedUniform = 0.0;
    double flooredMultiplier = 0.0;
    double cappedMultiplier = 0.0;
    std::uint32_t maxMultiplier = kDefaultMaxMultiplier;

    double finalResult = 0.0;
};

DerivationTrace explainOutcome(GameType game,
                               const VerificationResult& result,
                               std::uint32_t maxMultiplier = kDefaultMaxMultiplier);

std::string formatTrace(const DerivationTrace& trace);

} // namespace pfv

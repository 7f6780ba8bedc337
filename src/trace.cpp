#include "trace.hpp"

#include "text_format.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace pfv {

DerivationTrace explainOutcome(GameType game,
                               const VerificationResult& result,
                               std::uint32_t maxMultiplier) {
    DerivationTrace trace;
    trace.game = game;
    trace.computationHex = result.computationHex;
    trace.maxMultiplier = maxMultiplier;

    const std::size_t prefixLength = game == GameType::Dice ? kDiceHexPrefix : kCrashHexPrefix;
    if (result.computationHex.size() < prefixLength) {
        throw std::invalid_argument("computation hex is shorter than the game's hex prefix");
    }
    trace.hexPrefix = result.computationHex.substr(0, prefixLength);
    trace.prefixValue = std::stoull(trace.hexPrefix, nullptr, 16);

    if (game == GameType::Dice) {
        trace.modulo = trace.prefixValue % 10'000;
        trace.rawValue = static_cast<double>(trace.modulo) / 100.0;
        trace.finalResult = roundToCents(trace.rawValue);
        return trace;
    }

    trace.uniform = static_cast<double>(trace.prefixValue) / static_cast<double>(kTwoTo52);
    trace.clampedUniform = std::min(trace.uniform, 1.0 - kCrashClampEpsilon);
    trace.flooredMultiplier = std::floor((1.0 / (1.0 - trace.clampedUniform)) * 100.0) / 100.0;
    trace.cappedMultiplier = std::min(trace.flooredMultiplier, static_cast<double>(maxMultiplier));
    trace.finalResult = roundToCents(trace.cappedMultiplier);
    return trace;
}

std::string formatTrace(const DerivationTrace& trace) {
    std::ostringstream oss;
    int step = 1;
    auto line = [&](const std::string& text) { oss << "  " << step++ << ". " << text << '\n'; };

    if (trace.game == GameType::Dice) {
        oss << "How the result was computed (Dice):\n";
        line("Compute hash: SHA256(server_seed:client_seed:nonce)");
        line("Hash result: " + trace.computationHex);
        line("Take first 8 hex characters: " + trace.hexPrefix);
        line("Parse as integer: x = " + std::to_string(trace.prefixValue));
        line("Apply modulo: (" + std::to_string(trace.prefixValue) + " % 10000) = " +
             std::to_string(trace.modulo));
        line("Divide by 100: " + std::to_string(trace.modulo) + " / 100 = " +
             formatNumber(trace.rawValue));
        line("Final result: " + formatNumber(trace.finalResult));
        return oss.str();
    }

    oss << "How the result was computed (Crash):\n";
    line("Compute hash: SHA256(server_seed:client_seed:nonce)");
    line("Hash result: " + trace.computationHex);
    line("Take first 13 hex characters (52 bits): " + trace.hexPrefix);
    line("Parse as integer: x = " + std::to_string(trace.prefixValue));
    line("Uniform fraction: r = x / 2^52 = " + formatNumber(trace.uniform));
    line("Clamp: r = min(r, 1 - 1e-12) = " + formatNumber(trace.clampedUniform));
    line("Inverse mapping: floor((1 / (1 - r)) * 100) / 100 = " +
         formatNumber(trace.flooredMultiplier));
    line("Apply cap: min(" + formatNumber(trace.flooredMultiplier) + ", " +
         std::to_string(trace.maxMultiplier) + ") = " + formatNumber(trace.cappedMultiplier));
    line("Final result: " + formatNumber(trace.finalResult));
    return oss.str();
}

} // namespace pfv

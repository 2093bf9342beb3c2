#pragma once

#include "player.hpp"

#include <cstdint>
#include <vector>

namespace wgp {

struct RoundConfig {
    std::uint32_t holeCount = 18;
    // Hoepfinger: the Goat takes captaincy from this hole to the end.
    std::uint32_t specialPhaseStart = 17;
    // Vinnie's Variation window; doubleWindowFirst == 0 disables it.
    std::uint32_t doubleWindowFirst = 13;
    std::uint32_t doubleWindowLast = 16;

    std::uint32_t carryLimit = 3;
    std::uint32_t outlierThreshold = 3; // strokes; 0 disables Karl Marx
    std::uint32_t outlierWeight = 2;
    std::uint32_t floatsPerPlayer = 1;

    bool soloDoublesWager = true;
    bool doublePointsRound = false;
    bool optionEnabled = true;

    // Per-hole par; empty means par 4 everywhere.
    std::vector<std::uint32_t> pars;

    void validate() const;

    bool isSpecialPhase(std::uint32_t holeNumber) const;
    bool isDoubleWindow(std::uint32_t holeNumber) const;
    Hole hole(std::uint32_t holeNumber) const;

    // Reads WGP_* overrides on top of the defaults, or on top of `base`.
    static RoundConfig fromEnvironment();
    static RoundConfig fromEnvironment(const RoundConfig& base);
};

} // namespace wgp

#pragma once

#include "round_config.hpp"
#include "standings.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace wgp {

class RandomSource;

struct RotationState {
    std::uint32_t holeNumber = 0; // last hole advanced to; 0 before the first tee
    std::size_t captainIndex = 0; // index into baseOrder
    std::size_t rotationIndex = 0; // normal-phase seat; the Goat taking over does not move it
    std::vector<PlayerId> baseOrder;
    std::vector<PlayerId> teeOrder;
    std::map<PlayerId, std::uint32_t> floatsUsed;
};

struct RotationStep {
    std::uint32_t holeNumber = 0;
    std::size_t captainIndex = 0;
    PlayerId captain = 0;
    std::vector<PlayerId> teeOrder;
    bool specialPhase = false;
};

class RotationManager {
public:
    RotationManager(const RoundConfig& cfg, std::vector<PlayerId> baseOrder);

    // Tossing tees for the opening hole.
    static std::vector<PlayerId> tossTees(std::vector<PlayerId> players, RandomSource& rng);

    // Moves to the next hole. Normal holes rotate captaincy by one seat from
    // `previousCaptainIndex`; special-phase holes hand it to the player with the worst
    // running total. Throws std::out_of_range past the final hole.
    RotationStep advance(std::optional<std::size_t> previousCaptainIndex,
                         const RunningTotals& runningTotals);
    RotationStep next(const RunningTotals& runningTotals);

    std::uint32_t floatsRemaining(PlayerId player) const;
    void recordFloat(PlayerId player);

    const RotationState& state() const { return state_; }
    bool finished() const { return state_.holeNumber >= cfg_.holeCount; }

private:
    std::vector<PlayerId> rotatedFrom(std::size_t captainIndex) const;

    RoundConfig cfg_;
    RotationState state_;
};

} // namespace wgp

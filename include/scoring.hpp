#pragma once

#include "player.hpp"
#include "round_config.hpp"
#include "team_formation.hpp"

#include <cstdint>
#include <map>
#include <optional>

namespace wgp {

// Conceded: the hole was settled by a refused double, without strokes.
enum class OutcomeTag { CaptainWins, OpponentsWin, Tie, UnevenPayoff, Conceded };

const char* toString(OutcomeTag tag);

struct ScoreSet {
    std::uint32_t holeNumber = 0;
    std::map<PlayerId, int> strokes;
};

struct Outcome {
    std::uint32_t holeNumber = 0;
    OutcomeTag tag = OutcomeTag::Tie;
    std::optional<TeamSide> winner; // empty on a tie
    int captainBestBall = 0;
    int opponentsBestBall = 0;
    // Karl Marx candidate; only shapes the split when the tag is UnevenPayoff.
    std::optional<PlayerId> outlier;

    bool operator==(const Outcome& other) const;
    bool operator!=(const Outcome& other) const { return !(*this == other); }
};

class ScoringResolver {
public:
    explicit ScoringResolver(const RoundConfig& cfg);

    // Pure: the same score set and teams always give the same outcome.
    Outcome resolve(const ScoreSet& scores, const TeamAssignment& team) const;

    // Throws ValidationError for missing, unknown or non-positive entries.
    void validate(const ScoreSet& scores, const TeamAssignment& team) const;

    // The unique highest score, if it clears every other by the outlier threshold.
    std::optional<PlayerId> findOutlier(const std::map<PlayerId, int>& strokes) const;

    static int bestBall(const ScoreSet& scores, const TeamAssignment& team, TeamSide side);

private:
    RoundConfig cfg_;
};

} // namespace wgp

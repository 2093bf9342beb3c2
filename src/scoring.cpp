#include "scoring.hpp"

#include "errors.hpp"

#include <algorithm>
#include <string>

namespace wgp {

const char* toString(OutcomeTag tag) {
    switch (tag) {
    case OutcomeTag::CaptainWins:
        return "captain_wins";
    case OutcomeTag::OpponentsWin:
        return "opponents_win";
    case OutcomeTag::Tie:
        return "tie";
    case OutcomeTag::UnevenPayoff:
        return "uneven_payoff";
    case OutcomeTag::Conceded:
        return "conceded";
    }
    return "unknown";
}

bool Outcome::operator==(const Outcome& other) const {
    return holeNumber == other.holeNumber && tag == other.tag && winner == other.winner &&
           captainBestBall == other.captainBestBall && opponentsBestBall == other.opponentsBestBall &&
           outlier == other.outlier;
}

ScoringResolver::ScoringResolver(const RoundConfig& cfg)
    : cfg_(cfg) {
    cfg_.validate();
}

void ScoringResolver::validate(const ScoreSet& scores, const TeamAssignment& team) const {
    const std::string hole = "hole " + std::to_string(scores.holeNumber) + ": ";
    for (TeamSide side : { TeamSide::Captain, TeamSide::Opponents }) {
        for (auto id : membersOf(team, side)) {
            if (scores.strokes.count(id) == 0) {
                throw ValidationError(ValidationFailure::MissingStrokes,
                                      hole + "no strokes for player " + std::to_string(id));
            }
        }
    }
    for (const auto& [id, count] : scores.strokes) {
        if (!sideOf(team, id)) {
            throw ValidationError(ValidationFailure::UnknownPlayer,
                                  hole + "player " + std::to_string(id) + " is not on this hole");
        }
        if (count < 1) {
            throw ValidationError(ValidationFailure::InvalidStrokeCount,
                                  hole + "player " + std::to_string(id) + " scored " + std::to_string(count));
        }
    }
}

int ScoringResolver::bestBall(const ScoreSet& scores, const TeamAssignment& team, TeamSide side) {
    auto members = membersOf(team, side);
    int best = scores.strokes.at(members.front());
    for (auto id : members) {
        best = std::min(best, scores.strokes.at(id));
    }
    return best;
}

std::optional<PlayerId> ScoringResolver::findOutlier(const std::map<PlayerId, int>& strokes) const {
    if (cfg_.outlierThreshold == 0 || strokes.size() < 2) {
        return std::nullopt;
    }
    auto highest = std::max_element(strokes.begin(), strokes.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });
    for (const auto& [id, count] : strokes) {
        if (id == highest->first) {
            continue;
        }
        if (highest->second - count < static_cast<int>(cfg_.outlierThreshold)) {
            return std::nullopt;
        }
    }
    return highest->first;
}

Outcome ScoringResolver::resolve(const ScoreSet& scores, const TeamAssignment& team) const {
    validate(scores, team);

    Outcome outcome;
    outcome.holeNumber = scores.holeNumber;
    outcome.captainBestBall = bestBall(scores, team, TeamSide::Captain);
    outcome.opponentsBestBall = bestBall(scores, team, TeamSide::Opponents);
    outcome.outlier = findOutlier(scores.strokes);

    if (outcome.captainBestBall == outcome.opponentsBestBall) {
        outcome.tag = OutcomeTag::Tie;
        return outcome;
    }

    const TeamSide winner =
        outcome.captainBestBall < outcome.opponentsBestBall ? TeamSide::Captain : TeamSide::Opponents;
    outcome.winner = winner;
    outcome.tag = winner == TeamSide::Captain ? OutcomeTag::CaptainWins : OutcomeTag::OpponentsWin;

    if (outcome.outlier) {
        const TeamSide loser = opposite(winner);
        if (sideOf(team, *outcome.outlier) == loser && membersOf(team, loser).size() >= 2) {
            outcome.tag = OutcomeTag::UnevenPayoff;
        }
    }
    return outcome;
}

} // namespace wgp

#pragma once

#include "distribution.hpp"
#include "doubling.hpp"
#include "player.hpp"
#include "rotation.hpp"
#include "round_config.hpp"
#include "round_ledger.hpp"
#include "scoring.hpp"
#include "team_formation.hpp"
#include "transcript_log.hpp"
#include "wager.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wgp {

class RandomSource;

struct HoleSetup {
    Hole hole;
    PlayerId captain = 0;
    std::vector<PlayerId> teeOrder;
    bool optionPending = false;
    CarryOver carryIn;
};

struct CommitResult {
    std::uint32_t holeNumber = 0;
    PointsDelta delta;
    RunningTotals runningTotals;
    bool zeroSumCheck = false;
    CarryOver carryOver;
    Quarters forfeited;
};

// One round of four players, played hole by hole. Every mutating call either
// succeeds completely or throws and leaves the round as it was.
class Round {
public:
    // Tosses tees with `rng` to fix the base order.
    Round(const RoundConfig& cfg,
          std::vector<Player> players,
          RandomSource& rng,
          std::optional<std::string> roundId = std::nullopt);
    // Players are taken in base tee order.
    Round(const RoundConfig& cfg,
          std::vector<Player> players,
          std::optional<std::string> roundId = std::nullopt);

    HoleSetup beginHole();

    TeamAssignment declare(std::uint32_t holeNumber,
                           CaptainChoice choice,
                           std::optional<PlayerId> partner = std::nullopt,
                           const std::vector<SpecialInvocation>& invocations = {});
    WagerState negotiate(std::uint32_t holeNumber, const std::vector<EscalationRequest>& requests);
    void declineOption(std::uint32_t holeNumber, PlayerId requestedBy);
    Outcome submitStrokes(std::uint32_t holeNumber, const std::map<PlayerId, int>& strokes);
    CommitResult commit(std::uint32_t holeNumber);

    const CorrectionRecord& correct(std::uint32_t appliesToHole,
                                    const std::string& reason,
                                    const PointsDelta& delta);

    const RoundConfig& config() const { return cfg_; }
    const std::vector<Player>& players() const { return players_; }
    const std::string& roundId() const { return roundId_; }
    const RotationState& rotation() const { return rotation_.state(); }
    const RoundLedger& ledger() const { return ledger_; }
    const CarryOverLedger& carry() const { return carry_; }
    const TranscriptLog& journal() const { return journal_; }
    bool finished() const;

    // Hole in progress, if any.
    std::optional<std::uint32_t> currentHole() const;
    std::optional<TeamAssignment> currentTeams() const;
    std::optional<WagerState> currentWager() const;

private:
    struct HoleInProgress {
        Hole hole;
        TeamFormation formation;
        std::vector<SpecialInvocation> invocations;
        std::optional<DoublingNegotiator> negotiator;
        bool optionPending = false;
        bool optionDeclined = false;
        CarryOver carryIn;
        std::optional<Outcome> outcome;
    };

    static std::vector<PlayerId> idsOf(const std::vector<Player>& players);
    static std::vector<Player> tossTees(std::vector<Player> players, RandomSource& rng);

    HoleInProgress& holeInPlay(std::uint32_t holeNumber);
    bool optionHeldBy(PlayerId captain) const;
    DoublingNegotiator openNegotiation(const HoleInProgress& current,
                                       const TeamAssignment& team,
                                       const std::vector<SpecialInvocation>& invocations,
                                       bool optionDeclined) const;

    RoundConfig cfg_;
    std::vector<Player> players_;
    std::string roundId_;
    RotationManager rotation_;
    WagerCalculator wagers_;
    ScoringResolver scoring_;
    QuarterDistributionEngine distribution_;
    CarryOverLedger carry_;
    RoundLedger ledger_;
    TranscriptLog journal_;
    std::optional<HoleInProgress> current_;
};

} // namespace wgp

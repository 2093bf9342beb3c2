#include "round.hpp"

#include "errors.hpp"
#include "rng.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace wgp {

namespace {

constexpr std::size_t kRoundIdBytes = 16;

std::string joinIds(const std::vector<PlayerId>& ids) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << ids[i];
    }
    return oss.str();
}

template <typename Map>
std::string joinEntries(const Map& entries) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [id, value] : entries) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << id << "=" << value;
    }
    return oss.str();
}

std::string holeLabel(std::uint32_t holeNumber) {
    return "hole " + std::to_string(holeNumber);
}

} // namespace

Round::Round(const RoundConfig& cfg,
             std::vector<Player> players,
             RandomSource& rng,
             std::optional<std::string> roundId)
    : Round(cfg, tossTees(std::move(players), rng), std::move(roundId)) {}

Round::Round(const RoundConfig& cfg, std::vector<Player> players, std::optional<std::string> roundId)
    : cfg_(cfg)
    , players_(std::move(players))
    , roundId_(roundId ? *roundId : secureRoundId(kRoundIdBytes))
    , rotation_(cfg_, idsOf(players_))
    , wagers_(cfg_)
    , scoring_(cfg_)
    , distribution_(cfg_)
    , ledger_(idsOf(players_), cfg_.holeCount) {
    for (std::size_t i = 0; i < players_.size(); ++i) {
        players_[i].teeIndex = static_cast<std::uint32_t>(i);
    }
    journal_.append("round:" + roundId_ + ":tee=" + joinIds(rotation_.state().baseOrder));
}

std::vector<PlayerId> Round::idsOf(const std::vector<Player>& players) {
    std::vector<PlayerId> ids;
    ids.reserve(players.size());
    for (const auto& player : players) {
        ids.push_back(player.id);
    }
    std::set<PlayerId> unique(ids.begin(), ids.end());
    if (ids.size() != kPlayersPerRound || unique.size() != ids.size()) {
        throw ValidationError(ValidationFailure::InvalidRoster,
                              "a round needs four distinct players, got " + std::to_string(ids.size()));
    }
    return ids;
}

std::vector<Player> Round::tossTees(std::vector<Player> players, RandomSource& rng) {
    std::vector<PlayerId> order = RotationManager::tossTees(idsOf(players), rng);
    std::vector<Player> ordered;
    ordered.reserve(players.size());
    for (auto id : order) {
        auto it = std::find_if(players.begin(), players.end(), [id](const Player& p) { return p.id == id; });
        ordered.push_back(std::move(*it));
    }
    return ordered;
}

bool Round::optionHeldBy(PlayerId captain) const {
    if (!cfg_.optionEnabled) {
        return false;
    }
    const RunningTotals& totals = ledger_.runningTotals();
    const Quarters& mine = totals.at(captain);
    if (mine >= Quarters()) {
        return false;
    }
    return std::all_of(totals.begin(), totals.end(), [&mine](const auto& entry) {
        return mine <= entry.second;
    });
}

Round::HoleInProgress& Round::holeInPlay(std::uint32_t holeNumber) {
    if (ledger_.isCommitted(holeNumber)) {
        throw ValidationError(ValidationFailure::HoleAlreadyCommitted,
                              holeLabel(holeNumber) + " is already committed");
    }
    if (!current_ || current_->hole.number != holeNumber) {
        throw ValidationError(ValidationFailure::HoleOutOfSequence, holeLabel(holeNumber) + " is not in play");
    }
    return *current_;
}

DoublingNegotiator Round::openNegotiation(const HoleInProgress& current,
                                          const TeamAssignment& team,
                                          const std::vector<SpecialInvocation>& invocations,
                                          bool optionDeclined) const {
    WagerState wager = wagers_.computeBaseWager(current.hole, team, invocations);
    DoublingNegotiator negotiator(std::move(wager), current.optionPending, TeamSide::Captain);
    if (optionDeclined) {
        negotiator.declineOption();
    }
    return negotiator;
}

HoleSetup Round::beginHole() {
    if (current_) {
        throw ValidationError(ValidationFailure::HoleOutOfSequence,
                              holeLabel(current_->hole.number) + " is still in play");
    }
    RotationStep step = rotation_.next(ledger_.runningTotals());

    HoleInProgress next{ cfg_.hole(step.holeNumber), TeamFormation(step.holeNumber, step.captain, step.teeOrder) };
    next.optionPending = optionHeldBy(step.captain);
    next.carryIn = carry_.current();

    HoleSetup setup;
    setup.hole = next.hole;
    setup.captain = step.captain;
    setup.teeOrder = step.teeOrder;
    setup.optionPending = next.optionPending;
    setup.carryIn = next.carryIn;

    current_ = std::move(next);
    journal_.append("begin:" + std::to_string(step.holeNumber) + ":captain=" + std::to_string(step.captain) +
                    ":tee=" + joinIds(step.teeOrder) + ":option=" + (setup.optionPending ? "1" : "0") +
                    ":carry=" + setup.carryIn.pending.str());
    return setup;
}

TeamAssignment Round::declare(std::uint32_t holeNumber,
                              CaptainChoice choice,
                              std::optional<PlayerId> partner,
                              const std::vector<SpecialInvocation>& invocations) {
    HoleInProgress& current = holeInPlay(holeNumber);
    if (current.outcome) {
        throw RuleRejection(RejectionReason::InvalidTransition, holeLabel(holeNumber) + " is already decided");
    }

    std::vector<SpecialInvocation> combined = current.invocations;
    combined.insert(combined.end(), invocations.begin(), invocations.end());
    wagers_.precheck(current.hole, combined);

    const auto declines = std::count_if(invocations.begin(), invocations.end(), [](const SpecialInvocation& s) {
        return std::holds_alternative<DeclineOption>(s);
    });
    if (declines > 0) {
        if (!current.optionPending) {
            throw RuleRejection(RejectionReason::OptionUnavailable, "captain does not hold The Option");
        }
        if (current.optionDeclined || declines > 1) {
            throw RuleRejection(RejectionReason::RuleAlreadyUsed, "The Option was already declined");
        }
    }
    const bool optionDeclined = current.optionDeclined || declines > 0;

    TeamFormation formation = current.formation;
    TeamAssignment team = formation.declare(choice, partner, rotation_.state(), cfg_.floatsPerPlayer);
    std::optional<DoublingNegotiator> negotiator;
    if (formation.resolved()) {
        negotiator = openNegotiation(current, team, combined, optionDeclined);
    }

    current.formation = std::move(formation);
    current.invocations = std::move(combined);
    current.optionDeclined = optionDeclined;
    current.negotiator = std::move(negotiator);

    std::string event = "declare:" + std::to_string(holeNumber) + ":" + describe(team);
    if (current.negotiator) {
        event += ":" + current.negotiator->wager().describe();
    }
    journal_.append(event);
    return team;
}

WagerState Round::negotiate(std::uint32_t holeNumber, const std::vector<EscalationRequest>& requests) {
    HoleInProgress& current = holeInPlay(holeNumber);
    if (!current.negotiator) {
        throw ValidationError(ValidationFailure::FormationIncomplete,
                              holeLabel(holeNumber) + " has no declared teams to wager on");
    }
    const WagerState& wager = current.negotiator->negotiate(requests);

    std::ostringstream event;
    event << "escalation:" << holeNumber << ":";
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (i > 0) {
            event << ",";
        }
        event << toString(requests[i].side) << "=" << toString(requests[i].kind);
    }
    event << ":units=" << wager.units;
    journal_.append(event.str());

    if (const auto winner = current.negotiator->concededTo()) {
        current.negotiator->lock();
        Outcome outcome;
        outcome.holeNumber = holeNumber;
        outcome.tag = OutcomeTag::Conceded;
        outcome.winner = *winner;
        current.outcome = outcome;
        journal_.append("concession:" + std::to_string(holeNumber) + ":" + toString(*winner) +
                        ":units=" + std::to_string(wager.units));
    }
    return wager;
}

void Round::declineOption(std::uint32_t holeNumber, PlayerId requestedBy) {
    HoleInProgress& current = holeInPlay(holeNumber);
    if (requestedBy != current.formation.captain()) {
        throw RuleRejection(RejectionReason::NotCaptain,
                            "player " + std::to_string(requestedBy) + " is not the captain");
    }
    if (current.outcome) {
        throw RuleRejection(RejectionReason::LateEscalation, "The Option can only be declined before strokes");
    }
    if (!current.optionPending) {
        throw RuleRejection(RejectionReason::OptionUnavailable, "captain does not hold The Option");
    }
    if (current.optionDeclined) {
        throw RuleRejection(RejectionReason::RuleAlreadyUsed, "The Option was already declined");
    }
    if (current.negotiator) {
        current.negotiator->declineOption();
    }
    current.optionDeclined = true;
    journal_.append("option:" + std::to_string(holeNumber) + ":declined:" + std::to_string(requestedBy));
}

Outcome Round::submitStrokes(std::uint32_t holeNumber, const std::map<PlayerId, int>& strokes) {
    HoleInProgress& current = holeInPlay(holeNumber);
    if (current.outcome) {
        throw RuleRejection(RejectionReason::InvalidTransition, holeLabel(holeNumber) + " is already decided");
    }

    TeamFormation formation = current.formation;
    std::optional<DoublingNegotiator> negotiator = current.negotiator;
    bool forced = false;
    if (!formation.resolved()) {
        if (!current.hole.specialPhase) {
            throw ValidationError(ValidationFailure::FormationIncomplete,
                                  "captain has not declared on " + holeLabel(holeNumber));
        }
        formation.forcePartnership(ledger_.runningTotals(), rotation_.state().baseOrder);
        negotiator = openNegotiation(current, *formation.assignment(), current.invocations, current.optionDeclined);
        forced = true;
    }

    ScoreSet scores{ holeNumber, strokes };
    Outcome outcome = scoring_.resolve(scores, *formation.assignment());
    negotiator->lock();

    current.formation = std::move(formation);
    current.negotiator = std::move(negotiator);
    current.outcome = outcome;

    if (forced) {
        journal_.append("forced-partnership:" + std::to_string(holeNumber) + ":" +
                        describe(*current.formation.assignment()));
    }
    journal_.append("strokes:" + std::to_string(holeNumber) + ":" + joinEntries(strokes) + ":" +
                    toString(outcome.tag) + ":" + current.negotiator->wager().describe());
    return outcome;
}

CommitResult Round::commit(std::uint32_t holeNumber) {
    HoleInProgress& current = holeInPlay(holeNumber);
    if (!current.outcome) {
        throw ValidationError(ValidationFailure::StrokesNotSubmitted,
                              "no strokes submitted for " + holeLabel(holeNumber));
    }

    const TeamAssignment& team = *current.formation.assignment();
    const WagerState& wager = current.negotiator->wager();
    DistributionResult result = distribution_.distribute(*current.outcome, wager, team, current.carryIn);

    HoleRecord record;
    record.holeNumber = holeNumber;
    record.team = team;
    record.wager = wager;
    record.outcome = *current.outcome;
    record.delta = result.delta;
    record.carryIn = current.carryIn;
    record.carryOut = result.carryOut;
    record.forfeited = result.forfeited;
    ledger_.commit(std::move(record));

    carry_.commit(result);
    if (current.formation.floatInvoked()) {
        rotation_.recordFloat(current.formation.captain());
    }
    current_.reset();

    CommitResult out;
    out.holeNumber = holeNumber;
    out.delta = result.delta;
    out.runningTotals = ledger_.runningTotals();
    out.zeroSumCheck = ledger_.zeroSumCheck();
    out.carryOver = carry_.current();
    out.forfeited = result.forfeited;

    journal_.append("commit:" + std::to_string(holeNumber) + ":" + joinEntries(out.delta) +
                    ":carry=" + out.carryOver.pending.str() + ":forfeited=" + out.forfeited.str());
    return out;
}

const CorrectionRecord& Round::correct(std::uint32_t appliesToHole,
                                       const std::string& reason,
                                       const PointsDelta& delta) {
    const CorrectionRecord& record = ledger_.commitCorrection(appliesToHole, reason, delta);
    journal_.append("correction:" + std::to_string(appliesToHole) + ":" + reason + ":" + joinEntries(delta));
    return record;
}

bool Round::finished() const {
    return rotation_.finished() && !current_;
}

std::optional<std::uint32_t> Round::currentHole() const {
    if (!current_) {
        return std::nullopt;
    }
    return current_->hole.number;
}

std::optional<TeamAssignment> Round::currentTeams() const {
    if (!current_) {
        return std::nullopt;
    }
    return current_->formation.assignment();
}

std::optional<WagerState> Round::currentWager() const {
    if (!current_ || !current_->negotiator) {
        return std::nullopt;
    }
    return current_->negotiator->wager();
}

} // namespace wgp

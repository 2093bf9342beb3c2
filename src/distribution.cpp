#include "distribution.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace wgp {

QuarterDistributionEngine::QuarterDistributionEngine(const RoundConfig& cfg)
    : cfg_(cfg) {
    cfg_.validate();
}

Quarters QuarterDistributionEngine::sideTotal(const Outcome& outcome,
                                              const TeamAssignment& team,
                                              const Quarters& units) {
    Quarters total = Quarters(3) * units;
    const auto* solo = std::get_if<SoloTeam>(&team);
    if (solo && solo->declaredBeforeResults && outcome.winner == TeamSide::Captain) {
        total *= Quarters::fromRatio(3, 2);
    }
    return total;
}

DistributionResult QuarterDistributionEngine::distribute(const Outcome& outcome,
                                                         const WagerState& wager,
                                                         const TeamAssignment& team,
                                                         const CarryOver& carryIn) const {
    if (!isResolved(team)) {
        throw ValidationError(ValidationFailure::FormationIncomplete,
                              "hole " + std::to_string(outcome.holeNumber) + " has no declared teams");
    }
    if (outcome.tag == OutcomeTag::Tie) {
        return carryTie(outcome, wager, team, carryIn);
    }
    if (!outcome.winner) {
        throw std::logic_error("decided outcome without a winning side");
    }

    DistributionResult result;
    result.holeNumber = outcome.holeNumber;
    result.consumed = carryIn.pending;

    const Quarters units = Quarters::fromUnits(wager.units) + carryIn.pending;
    const Quarters total = sideTotal(outcome, team, units);
    const TeamSide winner = *outcome.winner;

    share(result.delta, membersOf(team, winner), total, wager, outcome, false);
    share(result.delta, membersOf(team, opposite(winner)), -total, wager, outcome, true);

    Quarters imbalance = sumOf(result.delta);
    if (!imbalance.isZero()) {
        throw InternalConsistencyError(outcome.holeNumber, imbalance, describe(team));
    }
    return result;
}

DistributionResult QuarterDistributionEngine::carryTie(const Outcome& outcome,
                                                       const WagerState& wager,
                                                       const TeamAssignment& team,
                                                       const CarryOver& carryIn) const {
    DistributionResult result;
    result.holeNumber = outcome.holeNumber;
    for (TeamSide side : { TeamSide::Captain, TeamSide::Opponents }) {
        for (auto id : membersOf(team, side)) {
            result.delta[id] = Quarters();
        }
    }

    CarryOver next;
    next.pending = carryIn.pending + Quarters::fromUnits(wager.units);
    next.originHole = carryIn.originHole == 0 ? outcome.holeNumber : carryIn.originHole;
    next.consecutiveCarries = carryIn.consecutiveCarries + 1;

    if (next.consecutiveCarries >= cfg_.carryLimit) {
        result.forfeited = next.pending;
        result.carryOut = CarryOver{};
        result.carried = false;
        return result;
    }
    result.carryOut = next;
    result.carried = true;
    return result;
}

void QuarterDistributionEngine::share(PointsDelta& delta,
                                      const std::vector<PlayerId>& members,
                                      const Quarters& total,
                                      const WagerState& wager,
                                      const Outcome& outcome,
                                      bool losingSide) const {
    const bool uneven = losingSide && outcome.tag == OutcomeTag::UnevenPayoff && outcome.outlier;

    std::vector<Quarters> weights;
    weights.reserve(members.size());
    Quarters weightSum;
    for (auto id : members) {
        Quarters weight = Quarters::fromUnits(wager.stakeFor(id));
        if (uneven && id == *outcome.outlier) {
            weight *= Quarters::fromUnits(cfg_.outlierWeight);
        }
        weightSum += weight;
        weights.push_back(weight);
    }

    for (std::size_t i = 0; i < members.size(); ++i) {
        delta[members[i]] = total * weights[i] / weightSum;
    }
}

Quarters CarryOverLedger::totalForfeited() const {
    Quarters total;
    for (const auto& entry : forfeitures_) {
        total += entry.amount;
    }
    return total;
}

void CarryOverLedger::commit(const DistributionResult& result) {
    if (!result.forfeited.isZero()) {
        std::uint32_t origin = current_.originHole == 0 ? result.holeNumber : current_.originHole;
        forfeitures_.push_back(Forfeiture{ result.holeNumber, origin, result.forfeited });
    }
    current_ = result.carryOut;
}

} // namespace wgp

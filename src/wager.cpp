#include "wager.hpp"

#include "errors.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wgp {

namespace {

constexpr std::array<std::uint64_t, 3> kCustomWagerValues{ 2, 4, 8 };

bool isAllowedCustomValue(std::uint64_t value) {
    return std::find(kCustomWagerValues.begin(), kCustomWagerValues.end(), value) != kCustomWagerValues.end();
}

std::uint64_t checkedMultiply(std::uint64_t units, std::uint64_t factor) {
    if (factor != 0 && units > std::numeric_limits<std::uint64_t>::max() / factor) {
        throw std::overflow_error("wager units overflow");
    }
    return units * factor;
}

} // namespace

const char* toString(WagerRule rule) {
    switch (rule) {
    case WagerRule::Base:
        return "base";
    case WagerRule::DoublePointsRound:
        return "double_points_round";
    case WagerRule::Solo:
        return "solo";
    case WagerRule::DoubleWindow:
        return "double_window";
    case WagerRule::CustomWager:
        return "custom_wager";
    case WagerRule::OptIn:
        return "opt_in";
    case WagerRule::Double:
        return "double";
    case WagerRule::Redouble:
        return "redouble";
    case WagerRule::TheOption:
        return "the_option";
    case WagerRule::Concession:
        return "concession";
    }
    return "unknown";
}

std::uint64_t WagerState::stakeFor(PlayerId player) const {
    auto it = optInStakes.find(player);
    if (it == optInStakes.end()) {
        return units;
    }
    return std::max(it->second, units);
}

bool WagerState::hasRule(WagerRule rule) const {
    return std::any_of(events.begin(), events.end(), [rule](const WagerEvent& event) {
        return event.rule == rule;
    });
}

std::string WagerState::describe() const {
    std::ostringstream oss;
    oss << "units=" << units;
    for (const auto& event : events) {
        oss << "|" << toString(event.rule) << ":" << event.operand << "->" << event.resultingUnits;
        if (event.player) {
            oss << "@" << *event.player;
        }
        if (event.side) {
            oss << "@" << toString(*event.side);
        }
    }
    oss << "|locked=" << (locked ? 1 : 0);
    return oss.str();
}

WagerCalculator::WagerCalculator(const RoundConfig& cfg)
    : cfg_(cfg) {
    cfg_.validate();
}

void WagerCalculator::applyMultiplier(WagerState& wager,
                                      WagerRule rule,
                                      std::uint64_t factor,
                                      std::optional<TeamSide> side) {
    if (wager.locked) {
        throw RuleRejection(RejectionReason::LateEscalation, "wager is locked");
    }
    wager.units = checkedMultiply(wager.units, factor);
    WagerEvent event;
    event.rule = rule;
    event.effect = WagerEffect::Multiply;
    event.operand = factor;
    event.resultingUnits = wager.units;
    event.side = side;
    wager.events.push_back(event);
}

void WagerCalculator::precheck(const Hole& hole, const std::vector<SpecialInvocation>& invocations) const {
    std::size_t customCount = 0;
    for (const auto& invocation : invocations) {
        if (!std::holds_alternative<CustomWager>(invocation)) {
            continue;
        }
        if (!hole.specialPhase) {
            throw RuleRejection(RejectionReason::CustomWagerOutsideSpecialPhase,
                                "hole " + std::to_string(hole.number) + " is not in the special phase");
        }
        if (++customCount > 1) {
            throw RuleRejection(RejectionReason::RuleAlreadyUsed, "custom wager set twice");
        }
    }
}

WagerState WagerCalculator::computeBaseWager(const Hole& hole,
                                             const TeamAssignment& team,
                                             const std::vector<SpecialInvocation>& invocations) const {
    if (!isResolved(team)) {
        throw ValidationError(ValidationFailure::FormationIncomplete,
                              "hole " + std::to_string(hole.number) + " has no declared teams");
    }
    precheck(hole, invocations);

    WagerState wager;
    wager.events.push_back(WagerEvent{ WagerRule::Base, WagerEffect::Override, 1, 1, std::nullopt, std::nullopt });

    if (cfg_.doublePointsRound) {
        applyMultiplier(wager, WagerRule::DoublePointsRound, 2);
    }
    if (cfg_.soloDoublesWager && std::holds_alternative<SoloTeam>(team)) {
        applyMultiplier(wager, WagerRule::Solo, 2);
    }
    if (hole.doublePoints) {
        applyMultiplier(wager, WagerRule::DoubleWindow, 2);
    }

    // Overrides first, so that opt-ins are measured against the final team wager.
    for (const auto& invocation : invocations) {
        if (const auto* custom = std::get_if<CustomWager>(&invocation)) {
            applyCustomWager(wager, hole, *custom);
        }
    }
    for (const auto& invocation : invocations) {
        if (const auto* optIn = std::get_if<OptInStake>(&invocation)) {
            applyOptIn(wager, team, *optIn);
        }
    }
    wager.baseUnits = wager.units;
    return wager;
}

void WagerCalculator::applyCustomWager(WagerState& wager, const Hole& hole, const CustomWager& custom) const {
    if (!hole.specialPhase) {
        throw RuleRejection(RejectionReason::CustomWagerOutsideSpecialPhase,
                            "hole " + std::to_string(hole.number) + " is not in the special phase");
    }
    if (!isAllowedCustomValue(custom.units)) {
        throw RuleRejection(RejectionReason::CustomWagerValue,
                            std::to_string(custom.units) + " is not one of 2, 4, 8");
    }
    wager.units = custom.units;
    WagerEvent event;
    event.rule = WagerRule::CustomWager;
    event.effect = WagerEffect::Override;
    event.operand = custom.units;
    event.resultingUnits = wager.units;
    wager.events.push_back(event);
}

void WagerCalculator::applyOptIn(WagerState& wager, const TeamAssignment& team, const OptInStake& optIn) const {
    auto side = sideOf(team, optIn.player);
    if (!side) {
        throw RuleRejection(RejectionReason::OptInNotApplicable,
                            "player " + std::to_string(optIn.player) + " is not on this hole");
    }
    if (membersOf(team, *side).size() < 2) {
        throw RuleRejection(RejectionReason::OptInNotApplicable,
                            "player " + std::to_string(optIn.player) + " has no teammate to share with");
    }
    if (wager.optInStakes.count(optIn.player) != 0) {
        throw RuleRejection(RejectionReason::RuleAlreadyUsed,
                            "player " + std::to_string(optIn.player) + " already opted in");
    }
    if (optIn.units <= wager.units) {
        throw RuleRejection(RejectionReason::OptInBelowBase,
                            "opt-in " + std::to_string(optIn.units) + " does not exceed team wager " +
                                std::to_string(wager.units));
    }
    wager.optInStakes[optIn.player] = optIn.units;
    WagerEvent event;
    event.rule = WagerRule::OptIn;
    event.effect = WagerEffect::PerPlayer;
    event.operand = optIn.units;
    event.resultingUnits = wager.units;
    event.player = optIn.player;
    event.side = side;
    wager.events.push_back(event);
}

} // namespace wgp

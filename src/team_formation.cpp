#include "team_formation.hpp"

#include "errors.hpp"
#include "rotation.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace wgp {

namespace {

std::string playerLabel(PlayerId id) {
    return "player " + std::to_string(id);
}

template <std::size_t N>
void appendIds(std::ostringstream& oss, const std::array<PlayerId, N>& ids) {
    for (std::size_t i = 0; i < N; ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << ids[i];
    }
}

} // namespace

TeamSide opposite(TeamSide side) {
    return side == TeamSide::Captain ? TeamSide::Opponents : TeamSide::Captain;
}

const char* toString(TeamSide side) {
    return side == TeamSide::Captain ? "captain" : "opponents";
}

const char* toString(FormationState state) {
    switch (state) {
    case FormationState::AwaitingDeclaration:
        return "awaiting_declaration";
    case FormationState::Solo:
        return "solo";
    case FormationState::Partnership:
        return "partnership";
    case FormationState::Deferred:
        return "deferred";
    }
    return "unknown";
}

bool isResolved(const TeamAssignment& team) {
    return !std::holds_alternative<DeferredTeam>(team);
}

std::vector<PlayerId> membersOf(const TeamAssignment& team, TeamSide side) {
    return std::visit(
        [side](const auto& assignment) -> std::vector<PlayerId> {
            using T = std::decay_t<decltype(assignment)>;
            if constexpr (std::is_same_v<T, DeferredTeam>) {
                throw ValidationError(ValidationFailure::FormationIncomplete,
                                      "captain " + std::to_string(assignment.invokedBy) +
                                          " floated and has not declared");
            } else if constexpr (std::is_same_v<T, SoloTeam>) {
                if (side == TeamSide::Captain) {
                    return { assignment.captain };
                }
                return { assignment.opponents.begin(), assignment.opponents.end() };
            } else {
                if (side == TeamSide::Captain) {
                    return { assignment.captain, assignment.partner };
                }
                return { assignment.opponents.begin(), assignment.opponents.end() };
            }
        },
        team);
}

std::optional<TeamSide> sideOf(const TeamAssignment& team, PlayerId player) {
    for (TeamSide side : { TeamSide::Captain, TeamSide::Opponents }) {
        auto members = membersOf(team, side);
        if (std::find(members.begin(), members.end(), player) != members.end()) {
            return side;
        }
    }
    return std::nullopt;
}

PlayerId captainOf(const TeamAssignment& team) {
    return std::visit(
        [](const auto& assignment) -> PlayerId {
            using T = std::decay_t<decltype(assignment)>;
            if constexpr (std::is_same_v<T, DeferredTeam>) {
                return assignment.invokedBy;
            } else {
                return assignment.captain;
            }
        },
        team);
}

std::string describe(const TeamAssignment& team) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& assignment) {
            using T = std::decay_t<decltype(assignment)>;
            if constexpr (std::is_same_v<T, SoloTeam>) {
                oss << "solo:" << assignment.captain << ":vs:";
                appendIds(oss, assignment.opponents);
                oss << ":duncan=" << (assignment.declaredBeforeResults ? 1 : 0);
            } else if constexpr (std::is_same_v<T, PartnershipTeam>) {
                oss << "partners:" << assignment.captain << "," << assignment.partner << ":vs:";
                appendIds(oss, assignment.opponents);
                oss << ":forced=" << (assignment.forcedByDefault ? 1 : 0);
            } else {
                oss << "deferred:" << assignment.invokedBy;
            }
        },
        team);
    return oss.str();
}

TeamFormation::TeamFormation(std::uint32_t holeNumber, PlayerId captain, std::vector<PlayerId> teeOrder)
    : holeNumber_(holeNumber)
    , captain_(captain)
    , teeOrder_(std::move(teeOrder)) {
    if (teeOrder_.size() != kPlayersPerRound) {
        throw std::invalid_argument("Team formation needs exactly four players");
    }
    if (std::find(teeOrder_.begin(), teeOrder_.end(), captain_) == teeOrder_.end()) {
        throw std::invalid_argument("Captain must be in the tee order");
    }
}

TeamAssignment TeamFormation::declare(CaptainChoice choice,
                                      std::optional<PlayerId> partner,
                                      const RotationState& rotation,
                                      std::uint32_t floatsPerPlayer) {
    if (resolved()) {
        throw RuleRejection(RejectionReason::InvalidTransition,
                            "hole " + std::to_string(holeNumber_) + " already " + toString(state_));
    }

    if (choice == CaptainChoice::Float) {
        if (state_ == FormationState::Deferred) {
            throw RuleRejection(RejectionReason::RuleAlreadyUsed,
                                playerLabel(captain_) + " already floated this hole");
        }
        auto used = rotation.floatsUsed.find(captain_);
        std::uint32_t spent = used == rotation.floatsUsed.end() ? 0 : used->second;
        if (spent >= floatsPerPlayer) {
            throw RuleRejection(RejectionReason::RuleAlreadyUsed,
                                playerLabel(captain_) + " has no Float left this round");
        }
        if (partner) {
            throw RuleRejection(RejectionReason::InvalidPartner, "Float does not take a partner");
        }
        DeferredTeam deferred{ captain_ };
        state_ = FormationState::Deferred;
        floatInvoked_ = true;
        assignment_ = deferred;
        return deferred;
    }

    if (choice == CaptainChoice::Partnership) {
        if (!partner) {
            throw RuleRejection(RejectionReason::InvalidPartner, "partnership needs a partner");
        }
        PartnershipTeam pair = makePartnership(*partner);
        state_ = FormationState::Partnership;
        assignment_ = pair;
        return pair;
    }

    if (partner) {
        throw RuleRejection(RejectionReason::InvalidPartner, "solo declaration takes no partner");
    }
    const bool duncan = choice == CaptainChoice::Duncan;
    if (duncan && state_ == FormationState::Deferred) {
        throw RuleRejection(RejectionReason::DuncanUnavailable,
                            "results were already seen after the Float");
    }
    SoloTeam solo = makeSolo(duncan);
    state_ = FormationState::Solo;
    assignment_ = solo;
    return solo;
}

PartnershipTeam TeamFormation::forcePartnership(const RunningTotals& runningTotals,
                                                const std::vector<PlayerId>& baseOrder) {
    if (resolved()) {
        throw RuleRejection(RejectionReason::InvalidTransition,
                            "hole " + std::to_string(holeNumber_) + " already " + toString(state_));
    }
    std::vector<PlayerId> ranked = rankWorstFirst(runningTotals, baseOrder);
    auto partnerIt = std::find_if(ranked.begin(), ranked.end(), [this](PlayerId id) {
        return id != captain_;
    });
    PartnershipTeam pair = makePartnership(*partnerIt);
    pair.forcedByDefault = true;
    state_ = FormationState::Partnership;
    assignment_ = pair;
    return pair;
}

SoloTeam TeamFormation::makeSolo(bool beforeResults) const {
    SoloTeam solo;
    solo.captain = captain_;
    solo.declaredBeforeResults = beforeResults;
    std::size_t slot = 0;
    for (auto id : teeOrder_) {
        if (id != captain_) {
            solo.opponents[slot++] = id;
        }
    }
    return solo;
}

PartnershipTeam TeamFormation::makePartnership(PlayerId partner) const {
    if (partner == captain_) {
        throw RuleRejection(RejectionReason::InvalidPartner, "captain cannot partner themselves");
    }
    if (std::find(teeOrder_.begin(), teeOrder_.end(), partner) == teeOrder_.end()) {
        throw RuleRejection(RejectionReason::InvalidPartner,
                            playerLabel(partner) + " is not in this hole's rotation");
    }
    PartnershipTeam pair;
    pair.captain = captain_;
    pair.partner = partner;
    std::size_t slot = 0;
    for (auto id : teeOrder_) {
        if (id != captain_ && id != partner) {
            pair.opponents[slot++] = id;
        }
    }
    return pair;
}

} // namespace wgp

#pragma once

#include "player.hpp"
#include "standings.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wgp {

struct RotationState;

struct SoloTeam {
    PlayerId captain = 0;
    std::array<PlayerId, 3> opponents{};
    // The Duncan: solo called before any other player's result was seen.
    bool declaredBeforeResults = false;
};

struct PartnershipTeam {
    PlayerId captain = 0;
    PlayerId partner = 0;
    std::array<PlayerId, 2> opponents{};
    // Set when the terminal phase defaulted the Goat into this partnership.
    bool forcedByDefault = false;
};

struct DeferredTeam {
    PlayerId invokedBy = 0;
};

using TeamAssignment = std::variant<SoloTeam, PartnershipTeam, DeferredTeam>;

enum class TeamSide { Captain, Opponents };

TeamSide opposite(TeamSide side);
const char* toString(TeamSide side);

bool isResolved(const TeamAssignment& team);
// Members of one side. Throws ValidationError(FormationIncomplete) for Deferred.
std::vector<PlayerId> membersOf(const TeamAssignment& team, TeamSide side);
std::optional<TeamSide> sideOf(const TeamAssignment& team, PlayerId player);
PlayerId captainOf(const TeamAssignment& team);
std::string describe(const TeamAssignment& team);

enum class CaptainChoice { Solo, Duncan, Partnership, Float };

enum class FormationState { AwaitingDeclaration, Solo, Partnership, Deferred };

const char* toString(FormationState state);

class TeamFormation {
public:
    TeamFormation(std::uint32_t holeNumber, PlayerId captain, std::vector<PlayerId> teeOrder);

    // Applies the captain's choice. Throws RuleRejection and leaves the formation
    // untouched when the choice is not allowed from the current state.
    TeamAssignment declare(CaptainChoice choice,
                           std::optional<PlayerId> partner,
                           const RotationState& rotation,
                           std::uint32_t floatsPerPlayer);

    // Terminal-phase default: the Goat partners the player with the second-worst
    // running total (ties by base tee order).
    PartnershipTeam forcePartnership(const RunningTotals& runningTotals,
                                     const std::vector<PlayerId>& baseOrder);

    FormationState state() const { return state_; }
    bool resolved() const { return state_ == FormationState::Solo || state_ == FormationState::Partnership; }
    bool floatInvoked() const { return floatInvoked_; }
    const std::optional<TeamAssignment>& assignment() const { return assignment_; }
    std::uint32_t holeNumber() const { return holeNumber_; }
    PlayerId captain() const { return captain_; }
    const std::vector<PlayerId>& teeOrder() const { return teeOrder_; }

private:
    SoloTeam makeSolo(bool beforeResults) const;
    PartnershipTeam makePartnership(PlayerId partner) const;

    std::uint32_t holeNumber_;
    PlayerId captain_;
    std::vector<PlayerId> teeOrder_;
    FormationState state_ = FormationState::AwaitingDeclaration;
    bool floatInvoked_ = false;
    std::optional<TeamAssignment> assignment_;
};

} // namespace wgp

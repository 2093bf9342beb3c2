#pragma once

#include "player.hpp"
#include "round_config.hpp"
#include "team_formation.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wgp {

enum class WagerRule {
    Base,
    DoublePointsRound,
    Solo,
    DoubleWindow,
    CustomWager,
    OptIn,
    Double,
    Redouble,
    TheOption,
    Concession
};

enum class WagerEffect { Multiply, Override, PerPlayer };

const char* toString(WagerRule rule);

struct WagerEvent {
    WagerRule rule = WagerRule::Base;
    WagerEffect effect = WagerEffect::Multiply;
    std::uint64_t operand = 1;
    std::uint64_t resultingUnits = 1;
    std::optional<PlayerId> player;
    std::optional<TeamSide> side;
};

struct WagerState {
    std::uint64_t baseUnits = 1;
    std::uint64_t units = 1;
    std::vector<WagerEvent> events;
    std::map<PlayerId, std::uint64_t> optInStakes;
    bool locked = false;

    // A player's exposure: their opt-in stake when above the team wager.
    std::uint64_t stakeFor(PlayerId player) const;
    bool hasRule(WagerRule rule) const;
    std::string describe() const;
};

// Joe's Special: the Goat sets the terminal-phase stakes.
struct CustomWager {
    std::uint64_t units = 0;
};

// A single player raises their own exposure above the team wager.
struct OptInStake {
    PlayerId player = 0;
    std::uint64_t units = 0;
};

// The captain turns down The Option before teeing off.
struct DeclineOption {};

using SpecialInvocation = std::variant<CustomWager, OptInStake, DeclineOption>;

class WagerCalculator {
public:
    explicit WagerCalculator(const RoundConfig& cfg);

    WagerState computeBaseWager(const Hole& hole,
                                const TeamAssignment& team,
                                const std::vector<SpecialInvocation>& invocations) const;

    // Checks that need no team: custom wager only in the special phase.
    void precheck(const Hole& hole, const std::vector<SpecialInvocation>& invocations) const;

    static void applyMultiplier(WagerState& wager,
                                WagerRule rule,
                                std::uint64_t factor,
                                std::optional<TeamSide> side = std::nullopt);

private:
    void applyCustomWager(WagerState& wager, const Hole& hole, const CustomWager& custom) const;
    void applyOptIn(WagerState& wager, const TeamAssignment& team, const OptInStake& optIn) const;

    RoundConfig cfg_;
};

} // namespace wgp

#pragma once

#include "quarters.hpp"
#include "round_config.hpp"
#include "scoring.hpp"
#include "standings.hpp"
#include "team_formation.hpp"
#include "wager.hpp"

#include <cstdint>
#include <vector>

namespace wgp {

struct CarryOver {
    Quarters pending;
    std::uint32_t originHole = 0; // first tied hole feeding `pending`; 0 when empty
    std::uint32_t consecutiveCarries = 0;

    bool empty() const { return pending.isZero() && consecutiveCarries == 0; }
};

struct DistributionResult {
    std::uint32_t holeNumber = 0;
    PointsDelta delta;
    CarryOver carryOut;
    Quarters consumed;  // incoming carry paid out by a decided hole
    Quarters forfeited; // carry dropped when the carry limit was reached
    bool carried = false;
};

struct Forfeiture {
    std::uint32_t holeNumber = 0;
    std::uint32_t originHole = 0;
    Quarters amount;
};

class QuarterDistributionEngine {
public:
    explicit QuarterDistributionEngine(const RoundConfig& cfg);

    // Turns an outcome into per-player deltas. Throws InternalConsistencyError if
    // the deltas do not sum to exactly zero.
    DistributionResult distribute(const Outcome& outcome,
                                  const WagerState& wager,
                                  const TeamAssignment& team,
                                  const CarryOver& carryIn) const;

    // Side total for the hole: 3U, or 3U x 3/2 for a winning Duncan.
    static Quarters sideTotal(const Outcome& outcome,
                              const TeamAssignment& team,
                              const Quarters& units);

private:
    DistributionResult carryTie(const Outcome& outcome,
                                const WagerState& wager,
                                const TeamAssignment& team,
                                const CarryOver& carryIn) const;
    void share(PointsDelta& delta,
               const std::vector<PlayerId>& members,
               const Quarters& total,
               const WagerState& wager,
               const Outcome& outcome,
               bool losingSide) const;

    RoundConfig cfg_;
};

class CarryOverLedger {
public:
    const CarryOver& current() const { return current_; }
    const std::vector<Forfeiture>& forfeitures() const { return forfeitures_; }
    Quarters totalForfeited() const;

    void commit(const DistributionResult& result);

private:
    CarryOver current_;
    std::vector<Forfeiture> forfeitures_;
};

} // namespace wgp

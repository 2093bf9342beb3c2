#pragma once

#include "team_formation.hpp"
#include "wager.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace wgp {

enum class EscalationKind { Double, Redouble, Decline };

const char* toString(EscalationKind kind);

struct EscalationRequest {
    TeamSide side = TeamSide::Captain;
    EscalationKind kind = EscalationKind::Double;
};

class DoublingNegotiator {
public:
    // `optionPending` is set when the captain's side trails the round and holds
    // The Option; it is applied at lock time unless declined.
    explicit DoublingNegotiator(WagerState wager,
                                bool optionPending = false,
                                TeamSide optionSide = TeamSide::Captain);

    // Applies the requests in order. Either every request is applied or, on the
    // first RuleRejection, none is. A Decline from the side holding the counter
    // window refuses the double: the hole is conceded to the doubling side at the
    // units in force before that double.
    const WagerState& negotiate(const std::vector<EscalationRequest>& requests);

    void declineOption();

    // Called when strokes arrive or the hole is conceded. Applies a pending Option
    // (unless conceded) and freezes the wager.
    const WagerState& lock();

    const WagerState& wager() const { return wager_; }
    bool optionPending() const { return optionPending_ && !optionDeclined_; }
    bool closed() const { return closed_; }
    bool locked() const { return wager_.locked; }
    // Side entitled to redouble, if a double is open.
    std::optional<TeamSide> counterWindow() const { return window_; }
    // Side awarded the hole by a refused double.
    std::optional<TeamSide> concededTo() const { return concededTo_; }

private:
    struct Negotiation {
        WagerState wager;
        std::optional<TeamSide> window;
        std::uint64_t unitsBeforeDouble = 0;
        std::optional<TeamSide> concededTo;
        bool closed = false;
    };

    static void apply(Negotiation& negotiation, const EscalationRequest& request);

    WagerState wager_;
    bool optionPending_;
    bool optionDeclined_ = false;
    TeamSide optionSide_;
    std::optional<TeamSide> window_;
    std::uint64_t unitsBeforeDouble_ = 0;
    std::optional<TeamSide> concededTo_;
    bool closed_ = false;
};

} // namespace wgp

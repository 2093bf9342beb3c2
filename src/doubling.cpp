#include "doubling.hpp"

#include "errors.hpp"

#include <string>
#include <utility>

namespace wgp {

const char* toString(EscalationKind kind) {
    switch (kind) {
    case EscalationKind::Double:
        return "double";
    case EscalationKind::Redouble:
        return "redouble";
    case EscalationKind::Decline:
        return "decline";
    }
    return "unknown";
}

DoublingNegotiator::DoublingNegotiator(WagerState wager, bool optionPending, TeamSide optionSide)
    : wager_(std::move(wager))
    , optionPending_(optionPending)
    , optionSide_(optionSide) {}

const WagerState& DoublingNegotiator::negotiate(const std::vector<EscalationRequest>& requests) {
    Negotiation working{ wager_, window_, unitsBeforeDouble_, concededTo_, closed_ };
    for (const auto& request : requests) {
        apply(working, request);
    }
    wager_ = std::move(working.wager);
    window_ = working.window;
    unitsBeforeDouble_ = working.unitsBeforeDouble;
    concededTo_ = working.concededTo;
    closed_ = working.closed;
    return wager_;
}

void DoublingNegotiator::apply(Negotiation& negotiation, const EscalationRequest& request) {
    if (negotiation.wager.locked) {
        throw RuleRejection(RejectionReason::LateEscalation,
                            std::string(toString(request.kind)) + " after strokes were recorded");
    }
    if (negotiation.closed) {
        throw RuleRejection(RejectionReason::NegotiationClosed,
                            std::string(toString(request.kind)) + " after a decline");
    }

    switch (request.kind) {
    case EscalationKind::Double:
        negotiation.unitsBeforeDouble = negotiation.wager.units;
        WagerCalculator::applyMultiplier(negotiation.wager, WagerRule::Double, 2, request.side);
        negotiation.window = opposite(request.side);
        break;
    case EscalationKind::Redouble:
        if (!negotiation.window || *negotiation.window != request.side) {
            throw RuleRejection(RejectionReason::NoPendingEscalation,
                                std::string(toString(request.side)) + " has no double to answer");
        }
        WagerCalculator::applyMultiplier(negotiation.wager, WagerRule::Redouble, 2, request.side);
        negotiation.window.reset();
        break;
    case EscalationKind::Decline:
        if (negotiation.window && *negotiation.window == request.side) {
            const TeamSide winner = opposite(request.side);
            negotiation.wager.units = negotiation.unitsBeforeDouble;
            negotiation.wager.events.push_back(WagerEvent{ WagerRule::Concession,
                                                           WagerEffect::Override,
                                                           negotiation.unitsBeforeDouble,
                                                           negotiation.wager.units,
                                                           std::nullopt,
                                                           winner });
            negotiation.concededTo = winner;
        }
        negotiation.window.reset();
        negotiation.closed = true;
        break;
    }
}

void DoublingNegotiator::declineOption() {
    if (wager_.locked) {
        throw RuleRejection(RejectionReason::LateEscalation, "The Option can only be declined before strokes");
    }
    if (!optionPending_) {
        throw RuleRejection(RejectionReason::OptionUnavailable, "captain does not hold The Option");
    }
    if (optionDeclined_) {
        throw RuleRejection(RejectionReason::RuleAlreadyUsed, "The Option was already declined");
    }
    optionDeclined_ = true;
}

const WagerState& DoublingNegotiator::lock() {
    if (wager_.locked) {
        return wager_;
    }
    if (optionPending() && !concededTo_) {
        WagerCalculator::applyMultiplier(wager_, WagerRule::TheOption, 2, optionSide_);
    }
    wager_.locked = true;
    window_.reset();
    return wager_;
}

} // namespace wgp

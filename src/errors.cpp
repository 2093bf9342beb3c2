#include "errors.hpp"

#include <sstream>

namespace wgp {

namespace {

std::string formatMessage(const char* kind, const std::string& detail) {
    std::ostringstream oss;
    oss << kind;
    if (!detail.empty()) {
        oss << ": " << detail;
    }
    return oss.str();
}

std::string formatImbalance(std::uint32_t holeNumber,
                            const Quarters& imbalance,
                            const std::string& detail) {
    std::ostringstream oss;
    oss << "hole " << holeNumber << " delta sums to " << imbalance << " instead of 0";
    if (!detail.empty()) {
        oss << " (" << detail << ")";
    }
    return oss.str();
}

} // namespace

const char* toString(RejectionReason reason) {
    switch (reason) {
    case RejectionReason::InvalidPartner:
        return "invalid_partner";
    case RejectionReason::NotCaptain:
        return "not_captain";
    case RejectionReason::RuleAlreadyUsed:
        return "rule_already_used";
    case RejectionReason::InvalidTransition:
        return "invalid_transition";
    case RejectionReason::DuncanUnavailable:
        return "duncan_unavailable";
    case RejectionReason::CustomWagerOutsideSpecialPhase:
        return "custom_wager_outside_special_phase";
    case RejectionReason::CustomWagerValue:
        return "custom_wager_value";
    case RejectionReason::OptInBelowBase:
        return "opt_in_below_base";
    case RejectionReason::OptInNotApplicable:
        return "opt_in_not_applicable";
    case RejectionReason::LateEscalation:
        return "late_escalation";
    case RejectionReason::NegotiationClosed:
        return "negotiation_closed";
    case RejectionReason::NoPendingEscalation:
        return "no_pending_escalation";
    case RejectionReason::OptionUnavailable:
        return "option_unavailable";
    }
    return "unknown";
}

const char* toString(ValidationFailure failure) {
    switch (failure) {
    case ValidationFailure::MissingStrokes:
        return "missing_strokes";
    case ValidationFailure::UnknownPlayer:
        return "unknown_player";
    case ValidationFailure::InvalidStrokeCount:
        return "invalid_stroke_count";
    case ValidationFailure::HoleAlreadyCommitted:
        return "hole_already_committed";
    case ValidationFailure::HoleOutOfSequence:
        return "hole_out_of_sequence";
    case ValidationFailure::FormationIncomplete:
        return "formation_incomplete";
    case ValidationFailure::StrokesNotSubmitted:
        return "strokes_not_submitted";
    case ValidationFailure::InvalidRoster:
        return "invalid_roster";
    }
    return "unknown";
}

RuleRejection::RuleRejection(RejectionReason reason, const std::string& detail)
    : std::runtime_error(formatMessage(toString(reason), detail))
    , reason_(reason) {}

ValidationError::ValidationError(ValidationFailure failure, const std::string& detail)
    : std::runtime_error(formatMessage(toString(failure), detail))
    , failure_(failure) {}

InternalConsistencyError::InternalConsistencyError(std::uint32_t holeNumber,
                                                   Quarters imbalance,
                                                   const std::string& detail)
    : std::logic_error(formatImbalance(holeNumber, imbalance, detail))
    , holeNumber_(holeNumber)
    , imbalance_(std::move(imbalance)) {}

} // namespace wgp

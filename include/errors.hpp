#pragma once

#include "quarters.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wgp {

enum class RejectionReason {
    InvalidPartner,
    NotCaptain,
    RuleAlreadyUsed,
    InvalidTransition,
    DuncanUnavailable,
    CustomWagerOutsideSpecialPhase,
    CustomWagerValue,
    OptInBelowBase,
    OptInNotApplicable,
    LateEscalation,
    NegotiationClosed,
    NoPendingEscalation,
    OptionUnavailable
};

enum class ValidationFailure {
    MissingStrokes,
    UnknownPlayer,
    InvalidStrokeCount,
    HoleAlreadyCommitted,
    HoleOutOfSequence,
    FormationIncomplete,
    StrokesNotSubmitted,
    InvalidRoster
};

const char* toString(RejectionReason reason);
const char* toString(ValidationFailure failure);

// A rule precondition was not met. The caller may re-prompt; engine state is unchanged.
class RuleRejection : public std::runtime_error {
public:
    RuleRejection(RejectionReason reason, const std::string& detail);

    RejectionReason reason() const noexcept { return reason_; }

private:
    RejectionReason reason_;
};

// Input data was incomplete or out of order. Engine state is unchanged.
class ValidationError : public std::runtime_error {
public:
    ValidationError(ValidationFailure failure, const std::string& detail);

    ValidationFailure failure() const noexcept { return failure_; }

private:
    ValidationFailure failure_;
};

// A computed delta broke the zero-sum invariant. Indicates a rule-composition bug;
// the hole is never committed.
class InternalConsistencyError : public std::logic_error {
public:
    InternalConsistencyError(std::uint32_t holeNumber, Quarters imbalance, const std::string& detail);

    std::uint32_t holeNumber() const noexcept { return holeNumber_; }
    const Quarters& imbalance() const noexcept { return imbalance_; }

private:
    std::uint32_t holeNumber_;
    Quarters imbalance_;
};

} // namespace wgp

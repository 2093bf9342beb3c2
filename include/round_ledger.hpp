#pragma once

#include "distribution.hpp"
#include "player.hpp"
#include "quarters.hpp"
#include "scoring.hpp"
#include "standings.hpp"
#include "team_formation.hpp"
#include "transcript_log.hpp"
#include "wager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace wgp {

struct HoleRecord {
    std::uint32_t holeNumber = 0;
    TeamAssignment team;
    WagerState wager;
    Outcome outcome;
    PointsDelta delta;
    CarryOver carryIn;
    CarryOver carryOut;
    Quarters forfeited;
};

// Compensating entry for an already committed hole. History is never edited.
struct CorrectionRecord {
    std::uint32_t appliesToHole = 0;
    std::string reason;
    PointsDelta delta;
};

using LedgerEntry = std::variant<HoleRecord, CorrectionRecord>;

std::string encodeLedgerWire(const LedgerEntry& entry);

class RoundLedger {
public:
    RoundLedger(std::vector<PlayerId> roster, std::uint32_t holeCount);

    // Appends the next hole. Throws ValidationError for sequencing or roster
    // problems and InternalConsistencyError if the delta is not zero-sum; in both
    // cases nothing is appended.
    const HoleRecord& commit(HoleRecord record);
    const CorrectionRecord& commitCorrection(std::uint32_t appliesToHole,
                                             const std::string& reason,
                                             const PointsDelta& delta);

    Quarters runningTotal(PlayerId player) const;
    const RunningTotals& runningTotals() const { return totals_; }
    // True when every prefix of the ledger sums to zero and the totals match.
    bool zeroSumCheck() const;

    const std::vector<LedgerEntry>& entries() const { return entries_; }
    std::uint32_t lastCommittedHole() const { return lastHole_; }
    bool isCommitted(std::uint32_t holeNumber) const;
    const std::vector<PlayerId>& roster() const { return roster_; }

    std::string auditRoot() const { return audit_.merkleRoot(); }
    std::string auditLeaf(std::size_t index) const;
    std::vector<std::string> auditProof(std::size_t index) const;
    const TranscriptLog& audit() const { return audit_; }

private:
    void checkDelta(std::uint32_t holeNumber, const PointsDelta& delta, const std::string& what) const;
    void append(LedgerEntry entry, const PointsDelta& delta);

    std::vector<PlayerId> roster_;
    std::uint32_t holeCount_;
    std::uint32_t lastHole_ = 0;
    RunningTotals totals_;
    std::vector<LedgerEntry> entries_;
    TranscriptLog audit_;
};

} // namespace wgp

#include "round_ledger.hpp"

#include "errors.hpp"

#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace wgp {

namespace {

constexpr std::uint32_t kHoleRecordTag = 1;
constexpr std::uint32_t kCorrectionRecordTag = 2;

void writeU32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

void writeDelta(std::string& out, const PointsDelta& delta) {
    writeU64(out, static_cast<std::uint64_t>(delta.size()));
    for (const auto& [id, amount] : delta) {
        writeU32(out, id);
        writeString(out, amount.str());
    }
}

} // namespace

std::string encodeLedgerWire(const LedgerEntry& entry) {
    // Canonical little-endian layout:
    // | tag u32 | hole u32 | len-prefixed strings... | delta count u64 | (id u32, amount)... |
    // Hole records carry team, wager, outcome tag, best balls, carry in/out and forfeit;
    // corrections carry the reason.
    std::string out;
    out.reserve(128);
    std::visit(
        [&out](const auto& record) {
            using T = std::decay_t<decltype(record)>;
            if constexpr (std::is_same_v<T, HoleRecord>) {
                writeU32(out, kHoleRecordTag);
                writeU32(out, record.holeNumber);
                writeString(out, describe(record.team));
                writeString(out, record.wager.describe());
                writeString(out, toString(record.outcome.tag));
                writeU32(out, static_cast<std::uint32_t>(record.outcome.captainBestBall));
                writeU32(out, static_cast<std::uint32_t>(record.outcome.opponentsBestBall));
                writeString(out, record.carryIn.pending.str());
                writeString(out, record.carryOut.pending.str());
                writeU32(out, record.carryOut.consecutiveCarries);
                writeString(out, record.forfeited.str());
            } else {
                writeU32(out, kCorrectionRecordTag);
                writeU32(out, record.appliesToHole);
                writeString(out, record.reason);
            }
            writeDelta(out, record.delta);
        },
        entry);
    return out;
}

RoundLedger::RoundLedger(std::vector<PlayerId> roster, std::uint32_t holeCount)
    : roster_(std::move(roster))
    , holeCount_(holeCount) {
    std::set<PlayerId> unique(roster_.begin(), roster_.end());
    if (roster_.size() != kPlayersPerRound || unique.size() != roster_.size()) {
        throw ValidationError(ValidationFailure::InvalidRoster, "ledger needs four distinct players");
    }
    if (holeCount_ == 0) {
        throw std::invalid_argument("Ledger needs at least one hole");
    }
    for (auto id : roster_) {
        totals_[id] = Quarters();
    }
}

void RoundLedger::checkDelta(std::uint32_t holeNumber,
                             const PointsDelta& delta,
                             const std::string& what) const {
    for (const auto& entry : delta) {
        if (totals_.count(entry.first) == 0) {
            throw ValidationError(ValidationFailure::UnknownPlayer,
                                  what + " names player " + std::to_string(entry.first));
        }
    }
    Quarters imbalance = sumOf(delta);
    if (!imbalance.isZero()) {
        throw InternalConsistencyError(holeNumber, imbalance, what);
    }
}

void RoundLedger::append(LedgerEntry entry, const PointsDelta& delta) {
    for (const auto& [id, amount] : delta) {
        totals_[id] += amount;
    }
    audit_.append(encodeLedgerWire(entry));
    entries_.push_back(std::move(entry));
}

const HoleRecord& RoundLedger::commit(HoleRecord record) {
    const std::uint32_t hole = record.holeNumber;
    if (isCommitted(hole)) {
        throw ValidationError(ValidationFailure::HoleAlreadyCommitted,
                              "hole " + std::to_string(hole) + " is already in the ledger");
    }
    if (hole != lastHole_ + 1 || hole > holeCount_) {
        throw ValidationError(ValidationFailure::HoleOutOfSequence,
                              "expected hole " + std::to_string(lastHole_ + 1) + ", got " +
                                  std::to_string(hole));
    }
    checkDelta(hole, record.delta, "hole record");

    PointsDelta delta = record.delta;
    append(std::move(record), delta);
    lastHole_ = hole;
    return std::get<HoleRecord>(entries_.back());
}

const CorrectionRecord& RoundLedger::commitCorrection(std::uint32_t appliesToHole,
                                                      const std::string& reason,
                                                      const PointsDelta& delta) {
    if (!isCommitted(appliesToHole)) {
        throw ValidationError(ValidationFailure::HoleOutOfSequence,
                              "correction for uncommitted hole " + std::to_string(appliesToHole));
    }
    checkDelta(appliesToHole, delta, "correction");

    append(CorrectionRecord{ appliesToHole, reason, delta }, delta);
    return std::get<CorrectionRecord>(entries_.back());
}

Quarters RoundLedger::runningTotal(PlayerId player) const {
    auto it = totals_.find(player);
    if (it == totals_.end()) {
        throw ValidationError(ValidationFailure::UnknownPlayer,
                              "player " + std::to_string(player) + " is not in this round");
    }
    return it->second;
}

bool RoundLedger::zeroSumCheck() const {
    RunningTotals replay;
    for (auto id : roster_) {
        replay[id] = Quarters();
    }
    for (const auto& entry : entries_) {
        const PointsDelta& delta = std::visit(
            [](const auto& record) -> const PointsDelta& { return record.delta; }, entry);
        for (const auto& [id, amount] : delta) {
            replay[id] += amount;
        }
        if (!sumOf(replay).isZero()) {
            return false;
        }
    }
    return replay == totals_;
}

bool RoundLedger::isCommitted(std::uint32_t holeNumber) const {
    return holeNumber >= 1 && holeNumber <= lastHole_;
}

std::string RoundLedger::auditLeaf(std::size_t index) const {
    if (index >= audit_.size()) {
        throw std::out_of_range("No ledger entry at index " + std::to_string(index));
    }
    return audit_.getLeaf(index);
}

std::vector<std::string> RoundLedger::auditProof(std::size_t index) const {
    if (index >= audit_.size()) {
        throw std::out_of_range("No ledger entry at index " + std::to_string(index));
    }
    return audit_.merkleProof(index);
}

} // namespace wgp

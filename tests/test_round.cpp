#include "errors.hpp"
#include "rng.hpp"
#include "round.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "round_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Fn>
void expectRejection(wgp::RejectionReason expected, Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const wgp::RuleRejection& e) {
        if (e.reason() != expected) {
            fail(what + ": expected " + wgp::toString(expected) + ", got " + wgp::toString(e.reason()));
        }
        return;
    }
    fail(what + ": not rejected");
}

template <typename Fn>
void expectValidation(wgp::ValidationFailure expected, Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const wgp::ValidationError& e) {
        if (e.failure() != expected) {
            fail(what + ": expected " + wgp::toString(expected) + ", got " + wgp::toString(e.failure()));
        }
        return;
    }
    fail(what + ": not rejected");
}

std::vector<wgp::Player> roster() {
    std::vector<wgp::Player> players;
    players.emplace_back(1, "Stimpy", 12.0);
    players.emplace_back(2, "Ren", 8.5);
    players.emplace_back(3, "Powdered Toast", 18.0);
    players.emplace_back(4, "Muddy", 4.0);
    return players;
}

bool journalHas(const wgp::Round& round, const std::string& prefix) {
    for (const auto& event : round.journal().events()) {
        if (event.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

void checkTotals(const wgp::Round& round, const wgp::RunningTotals& expected, const std::string& what) {
    if (round.ledger().runningTotals() != expected) {
        std::string got;
        for (const auto& [id, amount] : round.ledger().runningTotals()) {
            got += std::to_string(id) + "=" + amount.str() + " ";
        }
        fail(what + ": unexpected totals " + got);
    }
    if (!round.ledger().zeroSumCheck()) {
        fail(what + ": ledger is not zero-sum");
    }
}

// Four-hole round whose last two holes are the special phase.
void shortRoundScenario() {
    using namespace wgp;

    RoundConfig cfg;
    cfg.holeCount = 4;
    cfg.specialPhaseStart = 3;
    cfg.doubleWindowFirst = 0;
    Round round(cfg, roster(), std::string("short-round"));
    if (round.roundId() != "short-round" || round.players()[2].teeIndex != 2) {
        fail("round setup wrong");
    }

    // Hole 1: a tie after a run of rejected calls.
    HoleSetup one = round.beginHole();
    if (one.captain != 1 || one.teeOrder != std::vector<PlayerId>{ 1, 2, 3, 4 } || one.optionPending) {
        fail("hole 1 setup wrong");
    }
    const std::map<PlayerId, int> holeOne{ { 1, 4 }, { 2, 5 }, { 3, 4 }, { 4, 6 } };
    expectValidation(ValidationFailure::FormationIncomplete, [&] { round.submitStrokes(1, holeOne); },
                     "strokes before a declaration");
    expectRejection(RejectionReason::InvalidPartner, [&] {
        round.declare(1, CaptainChoice::Partnership, 1);
    }, "captain partnering themselves");
    expectRejection(RejectionReason::CustomWagerOutsideSpecialPhase, [&] {
        round.declare(1, CaptainChoice::Solo, std::nullopt, { CustomWager{ 4 } });
    }, "custom wager on hole 1");
    if (round.currentTeams() || round.currentWager()) {
        fail("rejected declarations must leave hole 1 undeclared");
    }
    expectValidation(ValidationFailure::HoleOutOfSequence, [&] { round.declare(2, CaptainChoice::Solo); },
                     "declaring ahead");
    expectValidation(ValidationFailure::HoleOutOfSequence, [&] { round.beginHole(); }, "beginning twice");
    expectValidation(ValidationFailure::FormationIncomplete, [&] {
        round.negotiate(1, { { TeamSide::Captain, EscalationKind::Double } });
    }, "doubling before teams");
    expectRejection(RejectionReason::NotCaptain, [&] { round.declineOption(1, 2); }, "declining for the captain");
    expectRejection(RejectionReason::OptionUnavailable, [&] { round.declineOption(1, 1); }, "no Option to decline");

    round.declare(1, CaptainChoice::Partnership, 2);
    expectValidation(ValidationFailure::StrokesNotSubmitted, [&] { round.commit(1); }, "commit before strokes");
    expectValidation(ValidationFailure::MissingStrokes, [&] {
        round.submitStrokes(1, { { 1, 4 }, { 2, 5 }, { 3, 4 } });
    }, "missing strokes");
    Outcome tie = round.submitStrokes(1, holeOne);
    if (tie.tag != OutcomeTag::Tie) {
        fail("hole 1 should tie");
    }
    expectRejection(RejectionReason::LateEscalation, [&] {
        round.negotiate(1, { { TeamSide::Captain, EscalationKind::Double } });
    }, "double after strokes");
    expectRejection(RejectionReason::InvalidTransition, [&] { round.declare(1, CaptainChoice::Solo); },
                    "declaring after strokes");
    CommitResult first = round.commit(1);
    if (!first.zeroSumCheck || first.carryOver.pending != Quarters(1) || !sumOf(first.delta).isZero()) {
        fail("tie should carry one unit");
    }
    expectValidation(ValidationFailure::HoleAlreadyCommitted, [&] { round.commit(1); }, "second commit");

    // Hole 2: solo win collects the doubled wager plus the carry.
    HoleSetup two = round.beginHole();
    if (two.captain != 2 || two.carryIn.pending != Quarters(1)) {
        fail("hole 2 setup wrong");
    }
    round.declare(2, CaptainChoice::Solo);
    round.submitStrokes(2, { { 2, 3 }, { 1, 5 }, { 3, 5 }, { 4, 6 } });
    CommitResult second = round.commit(2);
    if (second.delta.at(2) != Quarters(9) || !second.carryOver.empty()) {
        fail("solo win should pay 3 x (2 + 1)");
    }
    checkTotals(round, { { 1, Quarters(-3) }, { 2, Quarters(9) }, { 3, Quarters(-3) }, { 4, Quarters(-3) } },
                "after hole 2");

    // Hole 3: the Goat never declares, so the partnership is forced; The Option applies.
    HoleSetup three = round.beginHole();
    if (!three.hole.specialPhase || three.captain != 1 || !three.optionPending ||
        three.teeOrder != std::vector<PlayerId>{ 1, 3, 4, 2 }) {
        fail("hole 3 should belong to the Goat holding The Option");
    }
    Outcome forcedOutcome = round.submitStrokes(3, { { 1, 4 }, { 3, 6 }, { 2, 5 }, { 4, 5 } });
    if (forcedOutcome.tag != OutcomeTag::CaptainWins) {
        fail("forced partnership should win hole 3");
    }
    auto teams = round.currentTeams();
    const auto* forced = teams ? std::get_if<PartnershipTeam>(&*teams) : nullptr;
    if (!forced || forced->partner != 3 || !forced->forcedByDefault) {
        fail("Goat should be paired with the second-worst total");
    }
    if (!journalHas(round, "forced-partnership:3:")) {
        fail("forced partnership not journaled");
    }
    auto lockedWager = round.currentWager();
    if (!lockedWager || !lockedWager->locked || lockedWager->units != 2 ||
        !lockedWager->hasRule(WagerRule::TheOption)) {
        fail("The Option should double the locked wager");
    }
    round.commit(3);
    checkTotals(round, { { 1, Quarters(0) }, { 2, Quarters(6) }, { 3, Quarters(0) }, { 4, Quarters(-6) } },
                "after hole 3");

    // Hole 4: Joe's Special with The Option declined.
    HoleSetup four = round.beginHole();
    if (four.captain != 4 || !four.optionPending) {
        fail("hole 4 should belong to player 4 holding The Option");
    }
    round.declare(4, CaptainChoice::Solo, std::nullopt, { CustomWager{ 8 }, DeclineOption{} });
    round.submitStrokes(4, { { 4, 6 }, { 1, 5 }, { 2, 5 }, { 3, 5 } });
    auto lastWager = round.currentWager();
    if (!lastWager || lastWager->units != 8 || lastWager->hasRule(WagerRule::TheOption)) {
        fail("custom wager of 8 with the Option declined");
    }
    CommitResult last = round.commit(4);
    checkTotals(round, { { 1, Quarters(8) }, { 2, Quarters(14) }, { 3, Quarters(8) }, { 4, Quarters(-30) } },
                "after hole 4");
    if (!last.zeroSumCheck || !round.finished()) {
        fail("round should be finished and balanced");
    }

    bool threw = false;
    try {
        round.beginHole();
    } catch (const std::out_of_range&) {
        threw = true;
    }
    if (!threw) {
        fail("a fifth hole should not exist");
    }

    round.correct(2, "handicap stroke missed", { { 1, Quarters(1) }, { 2, Quarters(-1) } });
    checkTotals(round, { { 1, Quarters(9) }, { 2, Quarters(13) }, { 3, Quarters(8) }, { 4, Quarters(-30) } },
                "after correction");
    if (!journalHas(round, "correction:2:") || round.ledger().entries().size() != 5) {
        fail("correction should be journaled and appended");
    }
}

void floatScenario() {
    using namespace wgp;

    RoundConfig cfg;
    Round round(cfg, roster(), std::string("float-round"));
    const std::map<PlayerId, int> even{ { 1, 4 }, { 2, 5 }, { 3, 5 }, { 4, 6 } };

    round.beginHole();
    TeamAssignment deferred = round.declare(1, CaptainChoice::Float);
    if (!std::holds_alternative<DeferredTeam>(deferred) || round.currentWager()) {
        fail("Float should defer without a wager");
    }
    expectRejection(RejectionReason::DuncanUnavailable, [&] { round.declare(1, CaptainChoice::Duncan); },
                    "Duncan after Float");
    round.declare(1, CaptainChoice::Solo);
    round.submitStrokes(1, even);
    round.commit(1);
    if (round.rotation().floatsUsed.at(1) != 1) {
        fail("Float should be spent when the hole commits");
    }

    for (std::uint32_t hole = 2; hole <= 4; ++hole) {
        HoleSetup setup = round.beginHole();
        round.declare(hole, CaptainChoice::Partnership, setup.teeOrder[1]);
        round.submitStrokes(hole, even);
        round.commit(hole);
    }

    HoleSetup five = round.beginHole();
    if (five.captain != 1) {
        fail("captaincy should come back to player 1 on hole 5");
    }
    const RotationState before = round.rotation();
    expectRejection(RejectionReason::RuleAlreadyUsed, [&] { round.declare(5, CaptainChoice::Float); },
                    "second Float in a round");
    if (round.currentTeams() || round.rotation().floatsUsed != before.floatsUsed ||
        round.rotation().captainIndex != before.captainIndex) {
        fail("rejected Float must not change the round");
    }
    round.declare(5, CaptainChoice::Partnership, five.teeOrder[1]);
    if (round.currentTeams() == std::nullopt) {
        fail("valid declaration after a rejection should stand");
    }
}

// Refusing a double settles the hole without strokes.
void concessionScenario() {
    using namespace wgp;

    Round round(RoundConfig{}, roster(), std::string("concession"));
    round.beginHole();
    round.declare(1, CaptainChoice::Partnership, 2);
    round.negotiate(1, { { TeamSide::Opponents, EscalationKind::Double } });
    WagerState settled = round.negotiate(1, { { TeamSide::Captain, EscalationKind::Decline } });
    if (settled.units != 1 || !settled.locked || !settled.hasRule(WagerRule::Concession)) {
        fail("refused double should lock the hole at the pre-double stake");
    }
    if (!journalHas(round, "concession:1:")) {
        fail("concession not journaled");
    }

    expectRejection(RejectionReason::InvalidTransition, [&] {
        round.submitStrokes(1, { { 1, 4 }, { 2, 4 }, { 3, 5 }, { 4, 5 } });
    }, "strokes on a conceded hole");
    expectRejection(RejectionReason::LateEscalation, [&] {
        round.negotiate(1, { { TeamSide::Opponents, EscalationKind::Double } });
    }, "double on a conceded hole");
    expectRejection(RejectionReason::InvalidTransition, [&] {
        round.declare(1, CaptainChoice::Solo);
    }, "declaring on a conceded hole");

    CommitResult result = round.commit(1);
    if (!result.zeroSumCheck) {
        fail("conceded hole broke zero-sum");
    }
    const Quarters share = Quarters::fromRatio(3, 2);
    checkTotals(round, { { 1, -share }, { 2, -share }, { 3, share }, { 4, share } }, "conceded hole");
    const auto& record = std::get<HoleRecord>(round.ledger().entries().back());
    if (record.outcome.tag != OutcomeTag::Conceded || record.outcome.winner != TeamSide::Opponents) {
        fail("ledger should record the concession");
    }
}

// Production setup: libsodium tee toss and a generated round id.
void secureSetupScenario() {
    using namespace wgp;

    SecureRng rng;
    Round round(RoundConfig{}, roster(), rng);

    std::vector<PlayerId> order = round.rotation().baseOrder;
    std::sort(order.begin(), order.end());
    if (order != std::vector<PlayerId>{ 1, 2, 3, 4 }) {
        fail("tossed tee order is not a permutation of the roster");
    }
    for (std::size_t i = 0; i < round.players().size(); ++i) {
        if (round.players()[i].id != round.rotation().baseOrder[i] || round.players()[i].teeIndex != i) {
            fail("players should be stored in tossed tee order");
        }
    }

    const std::string& id = round.roundId();
    if (id.size() != 32) {
        fail("round id should be 16 bytes of hex, got " + id);
    }
    for (char c : id) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c))) {
            fail("round id is not lower-case hex: " + id);
        }
    }
    Round other(RoundConfig{}, roster());
    if (other.roundId() == id) {
        fail("two generated round ids collided");
    }
}

struct RoundSummary {
    wgp::RunningTotals totals;
    std::string auditRoot;
    std::string journalRoot;
    std::vector<wgp::PlayerId> baseOrder;
};

RoundSummary playFullRound(std::uint64_t seed) {
    using namespace wgp;

    RoundConfig cfg;
    InsecureTestRng teeRng(seed);
    InsecureTestRng strokeRng(seed + 1);
    Round round(cfg, roster(), teeRng, std::string("determinism-round"));

    PlayerId floater = 0;
    while (!round.finished()) {
        HoleSetup setup = round.beginHole();
        const std::uint32_t hole = setup.hole.number;
        if (hole == 18) {
            // Left undeclared; the terminal default pairs the Goat.
        } else if (hole == 2) {
            floater = setup.captain;
            round.declare(hole, CaptainChoice::Float);
            round.declare(hole, CaptainChoice::Partnership, setup.teeOrder[2]);
        } else if (hole % 3 == 0) {
            round.declare(hole, CaptainChoice::Solo);
        } else {
            round.declare(hole, CaptainChoice::Partnership, setup.teeOrder[1]);
        }
        if (hole == 5) {
            round.negotiate(hole, { { TeamSide::Opponents, EscalationKind::Double },
                                    { TeamSide::Captain, EscalationKind::Redouble } });
        }

        std::map<PlayerId, int> strokes;
        for (auto id : setup.teeOrder) {
            strokes[id] = 3 + static_cast<int>(strokeRng.uniformBelow(4));
        }
        round.submitStrokes(hole, strokes);
        CommitResult result = round.commit(hole);
        if (!result.zeroSumCheck || !sumOf(result.delta).isZero() || !sumOf(result.runningTotals).isZero()) {
            fail("hole " + std::to_string(hole) + " broke the zero-sum invariant");
        }
    }

    if (round.ledger().entries().size() != cfg.holeCount || round.ledger().lastCommittedHole() != 18) {
        fail("full round should commit all 18 holes");
    }
    const auto& finalHole = std::get<HoleRecord>(round.ledger().entries().back());
    const auto* forced = std::get_if<PartnershipTeam>(&finalHole.team);
    if (!forced || !forced->forcedByDefault) {
        fail("hole 18 should have been forced");
    }
    if (round.rotation().floatsUsed.at(floater) != 1) {
        fail("hole 2 Float not recorded");
    }
    if (round.players()[0].id != round.rotation().baseOrder.front()) {
        fail("players should be kept in tossed tee order");
    }

    return RoundSummary{ round.ledger().runningTotals(), round.ledger().auditRoot(), round.journal().merkleRoot(),
                         round.rotation().baseOrder };
}

} // namespace

int main() {
    shortRoundScenario();
    floatScenario();
    concessionScenario();
    secureSetupScenario();

    RoundSummary a = playFullRound(20240611);
    RoundSummary b = playFullRound(20240611);
    if (a.totals != b.totals || a.auditRoot != b.auditRoot || a.journalRoot != b.journalRoot ||
        a.baseOrder != b.baseOrder) {
        fail("identical seeds produced different rounds");
    }
    if (a.auditRoot.empty() || a.journalRoot.empty()) {
        fail("round transcripts missing");
    }

    std::cout << "Round checks passed. Ledger root: " << a.auditRoot << "\n";
    return 0;
}

#include "round_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Fn>
void expectInvalid(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return;
    }
    fail(what + " was accepted");
}

void clearEnv() {
    for (const char* name : { "WGP_HOLE_COUNT",
                              "WGP_SPECIAL_PHASE_START",
                              "WGP_CARRY_LIMIT",
                              "WGP_OUTLIER_THRESHOLD",
                              "WGP_FLOATS_PER_PLAYER",
                              "WGP_DOUBLE_POINTS_ROUND" }) {
        unsetenv(name);
    }
}

} // namespace

int main() {
    using namespace wgp;

    RoundConfig cfg;
    cfg.validate();
    if (cfg.isSpecialPhase(16) || !cfg.isSpecialPhase(17) || !cfg.isSpecialPhase(18)) {
        fail("special phase should cover holes 17 and 18");
    }
    if (cfg.isDoubleWindow(12) || !cfg.isDoubleWindow(13) || !cfg.isDoubleWindow(16) ||
        cfg.isDoubleWindow(17)) {
        fail("double window should cover holes 13 to 16");
    }

    Hole thirteen = cfg.hole(13);
    if (thirteen.number != 13 || thirteen.par != 4 || !thirteen.doublePoints || thirteen.specialPhase) {
        fail("hole 13 metadata wrong");
    }
    Hole eighteen = cfg.hole(18);
    if (!eighteen.specialPhase || eighteen.doublePoints) {
        fail("hole 18 metadata wrong");
    }

    bool threw = false;
    try {
        (void)cfg.hole(19);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    if (!threw) {
        fail("hole 19 should be outside the round");
    }

    expectInvalid([] {
        RoundConfig bad;
        bad.carryLimit = 0;
        bad.validate();
    }, "zero carry limit");
    expectInvalid([] {
        RoundConfig bad;
        bad.specialPhaseStart = 15;
        bad.validate();
    }, "a four-hole special phase");
    expectInvalid([] {
        RoundConfig bad;
        bad.doubleWindowLast = 17;
        bad.validate();
    }, "a double window overlapping the special phase");
    expectInvalid([] {
        RoundConfig bad;
        bad.pars = { 4, 4, 3 };
        bad.validate();
    }, "a short par list");

    RoundConfig shortRound;
    shortRound.holeCount = 4;
    shortRound.specialPhaseStart = 3;
    shortRound.doubleWindowFirst = 0;
    shortRound.pars = { 4, 3, 5, 4 };
    shortRound.validate();
    if (shortRound.isDoubleWindow(2) || shortRound.hole(3).par != 5) {
        fail("short round metadata wrong");
    }

    clearEnv();
    setenv("WGP_CARRY_LIMIT", "  5 ", 1);
    setenv("WGP_OUTLIER_THRESHOLD", "0", 1);
    setenv("WGP_DOUBLE_POINTS_ROUND", "yes", 1);
    RoundConfig fromEnv = RoundConfig::fromEnvironment();
    if (fromEnv.carryLimit != 5 || fromEnv.outlierThreshold != 0 || !fromEnv.doublePointsRound) {
        fail("environment overrides not applied");
    }
    if (fromEnv.holeCount != 18) {
        fail("unset variables should keep defaults");
    }

    setenv("WGP_FLOATS_PER_PLAYER", "two", 1);
    expectInvalid([] { (void)RoundConfig::fromEnvironment(); }, "non-numeric float budget");
    clearEnv();

    setenv("WGP_HOLE_COUNT", "9", 1);
    expectInvalid([] { (void)RoundConfig::fromEnvironment(); }, "nine holes with the default special phase");
    setenv("WGP_SPECIAL_PHASE_START", "8", 1);
    RoundConfig nine = RoundConfig::fromEnvironment([] {
        RoundConfig base;
        base.doubleWindowFirst = 0;
        return base;
    }());
    if (nine.holeCount != 9 || !nine.isSpecialPhase(8)) {
        fail("nine-hole overrides not applied");
    }
    clearEnv();

    std::cout << "Round configuration checks passed\n";
    return 0;
}

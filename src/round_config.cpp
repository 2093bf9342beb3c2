#include "round_config.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace wgp {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::uint32_t parseUnsigned(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" +
                                    value + "\"");
    }
    if (consumed != value.size() || parsed > 0xFFFFFFFFul) {
        throw std::invalid_argument(std::string(name) + " must be an unsigned integer, got \"" +
                                    value + "\"");
    }
    return static_cast<std::uint32_t>(parsed);
}

bool parseFlag(const char* name, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    throw std::invalid_argument(std::string(name) + " must be a boolean flag, got \"" + value + "\"");
}

void overrideUnsigned(const char* name, std::uint32_t& field) {
    if (auto value = readEnv(name)) {
        field = parseUnsigned(name, *value);
    }
}

} // namespace

void RoundConfig::validate() const {
    if (holeCount < 2) {
        throw std::invalid_argument("Round needs at least two holes");
    }
    if (specialPhaseStart < 2 || specialPhaseStart > holeCount) {
        throw std::invalid_argument("Special phase must start after hole 1 and within the round");
    }
    if (holeCount - specialPhaseStart + 1 > 2) {
        throw std::invalid_argument("Special phase covers the final one or two holes only");
    }
    if (doubleWindowFirst != 0) {
        if (doubleWindowFirst > doubleWindowLast) {
            throw std::invalid_argument("Double-points window is inverted");
        }
        if (doubleWindowLast >= specialPhaseStart) {
            throw std::invalid_argument("Double-points window must end before the special phase");
        }
    }
    if (carryLimit == 0) {
        throw std::invalid_argument("Carry limit must be at least one");
    }
    if (outlierWeight < 1) {
        throw std::invalid_argument("Outlier weight must be at least one");
    }
    if (!pars.empty() && pars.size() != holeCount) {
        throw std::invalid_argument("Par list must cover every hole");
    }
    for (auto par : pars) {
        if (par < 3 || par > 6) {
            throw std::invalid_argument("Hole par out of range");
        }
    }
}

bool RoundConfig::isSpecialPhase(std::uint32_t holeNumber) const {
    return holeNumber >= specialPhaseStart && holeNumber <= holeCount;
}

bool RoundConfig::isDoubleWindow(std::uint32_t holeNumber) const {
    if (doubleWindowFirst == 0) {
        return false;
    }
    return holeNumber >= doubleWindowFirst && holeNumber <= doubleWindowLast;
}

Hole RoundConfig::hole(std::uint32_t holeNumber) const {
    if (holeNumber == 0 || holeNumber > holeCount) {
        throw std::out_of_range("Hole " + std::to_string(holeNumber) + " is outside the round");
    }
    Hole out;
    out.number = holeNumber;
    out.par = pars.empty() ? 4 : pars[holeNumber - 1];
    out.specialPhase = isSpecialPhase(holeNumber);
    out.doublePoints = isDoubleWindow(holeNumber);
    return out;
}

RoundConfig RoundConfig::fromEnvironment() {
    return fromEnvironment(RoundConfig{});
}

RoundConfig RoundConfig::fromEnvironment(const RoundConfig& defaults) {
    RoundConfig base = defaults;
    overrideUnsigned("WGP_HOLE_COUNT", base.holeCount);
    overrideUnsigned("WGP_SPECIAL_PHASE_START", base.specialPhaseStart);
    overrideUnsigned("WGP_CARRY_LIMIT", base.carryLimit);
    overrideUnsigned("WGP_OUTLIER_THRESHOLD", base.outlierThreshold);
    overrideUnsigned("WGP_FLOATS_PER_PLAYER", base.floatsPerPlayer);
    if (auto value = readEnv("WGP_DOUBLE_POINTS_ROUND")) {
        base.doublePointsRound = parseFlag("WGP_DOUBLE_POINTS_ROUND", *value);
    }
    base.validate();
    return base;
}

} // namespace wgp

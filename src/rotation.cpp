#include "rotation.hpp"

#include "rng.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

namespace wgp {

RotationManager::RotationManager(const RoundConfig& cfg, std::vector<PlayerId> baseOrder)
    : cfg_(cfg) {
    cfg_.validate();
    if (baseOrder.size() != kPlayersPerRound) {
        throw std::invalid_argument("Rotation needs exactly four players");
    }
    std::set<PlayerId> unique(baseOrder.begin(), baseOrder.end());
    if (unique.size() != baseOrder.size()) {
        throw std::invalid_argument("Rotation players must be distinct");
    }
    state_.baseOrder = std::move(baseOrder);
    for (auto id : state_.baseOrder) {
        state_.floatsUsed[id] = 0;
    }
}

std::vector<PlayerId> RotationManager::tossTees(std::vector<PlayerId> players, RandomSource& rng) {
    shuffleWith(players, rng);
    return players;
}

RotationStep RotationManager::advance(std::optional<std::size_t> previousCaptainIndex,
                                      const RunningTotals& runningTotals) {
    const std::uint32_t holeNumber = state_.holeNumber + 1;
    if (holeNumber > cfg_.holeCount) {
        throw std::out_of_range("Cannot advance past hole " + std::to_string(cfg_.holeCount));
    }
    const std::size_t seats = state_.baseOrder.size();
    if (previousCaptainIndex && *previousCaptainIndex >= seats) {
        throw std::out_of_range("Previous captain index outside the rotation");
    }

    std::size_t rotationIndex = previousCaptainIndex ? (*previousCaptainIndex + 1) % seats : 0;
    std::vector<PlayerId> order = rotatedFrom(rotationIndex);
    std::size_t captainIndex = rotationIndex;

    const bool special = cfg_.isSpecialPhase(holeNumber);
    if (special) {
        PlayerId goat = rankWorstFirst(runningTotals, state_.baseOrder).front();
        auto goatIt = std::find(order.begin(), order.end(), goat);
        std::rotate(order.begin(), goatIt, goatIt + 1);
        captainIndex = static_cast<std::size_t>(
            std::find(state_.baseOrder.begin(), state_.baseOrder.end(), goat) -
            state_.baseOrder.begin());
    }

    state_.holeNumber = holeNumber;
    state_.captainIndex = captainIndex;
    state_.rotationIndex = rotationIndex;
    state_.teeOrder = order;

    RotationStep step;
    step.holeNumber = holeNumber;
    step.captainIndex = captainIndex;
    step.captain = order.front();
    step.teeOrder = std::move(order);
    step.specialPhase = special;
    return step;
}

RotationStep RotationManager::next(const RunningTotals& runningTotals) {
    if (state_.holeNumber == 0) {
        return advance(std::nullopt, runningTotals);
    }
    return advance(state_.rotationIndex, runningTotals);
}

std::uint32_t RotationManager::floatsRemaining(PlayerId player) const {
    auto it = state_.floatsUsed.find(player);
    if (it == state_.floatsUsed.end()) {
        return 0;
    }
    return it->second >= cfg_.floatsPerPlayer ? 0 : cfg_.floatsPerPlayer - it->second;
}

void RotationManager::recordFloat(PlayerId player) {
    if (floatsRemaining(player) == 0) {
        throw std::logic_error("Float recorded for player " + std::to_string(player) +
                               " without tokens left");
    }
    ++state_.floatsUsed[player];
}

std::vector<PlayerId> RotationManager::rotatedFrom(std::size_t captainIndex) const {
    std::vector<PlayerId> order = state_.baseOrder;
    std::rotate(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(captainIndex), order.end());
    return order;
}

} // namespace wgp

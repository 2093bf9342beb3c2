#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace wgp {

using PlayerId = std::uint32_t;

inline constexpr std::size_t kPlayersPerRound = 4;

struct Player {
    PlayerId id;
    std::string name;
    double handicap;
    std::uint32_t teeIndex = 0;

    Player(PlayerId id_, std::string name_, double handicap_)
        : id(id_), name(std::move(name_)), handicap(handicap_) {}
};

struct Hole {
    std::uint32_t number = 0;
    std::uint32_t par = 4;
    bool specialPhase = false;
    bool doublePoints = false;
};

} // namespace wgp

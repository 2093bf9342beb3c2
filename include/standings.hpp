#pragma once

#include "player.hpp"
#include "quarters.hpp"

#include <map>
#include <vector>

namespace wgp {

using PointsDelta = std::map<PlayerId, Quarters>;
using RunningTotals = std::map<PlayerId, Quarters>;

Quarters sumOf(const std::map<PlayerId, Quarters>& amounts);

// Players ordered from worst running total to best. Equal totals keep the order in
// which the players appear in `teeOrder`. Players absent from `totals` count as 0.
std::vector<PlayerId> rankWorstFirst(const RunningTotals& totals,
                                     const std::vector<PlayerId>& teeOrder);

} // namespace wgp

#include "standings.hpp"

#include <algorithm>

namespace wgp {

Quarters sumOf(const std::map<PlayerId, Quarters>& amounts) {
    Quarters total;
    for (const auto& [player, amount] : amounts) {
        (void)player;
        total += amount;
    }
    return total;
}

std::vector<PlayerId> rankWorstFirst(const RunningTotals& totals,
                                     const std::vector<PlayerId>& teeOrder) {
    auto totalOf = [&totals](PlayerId id) {
        auto it = totals.find(id);
        return it == totals.end() ? Quarters() : it->second;
    };
    std::vector<PlayerId> ranked = teeOrder;
    std::stable_sort(ranked.begin(), ranked.end(), [&](PlayerId a, PlayerId b) {
        return totalOf(a) < totalOf(b);
    });
    return ranked;
}

} // namespace wgp

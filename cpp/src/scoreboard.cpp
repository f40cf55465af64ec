#include "hellsurvivor/scoreboard.hpp"

#include <algorithm>

namespace hs {
namespace {

bool ranks_above(const ScoreEntry& a, const ScoreEntry& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.time_s > b.time_s;
}

} // namespace

int Scoreboard::record(const ScoreEntry& entry) {
    // Equal entries keep arrival order, so a later tie lands below.
    const auto pos = std::upper_bound(entries_.begin(), entries_.end(), entry,
                                      [](const ScoreEntry& a, const ScoreEntry& b) { return ranks_above(a, b); });
    const auto rank = static_cast<std::size_t>(pos - entries_.begin());
    if (rank >= kCapacity) return 0;

    entries_.insert(pos, entry);
    if (entries_.size() > kCapacity) entries_.pop_back();
    return static_cast<int>(rank) + 1;
}

} // namespace hs

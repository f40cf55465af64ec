#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hs {

struct ScoreEntry {
    int score = 0;
    float time_s = 0.0f;
    int wave = 1;
    int kills = 0;
    std::uint64_t seed = 0;
};

// Best runs of the current process, highest score first; ties go to the
// longer survival time.
class Scoreboard {
  public:
    static constexpr std::size_t kCapacity = 10;

    // Returns the 1-based rank the run landed on, or 0 if it did not make the table.
    int record(const ScoreEntry& entry);

    const std::vector<ScoreEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

  private:
    std::vector<ScoreEntry> entries_;
};

} // namespace hs

#pragma once

#include "collision.hpp"
#include "rng.hpp"

#include <optional>
#include <vector>

namespace hs {

struct Obstruction {
    Vec2 anchor{};
    Rect box{};
};

Rect island_rect();
Rect map_rect();

// Static platform geometry: the island the actors live on and the obstruction
// rectangles that block movement. Bosses may remove obstructions at runtime.
class TerrainModel {
  public:
    TerrainModel();
    explicit TerrainModel(Rect island);

    static TerrainModel generate(DeterministicRng& rng);

    const Rect& island() const { return island_; }
    const std::vector<Obstruction>& obstructions() const { return obstructions_; }

    void add_obstruction(Vec2 anchor);

    bool blocked(const Rect& box) const;
    int blocking_index(const Rect& box) const;

    // Removes the obstruction permanently and returns its anchor.
    std::optional<Vec2> destroy(int index);

    Vec2 clamp(Vec2 pos, Vec2 size) const { return clamp_into(pos, size, island_); }

  private:
    Rect island_;
    std::vector<Obstruction> obstructions_;
};

} // namespace hs

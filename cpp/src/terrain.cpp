#include "hellsurvivor/terrain.hpp"

#include "hellsurvivor/config.hpp"

namespace hs {

Rect island_rect() {
    return {kIslandLeft, kIslandTop, kIslandRight - kIslandLeft, kIslandBottom - kIslandTop};
}

Rect map_rect() { return {0.0f, 0.0f, kMapWidth, kMapHeight}; }

TerrainModel::TerrainModel() : island_(island_rect()) {}

TerrainModel::TerrainModel(Rect island) : island_(island) {}

TerrainModel TerrainModel::generate(DeterministicRng& rng) {
    TerrainModel terrain;
    const Vec2 center{kMapWidth * 0.5f, kMapHeight * 0.5f};
    std::vector<Vec2> anchors;

    int attempts = 0;
    while (static_cast<int>(anchors.size()) < kObstructionCount && attempts < kObstructionPlacementAttempts) {
        ++attempts;
        const Vec2 candidate{
            static_cast<float>(rng.uniform_int(static_cast<int>(kIslandLeft) + 20, static_cast<int>(kIslandRight) - 40)),
            static_cast<float>(rng.uniform_int(static_cast<int>(kIslandTop) + 20, static_cast<int>(kIslandBottom) - 40)),
        };
        if (distance(candidate, center) < kObstructionMinDistFromCenter) continue;

        bool too_close = false;
        for (const auto& other : anchors) {
            if (distance(candidate, other) < kObstructionMinSpacing) {
                too_close = true;
                break;
            }
        }
        if (!too_close) anchors.push_back(candidate);
    }

    for (const auto& a : anchors) terrain.add_obstruction(a);
    return terrain;
}

void TerrainModel::add_obstruction(Vec2 anchor) {
    Obstruction o{};
    o.anchor = anchor;
    o.box = {anchor.x + kObstructionOffsetX, anchor.y + kObstructionOffsetY, kObstructionWidth, kObstructionHeight};
    obstructions_.push_back(o);
}

bool TerrainModel::blocked(const Rect& box) const { return blocking_index(box) >= 0; }

int TerrainModel::blocking_index(const Rect& box) const {
    for (size_t i = 0; i < obstructions_.size(); ++i) {
        if (rects_overlap(box, obstructions_[i].box)) return static_cast<int>(i);
    }
    return -1;
}

std::optional<Vec2> TerrainModel::destroy(int index) {
    if (index < 0 || index >= static_cast<int>(obstructions_.size())) return std::nullopt;
    const Vec2 anchor = obstructions_[static_cast<size_t>(index)].anchor;
    obstructions_.erase(obstructions_.begin() + index);
    return anchor;
}

} // namespace hs

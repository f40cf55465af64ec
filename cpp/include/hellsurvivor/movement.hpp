#pragma once

#include "collision.hpp"
#include "terrain.hpp"

#include <array>
#include <cstdint>

namespace hs {

enum class MoveOutcome : uint8_t {
    Clear,
    SlidX,
    SlidY,
    Deflected,
    Stuck
};

struct SlidePolicy {
    bool axis_slide = true;
    std::array<Vec2, 2> deflections{};
    int deflection_count = 0;
};

struct MoveResult {
    Vec2 pos{};
    MoveOutcome outcome = MoveOutcome::Clear;
    // Obstruction overlapping the intended (unclamped) full move, -1 if none.
    int blocking_index = -1;
};

SlidePolicy slide_only();
SlidePolicy no_slide();
SlidePolicy slide_and_deflect(Vec2 deflect_a, Vec2 deflect_b);

// Axis-decomposed slide-around-obstacle move. Every candidate is clamped to
// `bounds` before it is tested against the terrain; if nothing fits the
// entity stays at `origin`.
MoveResult resolve_move(const TerrainModel& terrain, const Rect& bounds, Vec2 origin, Vec2 size, Vec2 delta,
                        const SlidePolicy& policy);

} // namespace hs

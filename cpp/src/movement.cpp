#include "hellsurvivor/movement.hpp"

#include <cmath>

namespace hs {

namespace {

constexpr float kAxisEpsilon = 1e-6f;

bool fits(const TerrainModel& terrain, Vec2 pos, Vec2 size) {
    return !terrain.blocked({pos.x, pos.y, size.x, size.y});
}

} // namespace

SlidePolicy slide_only() { return SlidePolicy{}; }

SlidePolicy no_slide() {
    SlidePolicy p{};
    p.axis_slide = false;
    return p;
}

SlidePolicy slide_and_deflect(Vec2 deflect_a, Vec2 deflect_b) {
    SlidePolicy p{};
    p.deflections = {deflect_a, deflect_b};
    p.deflection_count = 2;
    return p;
}

MoveResult resolve_move(const TerrainModel& terrain, const Rect& bounds, Vec2 origin, Vec2 size, Vec2 delta,
                        const SlidePolicy& policy) {
    MoveResult out{};
    out.pos = origin;

    const Vec2 full = clamp_into({origin.x + delta.x, origin.y + delta.y}, size, bounds);
    if (fits(terrain, full, size)) {
        out.pos = full;
        out.outcome = MoveOutcome::Clear;
        return out;
    }

    out.blocking_index = terrain.blocking_index({origin.x + delta.x, origin.y + delta.y, size.x, size.y});
    if (out.blocking_index < 0) {
        out.blocking_index = terrain.blocking_index({full.x, full.y, size.x, size.y});
    }

    // An axis with no motion is not a slide.
    if (policy.axis_slide && std::abs(delta.x) > kAxisEpsilon) {
        const Vec2 x_only = clamp_into({origin.x + delta.x, origin.y}, size, bounds);
        if (fits(terrain, x_only, size)) {
            out.pos = x_only;
            out.outcome = MoveOutcome::SlidX;
            return out;
        }
    }
    if (policy.axis_slide && std::abs(delta.y) > kAxisEpsilon) {
        const Vec2 y_only = clamp_into({origin.x, origin.y + delta.y}, size, bounds);
        if (fits(terrain, y_only, size)) {
            out.pos = y_only;
            out.outcome = MoveOutcome::SlidY;
            return out;
        }
    }

    for (int i = 0; i < policy.deflection_count; ++i) {
        const Vec2 d = policy.deflections[static_cast<size_t>(i)];
        const Vec2 candidate = clamp_into({origin.x + d.x, origin.y + d.y}, size, bounds);
        if (fits(terrain, candidate, size)) {
            out.pos = candidate;
            out.outcome = MoveOutcome::Deflected;
            return out;
        }
    }

    out.pos = origin;
    out.outcome = MoveOutcome::Stuck;
    return out;
}

} // namespace hs

#include "hellsurvivor/collision.hpp"

#include <algorithm>
#include <cmath>

namespace hs {

namespace {

constexpr float kEpsilon = 1e-6f;

} // namespace

float length(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }

float distance(Vec2 a, Vec2 b) { return length({a.x - b.x, a.y - b.y}); }

Vec2 normalize(Vec2 v) {
    const float l = length(v);
    if (l <= kEpsilon) return {0.0f, 0.0f};
    return {v.x / l, v.y / l};
}

bool is_finite_vec(Vec2 v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

Vec2 rect_center(const Rect& r) {
    return {r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

// Half-open overlap test: rectangles that only share an edge do not collide.
bool rects_overlap(const Rect& a, const Rect& b) {
    return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
}

bool rect_contains(const Rect& outer, const Rect& inner) {
    return inner.x >= outer.x && inner.y >= outer.y && inner.x + inner.w <= outer.x + outer.w &&
           inner.y + inner.h <= outer.y + outer.h;
}

Vec2 clamp_into(Vec2 pos, Vec2 size, const Rect& bounds) {
    const float max_x = std::max(bounds.x, bounds.x + bounds.w - size.x);
    const float max_y = std::max(bounds.y, bounds.y + bounds.h - size.y);
    return {
        std::clamp(pos.x, bounds.x, max_x),
        std::clamp(pos.y, bounds.y, max_y),
    };
}

} // namespace hs

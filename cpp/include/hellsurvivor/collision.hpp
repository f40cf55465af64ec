#pragma once

namespace hs {

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

float length(Vec2 v);
float distance(Vec2 a, Vec2 b);
Vec2 normalize(Vec2 v);
bool is_finite_vec(Vec2 v);

Vec2 rect_center(const Rect& r);
bool rects_overlap(const Rect& a, const Rect& b);
bool rect_contains(const Rect& outer, const Rect& inner);

// Clamps a top-left position so that a box of `size` stays inside `bounds`.
Vec2 clamp_into(Vec2 pos, Vec2 size, const Rect& bounds);

} // namespace hs

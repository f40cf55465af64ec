#include "hellsurvivor/effects.hpp"

#include <algorithm>
#include <cmath>

namespace hs {

namespace {

constexpr float kTwoPi = 6.28318530718f;
constexpr float kParticleGravity = 0.1f;
constexpr float kTextDrag = 0.95f;

struct Burst {
    int count;
    float min_speed;
    float max_speed;
    float lift;
    int min_life;
    int max_life;
    int min_size;
    int max_size;
};

void emit(GameState& state, DeterministicRng& rng, Vec2 at, const Burst& b, EffectKind source) {
    for (int i = 0; i < b.count; ++i) {
        const float angle = rng.uniform(0.0f, kTwoPi);
        const float speed = rng.uniform(b.min_speed, b.max_speed);
        Particle p{};
        p.pos = at;
        p.vel = {std::cos(angle) * speed, std::sin(angle) * speed - b.lift};
        p.lifetime = rng.uniform_int(b.min_life, b.max_life);
        p.max_lifetime = p.lifetime;
        p.size = static_cast<float>(rng.uniform_int(b.min_size, b.max_size));
        p.source = source;
        state.particles.push_back(p);
    }
}

} // namespace

void spawn_effect_particles(GameState& state, const EffectEvent& ev, DeterministicRng& rng) {
    switch (ev.kind) {
    case EffectKind::EnemyDeath: {
        const int count = ev.enemy == EnemyKind::Boss ? 20 : (ev.enemy == EnemyKind::Pursuer ? 10 : 8);
        emit(state, rng, ev.pos, {count, 1.5f, 4.0f, 1.0f, 20, 40, 3, 6}, ev.kind);
        FloatingText text{};
        text.pos = {ev.pos.x, ev.pos.y - 10.0f};
        text.value = ev.value;
        state.floating_texts.push_back(text);
        break;
    }
    case EffectKind::ObstructionDestroyed: {
        emit(state, rng, ev.pos, {15, 2.0f, 5.0f, 2.0f, 25, 50, 3, 7}, ev.kind);
        // Falling debris from the top of the obstruction.
        for (int i = 0; i < 6; ++i) {
            Particle p{};
            p.pos = {ev.pos.x + static_cast<float>(rng.uniform_int(-10, 10)),
                     ev.pos.y - 14.0f + static_cast<float>(rng.uniform_int(-5, 5))};
            p.vel = {rng.uniform(-1.0f, 1.0f), rng.uniform(-2.0f, 0.0f)};
            p.lifetime = rng.uniform_int(40, 60);
            p.max_lifetime = p.lifetime;
            p.size = static_cast<float>(rng.uniform_int(2, 4));
            p.source = ev.kind;
            state.particles.push_back(p);
        }
        break;
    }
    case EffectKind::Explosion:
        emit(state, rng, ev.pos, {static_cast<int>(ev.radius / 2.0f) + 10, 2.0f, 5.0f, 0.0f, 15, 35, 4, 8}, ev.kind);
        emit(state, rng, ev.pos, {8, 0.5f, 2.0f, 1.0f, 10, 20, 2, 4}, ev.kind);
        break;
    case EffectKind::WeaponDiscarded:
        emit(state, rng, ev.pos, {20, 1.0f, 4.0f, 2.0f, 20, 40, 4, 4}, ev.kind);
        break;
    default:
        break;
    }
}

void advance_effects(GameState& state) {
    for (auto& p : state.particles) {
        p.pos.x += p.vel.x;
        p.pos.y += p.vel.y;
        p.vel.y += kParticleGravity;
        p.lifetime -= 1;
    }
    state.particles.erase(std::remove_if(state.particles.begin(), state.particles.end(),
                                         [](const Particle& p) { return p.lifetime <= 0; }),
                          state.particles.end());

    for (auto& t : state.floating_texts) {
        t.pos.y += t.dy;
        t.dy *= kTextDrag;
        t.lifetime -= 1;
    }
    state.floating_texts.erase(std::remove_if(state.floating_texts.begin(), state.floating_texts.end(),
                                              [](const FloatingText& t) { return t.lifetime <= 0; }),
                               state.floating_texts.end());
}

} // namespace hs

#include "hellsurvivor/enemies.hpp"

#include "hellsurvivor/config.hpp"
#include "hellsurvivor/movement.hpp"
#include "hellsurvivor/actors.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace hs {

namespace {

constexpr float kPi = 3.14159265358979f;
constexpr float kTwoPi = 2.0f * kPi;
constexpr float kDirEpsilon = 1e-6f;

constexpr float kWandererChaseChance = 0.1f;
constexpr int kWandererAnimTicks = 10;
constexpr float kPursuerSlitherStep = 0.3f;
constexpr float kPursuerSlitherAmplitude = 0.5f;

EnemyBrain brain_for(EnemyKind kind) {
    switch (kind) {
    case EnemyKind::Wanderer:
        return WandererBrain{};
    case EnemyKind::Pursuer:
        return PursuerBrain{};
    case EnemyKind::Boss:
        return BossBrain{};
    }
    return WandererBrain{};
}

Vec2 scaled(Vec2 v, float s) { return {v.x * s, v.y * s}; }

void update_wanderer(Enemy& e, EnemyContext& ctx) {
    auto& brain = std::get<WandererBrain>(e.brain);

    brain.anim_timer += 1;
    if (brain.anim_timer >= kWandererAnimTicks) {
        brain.anim_timer = 0;
        brain.anim_frame = (brain.anim_frame + 1) % 2;
    }

    brain.move_timer -= 1;
    if (brain.move_timer <= 0) {
        if (ctx.rng.chance(kWandererChaseChance)) {
            const Vec2 pc = player_center(ctx.player);
            const Vec2 c = enemy_center(e);
            const Vec2 d{pc.x - c.x, pc.y - c.y};
            if (length(d) > kDirEpsilon) brain.move_dir = normalize(d);
        } else {
            const float angle = ctx.rng.uniform(0.0f, kTwoPi);
            brain.move_dir = {std::cos(angle), std::sin(angle)};
        }
        brain.move_timer = ctx.rng.uniform_int(20, 60);
    }

    const Vec2 delta = scaled(brain.move_dir, e.speed);
    if (length(delta) <= kDirEpsilon) return;
    e.facing_right = brain.move_dir.x >= 0.0f;

    const MoveResult r = resolve_move(ctx.terrain, ctx.terrain.island(), e.pos, e.size, delta, slide_only());
    e.pos = r.pos;
    if (r.outcome == MoveOutcome::Stuck) {
        float angle = std::atan2(brain.move_dir.y, brain.move_dir.x);
        angle += ctx.rng.chance(0.5f) ? kPi * 0.5f : -kPi * 0.5f;
        brain.move_dir = {std::cos(angle), std::sin(angle)};
        brain.move_timer = ctx.rng.uniform_int(10, 30);
    }
}

void update_pursuer(Enemy& e, EnemyContext& ctx) {
    auto& brain = std::get<PursuerBrain>(e.brain);
    brain.slither_phase += kPursuerSlitherStep;

    const Vec2 pc = player_center(ctx.player);
    const Vec2 c = enemy_center(e);
    const Vec2 d{pc.x - c.x, pc.y - c.y};
    const float dist = length(d);

    if (dist > kDirEpsilon) {
        const Vec2 dir{d.x / dist, d.y / dist};
        const Vec2 perp{-dir.y, dir.x};
        const float slither = std::sin(brain.slither_phase) * kPursuerSlitherAmplitude;
        const Vec2 delta{dir.x * e.speed + perp.x * slither, dir.y * e.speed + perp.y * slither};
        e.facing_right = d.x >= 0.0f;

        const SlidePolicy policy = slide_and_deflect(scaled(perp, e.speed), scaled(perp, -e.speed));
        e.pos = resolve_move(ctx.terrain, ctx.terrain.island(), e.pos, e.size, delta, policy).pos;
    }

    std::copy_backward(brain.trail.begin(), brain.trail.end() - 1, brain.trail.end());
    brain.trail[0] = enemy_center(e);
}

void update_boss(Enemy& e, EnemyContext& ctx) {
    auto& brain = std::get<BossBrain>(e.brain);

    const Vec2 pc = player_center(ctx.player);
    const Vec2 c = enemy_center(e);
    const Vec2 d{pc.x - c.x, pc.y - c.y};
    const float dist = length(d);
    if (dist <= kDirEpsilon) {
        brain.blocked_ticks = 0;
        return;
    }

    const Vec2 dir{d.x / dist, d.y / dist};
    const Vec2 perp{-dir.y, dir.x};
    e.facing_right = d.x >= 0.0f;

    const SlidePolicy policy = slide_and_deflect(scaled(perp, e.speed), scaled(perp, -e.speed));
    const MoveResult r = resolve_move(ctx.terrain, ctx.terrain.island(), e.pos, e.size, scaled(dir, e.speed), policy);
    e.pos = r.pos;

    if (r.outcome == MoveOutcome::Clear) {
        brain.blocked_ticks = 0;
        return;
    }

    // The direct path is blocked, even if a slide or deflection got us moving.
    brain.blocked_ticks += 1;
    if (brain.blocked_ticks >= kBossStallTicks && r.blocking_index >= 0) {
        if (const auto anchor = ctx.terrain.destroy(r.blocking_index)) {
            EffectEvent ev{};
            ev.kind = EffectKind::ObstructionDestroyed;
            ev.pos = {anchor->x + kObstructionWidth * 0.5f, anchor->y + 8.0f};
            ctx.events.push_back(ev);
        }
        brain.blocked_ticks = 0;
    }
}

using BrainUpdate = void (*)(Enemy&, EnemyContext&);

// Indexed by EnemyKind.
constexpr std::array<BrainUpdate, 3> kBrainTable{
    update_wanderer,
    update_pursuer,
    update_boss,
};

} // namespace

Enemy make_enemy(EnemyKind kind, Vec2 pos, int wave) {
    Enemy e{};
    e.kind = kind;
    e.pos = pos;
    e.wave = std::max(1, wave);
    e.brain = brain_for(kind);

    switch (kind) {
    case EnemyKind::Wanderer:
        e.size = {kWandererSize, kWandererSize};
        e.speed = kWandererSpeed;
        e.damage = kWandererDamage;
        e.health = kWandererHealth;
        break;
    case EnemyKind::Pursuer: {
        e.size = {kPursuerSegmentSize + 2.0f, kPursuerSegmentSize + 2.0f};
        e.speed = kPursuerSpeed;
        e.damage = kPursuerDamage;
        e.health = kPursuerHealth;
        auto& brain = std::get<PursuerBrain>(e.brain);
        brain.trail.fill(enemy_center(e));
        break;
    }
    case EnemyKind::Boss: {
        const float levels_above = static_cast<float>(e.wave - 1);
        const float size_scale = 1.0f + levels_above * kBossSizeScalePerWave;
        const float speed_scale = 1.0f + levels_above * kBossSpeedScalePerWave;
        e.size = {kBossSize * size_scale, kBossSize * size_scale};
        e.speed = kBossSpeed * speed_scale;
        e.damage = kBossDamage;
        e.health = kBossHealth + (e.wave - 1);
        break;
    }
    }
    return e;
}

Rect enemy_rect(const Enemy& e) { return {e.pos.x, e.pos.y, e.size.x, e.size.y}; }

Vec2 enemy_center(const Enemy& e) { return rect_center(enemy_rect(e)); }

int enemy_score(EnemyKind kind) {
    switch (kind) {
    case EnemyKind::Wanderer:
        return 5;
    case EnemyKind::Pursuer:
        return 10;
    case EnemyKind::Boss:
        return 100;
    }
    return 0;
}

const char* enemy_name(EnemyKind kind) {
    switch (kind) {
    case EnemyKind::Wanderer:
        return "wanderer";
    case EnemyKind::Pursuer:
        return "pursuer";
    case EnemyKind::Boss:
        return "boss";
    }
    return "?";
}

void update_enemy(Enemy& e, EnemyContext& ctx) {
    if (!e.alive) return;
    e.damage_cooldown = std::max(0, e.damage_cooldown - 1);

    const auto slot = static_cast<size_t>(e.kind);
    if (e.brain.index() != slot) e.brain = brain_for(e.kind);
    kBrainTable[slot](e, ctx);

    if (!is_finite_vec(e.pos)) e.pos = {kMapWidth * 0.5f, kMapHeight * 0.5f};
    e.pos = ctx.terrain.clamp(e.pos, e.size);
}

} // namespace hs

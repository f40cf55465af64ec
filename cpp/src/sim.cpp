#include "hellsurvivor/sim.hpp"
#include "hellsurvivor/actors.hpp"
#include "hellsurvivor/combat.hpp"
#include "hellsurvivor/config.hpp"
#include "hellsurvivor/effects.hpp"
#include "hellsurvivor/enemies.hpp"
#include "hellsurvivor/observation.hpp"
#include "hellsurvivor/waves.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <variant>

namespace hs {
namespace {

constexpr uint64_t kFxSeedSalt = 0x9e3779b97f4a7c15ull;
constexpr int kEnemySpawnAttempts = 4;
constexpr float kStartingWeaponOffset = 60.0f;
constexpr float kFoodScatter = 30.0f;

int enemy_spawn_interval(int wave) {
    return std::max(kEnemySpawnIntervalFloorTicks, kEnemySpawnIntervalTicks - (wave - 1) * kEnemySpawnIntervalStepTicks);
}

void sanitize_position(Vec2& pos, Vec2 fallback, Vec2 size, const TerrainModel& terrain) {
    if (!is_finite_vec(pos)) {
        pos = fallback;
    }
    pos = terrain.clamp(pos, size);
}

} // namespace

Simulator::Simulator() {
    reset(0);
}

int Simulator::observation_dim() { return kObservationDim; }

std::vector<float> Simulator::reset(uint64_t seed) {
    rng_.reseed(seed);
    fx_rng_.reseed(seed ^ kFxSeedSalt);
    state_ = GameState{};
    state_.seed = seed;
    start_run();
    return build_observation(state_);
}

void Simulator::start_run() {
    const uint64_t seed = state_.seed;
    state_ = GameState{};
    state_.seed = seed;
    state_.terrain = TerrainModel::generate(rng_);
    update_view();
    place_starting_items();
    for (int i = 0; i < kInitialFood; ++i) spawn_food();
}

void Simulator::place_starting_items() {
    const Vec2 p = state_.player.pos;
    auto place = [this](ItemKind kind, Vec2 pos) {
        Item item = make_item(kind, pos, fx_rng_.uniform(0.0f, 6.28318530718f));
        item.pos = state_.terrain.clamp(item.pos, item.size);
        state_.items.push_back(item);
    };
    place(ItemKind::Sword, {p.x - kStartingWeaponOffset, p.y});
    place(ItemKind::Bow, {p.x + kStartingWeaponOffset, p.y});
    place(ItemKind::Bomb, {kIslandLeft + 20.0f, kIslandBottom - 30.0f});
}

void Simulator::spawn_enemy() {
    const int max_alive = kMaxEnemies + (state_.wave.wave - 1) * kMaxEnemiesPerWave;
    const auto alive = std::count_if(state_.enemies.begin(), state_.enemies.end(),
                                     [](const Enemy& e) { return e.alive && e.kind != EnemyKind::Boss; });
    if (alive >= max_alive) return;

    const Rect& v = state_.view;
    const int left = static_cast<int>(v.x - kSpawnZoneMargin);
    const int top = static_cast<int>(v.y - kSpawnZoneMargin);
    const int right = static_cast<int>(v.x + v.w + kSpawnZoneMargin);
    const int bottom = static_cast<int>(v.y + v.h + kSpawnZoneMargin);
    const int il = static_cast<int>(kIslandLeft);
    const int it = static_cast<int>(kIslandTop);
    const int ir = static_cast<int>(kIslandRight);
    const int ib = static_cast<int>(kIslandBottom);
    const int edge = static_cast<int>(kSpawnEdgeOffset);

    for (int attempt = 0; attempt < kEnemySpawnAttempts; ++attempt) {
        Vec2 pos{};
        const int side = rng_.uniform_int(0, 3);
        if (side == 0) {
            pos = {static_cast<float>(rng_.uniform_int(std::max(il, left), std::min(ir, right))),
                   static_cast<float>(std::max(it, top - edge))};
        } else if (side == 1) {
            pos = {static_cast<float>(rng_.uniform_int(std::max(il, left), std::min(ir, right))),
                   static_cast<float>(std::min(ib - edge, bottom + edge))};
        } else if (side == 2) {
            pos = {static_cast<float>(std::max(il, left - edge)),
                   static_cast<float>(rng_.uniform_int(std::max(it, top), std::min(ib, bottom)))};
        } else {
            pos = {static_cast<float>(std::min(ir - edge, right + edge)),
                   static_cast<float>(rng_.uniform_int(std::max(it, top), std::min(ib, bottom)))};
        }

        const EnemyKind kind = rng_.chance(kWandererSpawnChance) ? EnemyKind::Wanderer : EnemyKind::Pursuer;
        Enemy e = make_enemy(kind, pos);
        e.pos = state_.terrain.clamp(e.pos, e.size);
        if (kind == EnemyKind::Pursuer) {
            std::get<PursuerBrain>(e.brain).trail.fill(enemy_center(e));
        }
        if (state_.terrain.blocked(enemy_rect(e))) continue;
        state_.enemies.push_back(e);
        return;
    }
}

void Simulator::spawn_food() {
    const auto food = std::count_if(state_.items.begin(), state_.items.end(),
                                    [](const Item& i) { return is_food_item(i.kind); });
    if (food >= kMaxFood) return;

    Vec2 pos{};
    const auto& obstructions = state_.terrain.obstructions();
    if (!obstructions.empty()) {
        const Vec2 anchor = obstructions[static_cast<size_t>(rng_.uniform_int(0, static_cast<int>(obstructions.size()) - 1))].anchor;
        const int scatter = static_cast<int>(kFoodScatter);
        pos = {anchor.x + static_cast<float>(rng_.uniform_int(-scatter, scatter)),
               anchor.y + static_cast<float>(rng_.uniform_int(-scatter, scatter))};
    } else {
        pos = {static_cast<float>(rng_.uniform_int(static_cast<int>(kIslandLeft) + 20, static_cast<int>(kIslandRight) - 20)),
               static_cast<float>(rng_.uniform_int(static_cast<int>(kIslandTop) + 20, static_cast<int>(kIslandBottom) - 20))};
    }
    pos.x = std::clamp(pos.x, kIslandLeft + 10.0f, kIslandRight - 10.0f);
    pos.y = std::clamp(pos.y, kIslandTop + 10.0f, kIslandBottom - 10.0f);

    Item item = make_item(ItemKind::HealSmall, pos, fx_rng_.uniform(0.0f, 6.28318530718f));
    item.pos = state_.terrain.clamp(item.pos, item.size);
    state_.items.push_back(item);
}

void Simulator::apply_triggers(const Action& action) {
    auto& p = state_.player;

    if (action.dodge && begin_dodge(p)) {
        EffectEvent ev{};
        ev.kind = EffectKind::Dodge;
        ev.pos = player_center(p);
        state_.events.push_back(ev);
    }

    if (!action.attack) return;

    bool attacked = false;
    const Vec2 c = player_center(p);
    if (begin_shot(p)) {
        for (const auto& dir : arrow_directions(p)) {
            state_.projectiles.push_back(make_projectile(c, dir));
        }
        attacked = true;
    } else if (begin_throw(p)) {
        state_.explosives.push_back(make_explosive(c, facing_vector(p.facing), bomb_damage(p), bomb_radius(p)));
        attacked = true;
    } else if (begin_attack(p)) {
        attacked = true;
    }

    if (attacked) {
        EffectEvent ev{};
        ev.kind = EffectKind::Attack;
        ev.pos = c;
        state_.events.push_back(ev);
    }
}

void Simulator::update_view() {
    const Vec2 c = player_center(state_.player);
    state_.view.w = kViewWidth;
    state_.view.h = kViewHeight;
    state_.view.x = std::clamp(c.x - kViewWidth * 0.5f, 0.0f, kMapWidth - kViewWidth);
    state_.view.y = std::clamp(c.y - kViewHeight * 0.5f, 0.0f, kMapHeight - kViewHeight);
}

void Simulator::update_enemies() {
    EnemyContext ctx{state_.player, state_.terrain, rng_, state_.events};
    for (auto& e : state_.enemies) {
        update_enemy(e, ctx);
    }
}

void Simulator::update_projectiles() {
    const Rect map = map_rect();
    for (auto& arrow : state_.projectiles) {
        advance_projectile(arrow, map);
        if (!arrow.active) continue;
        resolve_projectile(state_, arrow, rng_);
    }
    state_.projectiles.erase(std::remove_if(state_.projectiles.begin(), state_.projectiles.end(),
                                            [](const Projectile& a) { return !a.active; }),
                             state_.projectiles.end());
    purge_dead_enemies(state_);
}

void Simulator::update_explosives() {
    for (auto& bomb : state_.explosives) {
        if (advance_explosive(bomb, state_.terrain.island())) {
            resolve_explosion(state_, bomb, rng_);
        }
    }
    // Detonated bombs leave the list only after their area damage resolved.
    state_.explosives.erase(std::remove_if(state_.explosives.begin(), state_.explosives.end(),
                                           [](const Explosive& b) { return b.exploded; }),
                            state_.explosives.end());
    purge_dead_enemies(state_);
}

void Simulator::run_spawn_timers() {
    state_.enemy_spawn_clock += 1;
    if (state_.enemy_spawn_clock >= enemy_spawn_interval(state_.wave.wave)) {
        spawn_enemy();
        state_.enemy_spawn_clock = 0;
    }

    state_.food_spawn_clock += 1;
    if (state_.food_spawn_clock >= kFoodSpawnIntervalTicks) {
        spawn_food();
        state_.food_spawn_clock = 0;
    }
}

void Simulator::check_game_over() {
    if (state_.player.health > 0 || game_over(state_)) return;
    state_.play_state = PlayState::GameOver;
    state_.final_tick = state_.tick;

    EffectEvent ev{};
    ev.kind = EffectKind::GameOver;
    ev.pos = player_center(state_.player);
    ev.value = state_.stats.score;
    state_.events.push_back(ev);
}

StepResult Simulator::step(const Action& action) {
    if (game_over(state_)) {
        state_.events.clear();
        if (action.restart) start_run();
        return make_result();
    }

    state_.events.clear();
    auto& p = state_.player;

    apply_triggers(action);
    apply_move_intent(p, action, state_.terrain);
    tick_player_timers(p);
    sanitize_position(p.pos, {kPlayerSpawnX, kPlayerSpawnY}, p.size, state_.terrain);
    update_view();

    update_enemies();
    update_projectiles();
    update_explosives();
    run_spawn_timers();
    advance_effects(state_);

    resolve_pickups(state_);
    resolve_contact_damage(state_);
    resolve_melee(state_, rng_);
    purge_dead_enemies(state_);

    check_wave_progression(state_, rng_);

    state_.message_timer = std::max(0, state_.message_timer - 1);
    check_game_over();

    for (const auto& ev : state_.events) {
        spawn_effect_particles(state_, ev, fx_rng_);
    }

    state_.tick += 1;

#ifndef NDEBUG
    assert(is_finite_vec(state_.player.pos));
    assert(state_.player.health >= 0 && state_.player.health <= state_.player.max_health);
    assert(!(state_.player.attacking && state_.player.dodging));
    for (const auto& e : state_.enemies) {
        assert(is_finite_vec(e.pos));
        assert(e.alive);
        assert(e.damage_cooldown >= 0);
    }
#endif

    return make_result();
}

StepResult Simulator::make_result() const {
    StepResult out{};
    out.observation = build_observation(state_);
    out.events = state_.events;
    out.terminated = game_over(state_);
    out.info.score = state_.stats.score;
    out.info.wave = state_.wave.wave;
    out.info.kills = state_.stats.total_kills;
    out.info.boss_kills = state_.stats.boss_kills;
    out.info.health = state_.player.health;
    out.info.level = state_.player.level;
    out.info.wave_active = state_.wave.active;
    out.info.enemies_alive = static_cast<int>(state_.enemies.size());
    out.info.scalars["time_alive_seconds"] = static_cast<float>(state_.tick) * kFixedDt;
    out.info.scalars["damage_taken"] = static_cast<float>(state_.stats.damage_taken);
    out.info.scalars["bosses_remaining"] = static_cast<float>(state_.wave.bosses_remaining);
    out.info.scalars["kills_since_wave"] = static_cast<float>(state_.wave.kills_since_wave);
    out.info.scalars["obstructions"] = static_cast<float>(state_.terrain.obstructions().size());
    return out;
}

} // namespace hs

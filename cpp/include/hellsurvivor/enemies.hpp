#pragma once

#include "rng.hpp"
#include "state.hpp"
#include "terrain.hpp"

#include <vector>

namespace hs {

struct EnemyContext {
    const Player& player;
    TerrainModel& terrain;
    DeterministicRng& rng;
    std::vector<EffectEvent>& events;
};

Enemy make_enemy(EnemyKind kind, Vec2 pos, int wave = 1);

Rect enemy_rect(const Enemy& e);
Vec2 enemy_center(const Enemy& e);
int enemy_score(EnemyKind kind);
const char* enemy_name(EnemyKind kind);

// Runs the kind-specific AI for one tick, including the contact cooldown.
void update_enemy(Enemy& e, EnemyContext& ctx);

} // namespace hs

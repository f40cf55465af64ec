#pragma once

#include "rng.hpp"
#include "state.hpp"

#include <cstdint>

namespace hs {

enum class DamageSource : uint8_t {
    Melee,
    Projectile,
    Explosive
};

// Damages a live enemy. The first hit that drops health to zero pays out
// score, experience and drops, and marks the enemy dead; dead enemies are
// ignored by every later hit until they are purged.
bool apply_enemy_damage(GameState& state, Enemy& enemy, int damage, DamageSource source, DeterministicRng& rng);

// Returns true if the projectile struck an enemy (it is then inactive).
bool resolve_projectile(GameState& state, Projectile& arrow, DeterministicRng& rng);

// Area damage for an explosive on its detonation tick. Returns enemies hit.
int resolve_explosion(GameState& state, const Explosive& bomb, DeterministicRng& rng);

// Sword swing; only lands on the first tick of the attack. Returns enemies hit.
int resolve_melee(GameState& state, DeterministicRng& rng);

// Enemy bodies touching the player. Returns hits that got through.
int resolve_contact_damage(GameState& state);

void resolve_pickups(GameState& state);

void purge_dead_enemies(GameState& state);

} // namespace hs

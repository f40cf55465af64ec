#pragma once

#include "rng.hpp"
#include "state.hpp"

#include <array>
#include <cstdint>

namespace hs {

enum class WavePhase : uint8_t {
    Waiting,
    Active
};

WavePhase wave_phase(const WaveState& wave);

// Candidate top-left boss positions, used round-robin.
std::array<Vec2, 8> boss_spawn_slots();

bool wave_should_trigger(const GameState& state);

// Spawns `wave` bosses and activates the wave. Returns the number spawned,
// zero if a wave is already active.
int spawn_wave_bosses(GameState& state, DeterministicRng& rng);

// Polled once per tick after combat.
bool check_wave_progression(GameState& state, DeterministicRng& rng);

// Books a boss death. Drops the wave's loot crate and advances the wave when
// this was the last boss. Returns true when the wave completed.
bool record_boss_kill(GameState& state, Vec2 drop_center);

} // namespace hs

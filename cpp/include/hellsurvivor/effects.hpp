#pragma once

#include "rng.hpp"
#include "state.hpp"

namespace hs {

// Cosmetic particles and floating score text for one effect event. Uses its
// own rng so that decoration never perturbs gameplay rolls.
void spawn_effect_particles(GameState& state, const EffectEvent& ev, DeterministicRng& rng);

// Ages particles and floating text and drops the expired ones.
void advance_effects(GameState& state);

} // namespace hs

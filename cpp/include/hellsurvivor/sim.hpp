#pragma once

#include "action.hpp"
#include "env_api.hpp"
#include "rng.hpp"
#include "state.hpp"

#include <cstdint>
#include <vector>

namespace hs {

class Simulator {
  public:
    Simulator();

    std::vector<float> reset(uint64_t seed);
    StepResult step(const Action& action);

    const GameState& state() const { return state_; }

    // Direct access for scripted scenarios and tests.
    GameState& mutable_state() { return state_; }

    static int observation_dim();
    static int action_dim() { return 5; }

  private:
    GameState state_{};
    DeterministicRng rng_{0};
    DeterministicRng fx_rng_{0};

    void start_run();
    void place_starting_items();
    void spawn_enemy();
    void spawn_food();
    void apply_triggers(const Action& action);
    void update_view();
    void update_enemies();
    void update_projectiles();
    void update_explosives();
    void run_spawn_timers();
    void check_game_over();
    StepResult make_result() const;
};

} // namespace hs
